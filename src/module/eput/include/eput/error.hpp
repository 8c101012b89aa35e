#pragma once

#include <expected>
#include <cstdint>
#include <utility>

namespace eput {

/// Common error type for the record parsing functions
// Do not change values - generated parsers compare status codes against them
enum class Error : int8_t {
    /// The tag memory doesn't contain a usable NDEF TLV
    /// (not present, behind a terminator, reserved length or running past the buffer)
    no_message_tlv = -10,

    /// Record header declares more bytes than the buffer holds
    record_truncated = -20,

    /// The record is not an absolute URI record with the application type scheme
    record_wrong_type = -21,

    /// The data record payload size doesn't match the schema
    data_wrong_length = -30,
};

template <typename T>
using Result = std::expected<T, Error>;

/// Status code of a successful operation, for C-style callers
constexpr int status_success = 0;

/// \returns status code compatible with the generated C parsers (0 or a negative Error value)
template <typename T>
constexpr int status_code(const Result<T> &result) {
    return result.has_value() ? status_success : static_cast<int>(std::to_underlying(result.error()));
}

} // namespace eput
