#pragma once

#include "error.hpp"
#include "ndef.hpp"
#include "tlv.hpp"
#include "util_defines.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

namespace eput {

/// Every ePut record type is an URI starting with this
inline constexpr std::string_view default_type_scheme = "https://pma.inftech.hs-mannheim.de/eput";

struct MessageParams {
    /// Prefix required on the type of both the data and the metadata record
    std::string_view type_scheme = default_type_scheme;

    /// TLV carrying the NDEF message in the tag memory
    uint8_t message_tlv = std::to_underlying(TLVTag::ndef);
};

/// The two records of an ePut NDEF message.
/// Record views are relative to the buffer the message was parsed from.
struct ApplicationMessage {
    Record data;
    Record metadata;
};

struct TagMessage {
    /// Value of the NDEF TLV, relative to the tag memory start
    PayloadSpan message;

    ApplicationMessage records;
};

/// \returns whether \p record (parsed from \p buffer) is an absolute URI record with the ePut type scheme
[[nodiscard]] bool is_application_record(std::span<const std::byte> buffer, const Record &record, const MessageParams &params = {});

/**
 * Parses an ePut NDEF message: the data record followed by the metadata record.
 *
 * The metadata record is not parsed if the data record fails.
 *
 * @return both records, Error::record_truncated or Error::record_wrong_type
 */
[[nodiscard]] Result<ApplicationMessage> parse_application_message(std::span<const std::byte> buffer, const MessageParams &params = {});

/**
 * Locates the NDEF TLV in the raw tag @p memory and parses the ePut message inside it.
 *
 * Records must not extend past the TLV value.
 *
 * @return the message with record views relative to @p memory, or Error::no_message_tlv
 *         if the TLV is missing, empty or runs past the memory end
 */
[[nodiscard]] Result<TagMessage> parse_tag_memory(std::span<const std::byte> memory, const MessageParams &params = {});

/// \returns payload of the data record if it has \p expected_size bytes (fixed by the device schema), otherwise Error::data_wrong_length
[[nodiscard]] Result<std::span<const std::byte>> data_payload(std::span<const std::byte> buffer, const ApplicationMessage &message, PayloadPos expected_size);

} // namespace eput
