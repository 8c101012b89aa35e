#pragma once

#include "error.hpp"
#include "util_defines.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace eput {

enum class TypeNameFormat : uint8_t {
    empty = 0,
    well_known = 1,
    mime_media_type = 2,
    absolute_uri = 3,
    external = 4,
    unknown = 5,
    unchanged = 6,
    reserved = 7,
};

/// Bits of the first byte of the NDEF record header
enum class RecordFlag : uint8_t {
    /// Denotes whether ID and ID length fields are present
    id_length_present = 1 << 3,

    /// Set -> payload length is 1B, otherwise 4B
    short_record = 1 << 4,

    chunk = 1 << 5,
    message_end = 1 << 6,
    message_begin = 1 << 7,
};

constexpr uint8_t type_name_format_mask = 0x07;

/// Decoded NDEF record header.
/// The header has dynamic size, offsets are relative to the record start.
struct RecordHeader {

public:
    enum class Field : uint8_t {
        payload_length,
        id_length,
        type,
        id,
        payload
    };

    /// Flags byte + type length byte
    static constexpr PayloadPos static_size = 2;

public:
    TypeNameFormat type_name_format = TypeNameFormat::empty;

    bool has_id : 1 = false;
    bool is_payload_length_1b : 1 = false;
    bool chunk_flag : 1 = false;
    bool message_end : 1 = false;
    bool message_begin : 1 = false;

    uint8_t type_length = 0;
    uint8_t id_length = 0;
    uint32_t payload_length = 0;

public:
    /// \returns offset of the field relative to the record start
    PayloadPos field_offset(Field field) const;

    PayloadPos field_length(Field field) const;

    /// \returns span of the field relative to the record start
    PayloadSpan field_span(Field field) const {
        return PayloadSpan { .offset = field_offset(field), .size = field_length(field) };
    }

    /// \returns total record length, including the payload
    PayloadPos record_length() const {
        return field_span(Field::payload).end();
    }
};

/// NDEF record with non-owning views into the parsed buffer
struct Record {
    TypeNameFormat type_name_format = TypeNameFormat::empty;

    PayloadSpan type;

    /// Engaged if the record has the ID length field (the ID can still be empty)
    std::optional<PayloadSpan> id;

    PayloadSpan payload;

    bool message_begin = false;
    bool message_end = false;
    bool chunk_flag = false;
};

struct ParsedRecord {
    Record record;

    /// Number of bytes the record takes, the next record starts right after
    PayloadPos size;
};

/**
 * Parses the NDEF record starting at @p offset of @p buffer.
 *
 * Record views are relative to the start of @p buffer, so they stay valid for
 * the whole buffer, not just the record.
 *
 * @return the record and its size or Error::record_truncated if the buffer can't hold the record
 */
[[nodiscard]] Result<ParsedRecord> parse_record(std::span<const std::byte> buffer, PayloadPos offset = 0);

} // namespace eput
