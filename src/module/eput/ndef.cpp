#include <eput/ndef.hpp>
#include <eput/scalar.hpp>

#include <utility>

using namespace eput;

PayloadPos RecordHeader::field_offset(Field field) const {
    PayloadPos result = static_size;

    if (field == Field::payload_length) {
        return result;
    }
    result += field_length(Field::payload_length);

    if (field == Field::id_length) {
        return result;
    }
    result += field_length(Field::id_length);

    if (field == Field::type) {
        return result;
    }
    result += type_length;

    if (field == Field::id) {
        return result;
    }
    result += id_length;

    // Field::payload
    return result;
}

PayloadPos RecordHeader::field_length(Field field) const {
    switch (field) {

    case Field::payload_length:
        return is_payload_length_1b ? 1 : 4;

    case Field::id_length:
        return has_id ? 1 : 0;

    case Field::type:
        return type_length;

    case Field::id:
        return id_length;

    case Field::payload:
        return payload_length;
    }

    std::unreachable();
}

namespace {

bool has_flag(uint8_t flags, RecordFlag flag) {
    return (flags & std::to_underlying(flag)) != 0;
}

/// Decodes the header of the record at the start of \p data, including the dynamic length fields
Result<RecordHeader> parse_header(std::span<const std::byte> data) {
    using Field = RecordHeader::Field;

    if (data.size() < RecordHeader::static_size) {
        return std::unexpected(Error::record_truncated);
    }

    const uint8_t flags = std::to_integer<uint8_t>(data[0]);

    RecordHeader header {
        .type_name_format = static_cast<TypeNameFormat>(flags & type_name_format_mask),
        .has_id = has_flag(flags, RecordFlag::id_length_present),
        .is_payload_length_1b = has_flag(flags, RecordFlag::short_record),
        .chunk_flag = has_flag(flags, RecordFlag::chunk),
        .message_end = has_flag(flags, RecordFlag::message_end),
        .message_begin = has_flag(flags, RecordFlag::message_begin),
        .type_length = std::to_integer<uint8_t>(data[1]),
    };

    // The length fields themselves have to fit before we can read them
    if (data.size() < header.field_offset(Field::type)) {
        return std::unexpected(Error::record_truncated);
    }

    const auto payload_length_field = data.subspan(header.field_offset(Field::payload_length));
    header.payload_length = header.is_payload_length_1b ? decode<uint8_t>(payload_length_field) : decode<uint32_t>(payload_length_field);

    if (header.has_id) {
        header.id_length = decode<uint8_t>(data.subspan(header.field_offset(Field::id_length)));
    }

    return header;
}

} // namespace

Result<ParsedRecord> eput::parse_record(std::span<const std::byte> buffer, PayloadPos offset) {
    using Field = RecordHeader::Field;

    if (offset > buffer.size()) {
        return std::unexpected(Error::record_truncated);
    }
    const auto data = buffer.subspan(offset);

    const auto header = parse_header(data);
    if (!header) {
        return std::unexpected(header.error());
    }

    // Compared in two steps - the payload length can be up to 4 GB and the sum could overflow
    const PayloadPos payload_offset = header->field_offset(Field::payload);
    if (payload_offset > data.size() || header->payload_length > data.size() - payload_offset) {
        return std::unexpected(Error::record_truncated);
    }

    Record record {
        .type_name_format = header->type_name_format,
        .type = header->field_span(Field::type).added_offset(offset),
        .id = std::nullopt,
        .payload = header->field_span(Field::payload).added_offset(offset),
        .message_begin = header->message_begin,
        .message_end = header->message_end,
        .chunk_flag = header->chunk_flag,
    };
    if (header->has_id) {
        record.id = header->field_span(Field::id).added_offset(offset);
    }

    return ParsedRecord {
        .record = record,
        .size = header->record_length(),
    };
}
