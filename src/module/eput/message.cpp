#include <eput/message.hpp>

#include <logging/log.hpp>

LOG_COMPONENT_DEF(EPut, logging::Severity::warning);

using namespace eput;

namespace {

Result<ParsedRecord> parse_application_record(std::span<const std::byte> buffer, PayloadPos offset, const MessageParams &params, const char *role) {
    auto result = parse_record(buffer, offset);
    if (!result) {
        log_debug(EPut, "%s record at %zu truncated", role, offset);
        return result;
    }

    if (!is_application_record(buffer, result->record, params)) {
        log_info(EPut, "%s record at %zu is not an ePut record", role, offset);
        return std::unexpected(Error::record_wrong_type);
    }

    return result;
}

/// Parses the message starting at \p offset, keeping the record views relative to \p buffer
Result<ApplicationMessage> parse_message_at(std::span<const std::byte> buffer, PayloadPos offset, const MessageParams &params) {
    const auto data = parse_application_record(buffer, offset, params, "data");
    if (!data) {
        return std::unexpected(data.error());
    }

    const auto metadata = parse_application_record(buffer, offset + data->size, params, "metadata");
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    return ApplicationMessage {
        .data = data->record,
        .metadata = metadata->record,
    };
}

} // namespace

bool eput::is_application_record(std::span<const std::byte> buffer, const Record &record, const MessageParams &params) {
    if (record.type_name_format != TypeNameFormat::absolute_uri) {
        return false;
    }

    const auto type = record.type.in(buffer);
    const std::string_view type_str { reinterpret_cast<const char *>(type.data()), type.size() };
    return type_str.starts_with(params.type_scheme);
}

Result<ApplicationMessage> eput::parse_application_message(std::span<const std::byte> buffer, const MessageParams &params) {
    return parse_message_at(buffer, 0, params);
}

Result<TagMessage> eput::parse_tag_memory(std::span<const std::byte> memory, const MessageParams &params) {
    const auto message = find_first_tlv(memory, params.message_tlv);
    if (!message || message->is_empty() || !PayloadSpan { .offset = 0, .size = memory.size() }.contains(*message)) {
        log_debug(EPut, "no NDEF TLV in %zu bytes of tag memory", memory.size());
        return std::unexpected(Error::no_message_tlv);
    }

    // Cut the memory at the TLV end so that the records can't reach past it
    const auto records = parse_message_at(memory.first(message->end()), message->offset, params);
    if (!records) {
        return std::unexpected(records.error());
    }

    return TagMessage {
        .message = *message,
        .records = *records,
    };
}

Result<std::span<const std::byte>> eput::data_payload(std::span<const std::byte> buffer, const ApplicationMessage &message, PayloadPos expected_size) {
    if (message.data.payload.size != expected_size) {
        log_info(EPut, "data payload has %zu bytes, expected %zu", message.data.payload.size, expected_size);
        return std::unexpected(Error::data_wrong_length);
    }

    return message.data.payload.in(buffer);
}
