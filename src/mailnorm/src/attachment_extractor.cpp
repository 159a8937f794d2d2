#include "attachment_extractor.hpp"

#include "content_decoder.hpp"
#include "mime_types.hpp"
#include "utils.hpp"

namespace mailnorm::attachment_extractor {

namespace {
bool is_attachment(const mime::mime_part_t& part) {
    return !part.is_container && part.disposition == "attachment";
}

std::optional<std::string> declared_type(const mime::mime_part_t& part) {
    if (!part.content_type_declared) {
        return std::nullopt;
    }
    return part.content_type;
}
}  // namespace

std::optional<std::string> resolve_filename(const outlook::outlook_attachment_t& attachment) {
    if (attachment.long_filename && !attachment.long_filename->empty()) {
        return attachment.long_filename;
    }
    if (attachment.short_filename && !attachment.short_filename->empty()) {
        return attachment.short_filename;
    }
    return std::nullopt;
}

std::vector<types::AttachmentMeta> list_attachments(
    const std::vector<outlook::outlook_attachment_t>& attachments) {
    std::vector<types::AttachmentMeta> result;
    result.reserve(attachments.size());
    for (auto& attachment : attachments) {
        auto filename = resolve_filename(attachment);
        types::AttachmentMeta meta;
        meta.content_type = mime_types::resolve_content_type(attachment.mime_type, filename);
        meta.size = attachment.data ? attachment.data->size() : 0;
        meta.content_id = attachment.content_id;
        meta.filename = std::move(filename);
        result.emplace_back(std::move(meta));
    }
    return result;
}

std::vector<types::AttachmentMeta> list_attachments(const mime::mime_message_t& message) {
    std::vector<types::AttachmentMeta> result;
    for (auto& part : message.parts) {
        if (!is_attachment(part) || !part.filename) {
            continue;
        }
        types::AttachmentMeta meta;
        meta.filename = part.filename;
        meta.size = content_decoder::decode_transfer_encoding(part.encoded_content,
                                                              part.transfer_encoding)
                        .size();
        meta.content_type = mime_types::resolve_content_type(declared_type(part), part.filename);
        meta.content_id = part.content_id;
        result.emplace_back(std::move(meta));
    }
    return result;
}

size_t count_attachments(const mime::mime_message_t& message) {
    size_t count = 0;
    for (auto& part : message.parts) {
        if (is_attachment(part)) {
            ++count;
        }
    }
    return count;
}

std::optional<std::string> find_attachment(
    const std::vector<outlook::outlook_attachment_t>& attachments,
    std::string_view name) {
    for (auto& attachment : attachments) {
        auto filename = resolve_filename(attachment);
        if (filename && *filename == name) {
            // A matching name without a data stream still yields bytes, just none of them.
            return attachment.data.value_or(std::string{});
        }
    }
    log_info("attachment '{}' not found in container", name);
    return std::nullopt;
}

std::optional<std::string> find_attachment(const mime::mime_message_t& message,
                                           std::string_view name) {
    for (auto& part : message.parts) {
        if (is_attachment(part) && part.filename && *part.filename == name) {
            return content_decoder::decode_transfer_encoding(part.encoded_content,
                                                             part.transfer_encoding);
        }
    }
    log_info("attachment '{}' not found in message", name);
    return std::nullopt;
}

}  // namespace mailnorm::attachment_extractor
