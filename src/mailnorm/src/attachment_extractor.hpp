#pragma once
#include <mailnorm/global.hpp>
#include <mailnorm/types.hpp>

#include "mime_message.hpp"
#include "outlook_message.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mailnorm::attachment_extractor {

// Long (display) name wins over the short one; empty names count as missing.
std::optional<std::string> resolve_filename(const outlook::outlook_attachment_t& attachment);

std::vector<types::AttachmentMeta> list_attachments(
    const std::vector<outlook::outlook_attachment_t>& attachments);

// Parts with disposition "attachment" and a filename.
std::vector<types::AttachmentMeta> list_attachments(const mime::mime_message_t& message);

// Parts with disposition "attachment", named or not.
size_t count_attachments(const mime::mime_message_t& message);

// Exact filename match. Empty when nothing matches.
std::optional<std::string> find_attachment(
    const std::vector<outlook::outlook_attachment_t>& attachments,
    std::string_view name);
std::optional<std::string> find_attachment(const mime::mime_message_t& message,
                                           std::string_view name);

}  // namespace mailnorm::attachment_extractor
