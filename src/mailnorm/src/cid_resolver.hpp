#pragma once
#include <mailnorm/global.hpp>
#include <mailnorm/types.hpp>

#include "mime_message.hpp"
#include "outlook_message.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mailnorm::cid_resolver {

// Trims whitespace and strips surrounding angle brackets: " <logo@x> " -> "logo@x".
std::string normalize_content_id(std::string_view content_id);

// data:<content_type>;base64,<payload>
std::string make_data_uri(std::string_view content_type, std::string_view payload);

types::ContentIdMap build_content_id_map(const mime::mime_message_t& message);
types::ContentIdMap build_content_id_map(
    const std::vector<outlook::outlook_attachment_t>& attachments);

// Rewrites src="cid:X", href="cid:X" and url('cid:X') references found in `map`. Unknown
// references and all other markup are left untouched.
std::string inline_references(const std::string& html, const types::ContentIdMap& map);

}  // namespace mailnorm::cid_resolver
