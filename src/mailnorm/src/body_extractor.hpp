#pragma once
#include <mailnorm/global.hpp>

#include "mime_message.hpp"

#include <string>
#include <string_view>

namespace mailnorm::body_extractor {

struct message_bodies_t {
    std::string plain;
    std::string html;
};

// Trimmed content starts with '<' or contains "<html" in any case.
bool looks_like_html(std::string_view content);

// Decodes stray quoted-printable, drops &shy; and removes leftover encoding artifacts.
std::string clean_html_content(std::string html);

// Promotes a markup-looking plain body to html when no html body exists. plain is kept.
void promote_plain_to_html(message_bodies_t& bodies);

// First text/plain and first text/html part win. Single-part messages with an undeclared or
// non-text type are classified by looks_like_html().
message_bodies_t extract_bodies(const mime::mime_message_t& message);

}  // namespace mailnorm::body_extractor
