#include "body_extractor.hpp"

#include "charset.hpp"
#include "content_decoder.hpp"
#include "utils.hpp"

#include <array>

namespace mailnorm::body_extractor {

namespace {
bool has_stray_quoted_printable(std::string_view html) {
    static constexpr std::array<std::string_view, 4> markers{"=20", "=3D", "=0D", "=0A"};
    if (html.find('=') == std::string_view::npos) {
        return false;
    }
    for (auto marker : markers) {
        if (html.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

std::string decode_part(const mime::mime_part_t& part) {
    return content_decoder::decode_content(part.encoded_content, part.transfer_encoding,
                                           part.charset);
}
}  // namespace

bool looks_like_html(std::string_view content) {
    const auto trimmed = utils::trim(content);
    return utils::starts_with(trimmed, "<") || utils::contains_icase(trimmed, "<html");
}

std::string clean_html_content(std::string html) {
    if (html.empty()) {
        return html;
    }

    if (has_stray_quoted_printable(html)) {
        const auto bytes = content_decoder::decode_quoted_printable(html);
        html = charset::decode_with_fallback(bytes, charset::content_fallback_chain()).text;
    }

    html = utils::replace_all(std::move(html), "&shy;", "");
    return content_decoder::clean_encoded_artifacts(std::move(html));
}

void promote_plain_to_html(message_bodies_t& bodies) {
    if (bodies.html.empty() && !bodies.plain.empty() && looks_like_html(bodies.plain)) {
        log_debug("promoting markup-looking plain body to html");
        bodies.html = clean_html_content(std::string{utils::trim(bodies.plain)});
    }
}

message_bodies_t extract_bodies(const mime::mime_message_t& message) {
    message_bodies_t bodies;

    // A top-level message/rfc822 body is walked like a multipart one.
    const bool enclosed_message = !message.parts.empty() && message.parts.front().is_container;
    if (message.is_multipart || enclosed_message) {
        bool plain_found = false;
        bool html_found = false;
        for (auto& part : message.parts) {
            if (part.is_container || part.encoded_content.empty()) {
                continue;
            }
            if (!plain_found && part.content_type == "text/plain") {
                bodies.plain = decode_part(part);
                plain_found = true;
            } else if (!html_found && part.content_type == "text/html") {
                bodies.html = clean_html_content(decode_part(part));
                html_found = true;
            }
            if (plain_found && html_found) {
                break;
            }
        }
    } else if (!message.parts.empty() && !message.parts.front().encoded_content.empty()) {
        auto& part = message.parts.front();
        auto content = decode_part(part);
        if (part.content_type_declared && part.content_type == "text/plain") {
            bodies.plain = std::move(content);
        } else if (part.content_type_declared && part.content_type == "text/html") {
            bodies.html = clean_html_content(std::move(content));
        } else if (looks_like_html(content)) {
            bodies.html = clean_html_content(std::move(content));
        } else {
            bodies.plain = std::move(content);
        }
    }

    promote_plain_to_html(bodies);
    return bodies;
}

}  // namespace mailnorm::body_extractor
