#pragma once
#include <mailnorm/global.hpp>
#include <mailnorm/types.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mailnorm::mime {

// One node of the MIME tree, copied out of GMime so that nothing outlives the parser.
struct mime_part_t {
    // Lowercase "type/subtype"; text/plain when the part does not declare one.
    std::string content_type;
    bool content_type_declared = false;
    std::string charset;
    // Lowercase Content-Transfer-Encoding, empty when absent.
    std::string transfer_encoding;
    // Lowercase Content-Disposition value ("attachment", "inline"), empty when absent.
    std::string disposition;
    std::optional<std::string> filename;
    // Content-ID header value as written (may carry angle brackets).
    std::optional<std::string> content_id;
    // Payload exactly as stored in the message, still transfer-encoded. Empty for containers
    // and when content was not loaded.
    std::string encoded_content;
    // multipart/* and message/rfc822 nodes.
    bool is_container = false;
    int depth = 0;
};

struct mime_message_t {
    // Top-level headers in message order, values unfolded but not decoded.
    std::vector<std::pair<std::string, std::string>> headers;
    bool is_multipart = false;
    // Depth-first walk of the body tree; parts[0] is the top-level body.
    std::vector<mime_part_t> parts;

    // First header with `name` (case-insensitive).
    std::optional<std::string> header(std::string_view name) const;

    // Later duplicates replace earlier ones.
    types::HeaderMap header_map() const;
};

enum class content_mode {
    load,
    // Structure and headers only, for summaries.
    skip,
};

expected<mime_message_t> parse_message(std::string_view message_data,
                                       content_mode mode = content_mode::load);

// Internet date (RFC 5322 date-time, with the usual obsolete forms) to UTC.
std::optional<types::EmailDate> parse_internet_date(std::string_view date_value);

}  // namespace mailnorm::mime
