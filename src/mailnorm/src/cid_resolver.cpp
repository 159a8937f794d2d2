#include "cid_resolver.hpp"

#include "content_decoder.hpp"
#include "mime_types.hpp"
#include "utils.hpp"

#include <regex>

namespace mailnorm::cid_resolver {

namespace {
// Repetitions stay bounded: the std::regex matcher recurses once per repeated character.
const std::regex& attribute_reference_regex() {
    static const std::regex re{R"(\b(src|href)\s{0,16}=\s{0,16}["']cid:([^"']{1,998})["'])",
                               std::regex::ECMAScript | std::regex::icase};
    return re;
}

const std::regex& css_reference_regex() {
    static const std::regex re{R"(url\(['"]cid:([^'"]{1,998})['"]\))",
                               std::regex::ECMAScript | std::regex::icase};
    return re;
}

// Replaces every match of `re` in `input` with whatever `replace` returns for it.
template <class ReplaceFn>
std::string replace_matches(const std::string& input, const std::regex& re, ReplaceFn replace) {
    std::string result;
    result.reserve(input.size());

    auto last = input.cbegin();
    for (std::sregex_iterator it{input.cbegin(), input.cend(), re}, end; it != end; ++it) {
        const auto& match = *it;
        result.append(last, match[0].first);
        result += replace(match);
        last = match[0].second;
    }
    result.append(last, input.cend());
    return result;
}

void add_entry(types::ContentIdMap& map,
               std::string_view content_id,
               std::string_view content_type,
               std::string_view payload) {
    auto normalized = normalize_content_id(content_id);
    if (normalized.empty() || payload.empty()) {
        return;
    }
    map.insert_or_assign(std::move(normalized), make_data_uri(content_type, payload));
}
}  // namespace

std::string normalize_content_id(std::string_view content_id) {
    auto s = utils::trim(content_id);
    while (!s.empty() && (s.front() == '<' || s.front() == '>')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == '<' || s.back() == '>')) {
        s.remove_suffix(1);
    }
    return std::string{s};
}

std::string make_data_uri(std::string_view content_type, std::string_view payload) {
    return fmt::format("data:{};base64,{}", content_type, utils::base64_naive_encode(payload));
}

types::ContentIdMap build_content_id_map(const mime::mime_message_t& message) {
    types::ContentIdMap map;
    for (auto& part : message.parts) {
        if (part.is_container || !part.content_id || part.encoded_content.empty()) {
            continue;
        }
        const auto payload =
            content_decoder::decode_transfer_encoding(part.encoded_content, part.transfer_encoding);
        const auto content_type = mime_types::resolve_content_type(
            part.content_type_declared ? std::optional<std::string>{part.content_type}
                                       : std::nullopt,
            part.filename);
        add_entry(map, *part.content_id, content_type, payload);
    }
    log_debug("content-id map has {} entries", map.size());
    return map;
}

types::ContentIdMap build_content_id_map(
    const std::vector<outlook::outlook_attachment_t>& attachments) {
    types::ContentIdMap map;
    for (auto& attachment : attachments) {
        if (!attachment.content_id || !attachment.data) {
            continue;
        }
        const auto& filename =
            attachment.long_filename ? attachment.long_filename : attachment.short_filename;
        const auto content_type = mime_types::resolve_content_type(attachment.mime_type, filename);
        add_entry(map, *attachment.content_id, content_type, *attachment.data);
    }
    log_debug("content-id map has {} entries", map.size());
    return map;
}

std::string inline_references(const std::string& html, const types::ContentIdMap& map) {
    if (html.empty() || map.empty()) {
        return html;
    }

    auto with_attributes = replace_matches(html, attribute_reference_regex(),
                                           [&map](const std::smatch& match) -> std::string {
                                               auto it = map.find(normalize_content_id(match.str(2)));
                                               if (it == map.end()) {
                                                   return match.str(0);
                                               }
                                               return fmt::format("{}=\"{}\"", match.str(1),
                                                                  it->second);
                                           });

    return replace_matches(with_attributes, css_reference_regex(),
                           [&map](const std::smatch& match) -> std::string {
                               auto it = map.find(normalize_content_id(match.str(1)));
                               if (it == map.end()) {
                                   return match.str(0);
                               }
                               return fmt::format("url('{}')", it->second);
                           });
}

}  // namespace mailnorm::cid_resolver
