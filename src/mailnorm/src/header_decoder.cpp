#include "header_decoder.hpp"

#include "charset.hpp"
#include "utils.hpp"

#include <cctype>

namespace mailnorm::header_decoder {

namespace {

struct header_token_t {
    std::string bytes;
    // Declared charset of an encoded-word, empty for plain text.
    std::string charset;
    bool encoded = false;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string decode_q_text(std::string_view text) {
    std::string r;
    r.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '_') {
            r += ' ';
        } else if (c == '=' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 &&
                   hex_value(text[i + 2]) >= 0) {
            r += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
            i += 2;
        } else {
            r += c;
        }
    }
    return r;
}

// Parses the encoded-word starting at `start` (which points at "=?"). On success returns the
// token and sets `end` past the closing "?=".
std::optional<header_token_t> parse_encoded_word(std::string_view s, size_t start, size_t& end) {
    const size_t charset_begin = start + 2;
    const size_t charset_end = s.find('?', charset_begin);
    if (charset_end == std::string_view::npos || charset_end == charset_begin) {
        return std::nullopt;
    }
    if (charset_end + 2 >= s.size() || s[charset_end + 2] != '?') {
        return std::nullopt;
    }
    const char encoding = static_cast<char>(std::toupper(static_cast<unsigned char>(s[charset_end + 1])));
    if (encoding != 'Q' && encoding != 'B') {
        return std::nullopt;
    }
    const size_t text_begin = charset_end + 3;
    const size_t text_end = s.find("?=", text_begin);
    if (text_end == std::string_view::npos) {
        return std::nullopt;
    }

    auto charset = s.substr(charset_begin, charset_end - charset_begin);
    // RFC 2231 language suffix: charset*lang
    if (auto star = charset.find('*'); star != std::string_view::npos) {
        charset = charset.substr(0, star);
    }

    const auto text = s.substr(text_begin, text_end - text_begin);

    header_token_t token;
    token.encoded = true;
    token.charset = std::string{charset};
    token.bytes = encoding == 'B' ? utils::base64_naive_decode(text) : decode_q_text(text);

    end = text_end + 2;
    return token;
}

std::vector<header_token_t> tokenize(std::string_view s) {
    std::vector<header_token_t> tokens;
    std::string literal;
    bool last_was_encoded = false;

    size_t pos = 0;
    while (pos < s.size()) {
        const size_t start = s.find("=?", pos);
        if (start == std::string_view::npos) {
            literal.append(s.substr(pos));
            break;
        }

        size_t end = 0;
        auto token = parse_encoded_word(s, start, end);
        if (!token) {
            literal.append(s.substr(pos, start + 2 - pos));
            pos = start + 2;
            continue;
        }

        literal.append(s.substr(pos, start - pos));
        // Whitespace between two adjacent encoded-words is not displayed.
        const bool drop_literal = last_was_encoded && utils::trim(literal).empty();
        if (!literal.empty() && !drop_literal) {
            tokens.push_back(header_token_t{.bytes = std::move(literal)});
        }
        literal.clear();

        tokens.emplace_back(std::move(*token));
        last_was_encoded = true;
        pos = end;
    }

    if (!literal.empty()) {
        tokens.push_back(header_token_t{.bytes = std::move(literal)});
    }

    return tokens;
}

// Adjacent encoded-words in the same charset may split a multibyte sequence, so they are joined
// before decoding.
std::vector<header_token_t> merge_adjacent(std::vector<header_token_t> tokens) {
    std::vector<header_token_t> merged;
    for (auto& token : tokens) {
        if (!merged.empty() && token.encoded && merged.back().encoded &&
            utils::iequals(merged.back().charset, token.charset)) {
            merged.back().bytes += token.bytes;
        } else {
            merged.emplace_back(std::move(token));
        }
    }
    return merged;
}

}  // namespace

std::string decode_header(std::string_view raw_header_value) {
    if (raw_header_value.empty()) {
        return {};
    }

    std::string result;
    for (auto& token : merge_adjacent(tokenize(raw_header_value))) {
        std::vector<std::string> candidates;
        if (token.encoded && !token.charset.empty()) {
            candidates.emplace_back(token.charset);
        }
        const auto& chain = charset::header_fallback_chain();
        candidates.insert(candidates.end(), chain.begin(), chain.end());

        auto decoded = charset::decode_with_fallback(token.bytes, candidates);
        if (decoded.lossy) {
            log_warning("header span decoded lossily: '{}'",
                        utils::escape_ctrl(std::string{raw_header_value}));
        }
        result += decoded.text;
    }
    return result;
}

}  // namespace mailnorm::header_decoder
