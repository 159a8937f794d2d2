#include "utils.hpp"

#include <b64/decode.h>
#include <b64/encode.h>

#include <algorithm>
#include <cctype>

namespace mailnorm::utils {

std::string replace_control_chars(const std::string& s) {
    std::string r;
    for (auto& c : s) {
        if (c == '\r') {
            r += "\\r";
        } else if (c == '\n') {
            r += "\\n";
        } else if (c == '\t') {
            r += "\\t";
        } else if (c == '\\') {
            r += "\\\\";
        } else if (c == '"') {
            r += "\\\"";
        } else {
            r += c;
        }
    }
    return r;
}

std::string escape_ctrl(const std::string& s) {
    return replace_control_chars(s);
}

std::vector<std::string_view> split_views(std::string_view s, char delimiter) {
    std::vector<std::string_view> r;
    bool in_word = false;
    size_t tok_start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == delimiter) {
            if (in_word) {
                in_word = false;
                r.emplace_back(&s[tok_start], i - tok_start);
            } else {
                // keep eating delimiters
            }
        } else {
            if (!in_word) {
                tok_start = i;
                in_word = true;
            }
        }
    }

    if (in_word) {
        r.emplace_back(&s[tok_start], s.length() - tok_start);
    }

    return r;
}

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string r{s};
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

bool contains_icase(std::string_view haystack, std::string_view needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return s;
    }
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string base64_naive_decode(std::string_view s) {
    std::string res(s.size() * 3 / 4 + 4, 0);
    base64::base64_decodestate state;
    base64::base64_init_decodestate(&state);
    const auto output_size =
        base64::base64_decode_block(s.data(), static_cast<int>(s.size()), res.data(), &state);
    res.resize(static_cast<size_t>(output_size));
    return res;
}

std::string base64_naive_encode(std::string_view s) {
    // libb64 breaks lines every 72 characters and terminates with a newline.
    std::string res(4 * ((s.size() + 2) / 3) + s.size() / 54 + 8, 0);
    base64::base64_encodestate state;
    base64::base64_init_encodestate(&state);
    auto output_size =
        base64::base64_encode_block(s.data(), static_cast<int>(s.size()), res.data(), &state);
    output_size += base64::base64_encode_blockend(res.data() + output_size, &state);
    res.resize(static_cast<size_t>(output_size));

    res.erase(std::remove_if(res.begin(), res.end(), [](char c) { return c == '\n' || c == '\r'; }),
              res.end());
    return res;
}

}  // namespace mailnorm::utils
