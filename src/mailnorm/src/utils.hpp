#pragma once
#include <mailnorm/global.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace mailnorm::utils {

std::string replace_control_chars(const std::string& s);
std::string escape_ctrl(const std::string& s);
std::vector<std::string_view> split_views(std::string_view s, char delimiter);

std::string_view trim(std::string_view s);
std::string to_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);
bool contains_icase(std::string_view haystack, std::string_view needle);
std::string replace_all(std::string s, std::string_view from, std::string_view to);

std::string base64_naive_decode(std::string_view s);
// Single-line output, no trailing newline.
std::string base64_naive_encode(std::string_view s);

template <class StringOrStringView>
bool starts_with(const StringOrStringView& s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace mailnorm::utils
