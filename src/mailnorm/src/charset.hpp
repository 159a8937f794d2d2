#pragma once
#include <mailnorm/global.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mailnorm::charset {

// Result of running a decode chain. `charset` names the strategy that succeeded; `lossy` is set
// when none of the candidates accepted the input and invalid sequences were replaced.
struct decoded_text_t {
    std::string text;
    std::string charset;
    bool lossy = false;
};

// Strict conversion of `bytes` from `charset` to UTF-8. Empty when the charset is unknown or the
// input is not valid in it.
std::optional<std::string> convert_to_utf8(std::string_view bytes, std::string_view charset);

// UTF-8 with U+FFFD in place of every invalid sequence. Never fails.
std::string lossy_utf8(std::string_view bytes);

// Tries `candidates` in order (empty names and repeats are skipped) and falls back to lossy
// UTF-8 when all of them reject the input.
decoded_text_t decode_with_fallback(std::string_view bytes,
                                    const std::vector<std::string>& candidates);

// Chains used for header text and for body content.
const std::vector<std::string>& header_fallback_chain();
const std::vector<std::string>& content_fallback_chain();

}  // namespace mailnorm::charset
