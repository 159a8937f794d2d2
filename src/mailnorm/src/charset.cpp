#include "charset.hpp"

#include "utils.hpp"

#include <glib.h>

#include <scope_guard/scope_guard.hpp>

#include <algorithm>

namespace mailnorm::charset {

namespace {
bool is_utf8_name(std::string_view charset) {
    const auto lowered = utils::to_lower(charset);
    return lowered == "utf-8" || lowered == "utf8";
}
}  // namespace

std::optional<std::string> convert_to_utf8(std::string_view bytes, std::string_view charset) {
    if (charset.empty()) {
        return std::nullopt;
    }

    if (is_utf8_name(charset)) {
        if (!g_utf8_validate(bytes.data(), static_cast<gssize>(bytes.size()), nullptr)) {
            return std::nullopt;
        }
        return std::string{bytes};
    }

    if (bytes.empty()) {
        return std::string{};
    }

    const std::string charset_name{charset};
    gsize bytes_read = 0;
    gsize bytes_written = 0;
    GError* error = nullptr;
    gchar* converted = g_convert(bytes.data(), static_cast<gssize>(bytes.size()), "UTF-8",
                                 charset_name.c_str(), &bytes_read, &bytes_written, &error);
    if (!converted) {
        log_debug("g_convert from '{}' failed: {}", charset_name,
                  error && error->message ? error->message : "unknown error");
        if (error) {
            g_error_free(error);
        }
        return std::nullopt;
    }

    auto converted_guard = sg::make_scope_guard([converted] { g_free(converted); });

    if (bytes_read != bytes.size()) {
        log_debug("g_convert from '{}' stopped at {} of {} bytes", charset_name, bytes_read,
                  bytes.size());
        return std::nullopt;
    }

    return std::string(converted, bytes_written);
}

std::string lossy_utf8(std::string_view bytes) {
    gchar* valid = g_utf8_make_valid(bytes.data(), static_cast<gssize>(bytes.size()));
    if (!valid) {
        return {};
    }
    auto valid_guard = sg::make_scope_guard([valid] { g_free(valid); });
    return std::string{valid};
}

decoded_text_t decode_with_fallback(std::string_view bytes,
                                    const std::vector<std::string>& candidates) {
    std::vector<std::string> tried;
    for (auto& candidate : candidates) {
        if (candidate.empty()) {
            continue;
        }
        auto lowered = utils::to_lower(candidate);
        if (std::find(tried.begin(), tried.end(), lowered) != tried.end()) {
            continue;
        }
        tried.emplace_back(std::move(lowered));

        auto text_or_none = convert_to_utf8(bytes, candidate);
        if (text_or_none) {
            return decoded_text_t{.text = std::move(*text_or_none), .charset = candidate};
        }
    }

    log_warning("none of {} accepted {} bytes, decoding as lossy utf-8", tried, bytes.size());
    return decoded_text_t{.text = lossy_utf8(bytes), .charset = "UTF-8", .lossy = true};
}

const std::vector<std::string>& header_fallback_chain() {
    static const std::vector<std::string> chain{"UTF-8", "ISO-8859-1", "WINDOWS-1252"};
    return chain;
}

const std::vector<std::string>& content_fallback_chain() {
    static const std::vector<std::string> chain{"UTF-8", "ISO-8859-1"};
    return chain;
}

}  // namespace mailnorm::charset
