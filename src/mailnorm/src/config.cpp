#include "config.hpp"

#include "utils.hpp"

#include <charconv>
#include <cstdlib>

namespace mailnorm::config {

namespace {

std::optional<std::string> env_value(std::string_view name) {
    const char* value = std::getenv(std::string{name}.c_str());
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string{value};
}

std::optional<uint64_t> parse_size(std::string_view s) {
    s = utils::trim(s);
    uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return result;
}

}  // namespace

config_t load_from_env() {
    config_t cfg;

    if (auto folder = env_value(email_folder_env)) {
        cfg.email_folder = *folder;
    }

    if (auto size_s = env_value(max_attachment_size_env)) {
        if (auto size = parse_size(*size_s)) {
            cfg.max_attachment_size = *size;
        } else {
            log_warning("ignoring {}='{}': not a byte count, keeping {}", max_attachment_size_env,
                        *size_s, cfg.max_attachment_size);
        }
    }

    log_debug("config: email folder '{}', max attachment size {}", cfg.email_folder.string(),
              cfg.max_attachment_size);
    return cfg;
}

}  // namespace mailnorm::config
