#include <mailnorm/log.hpp>

#include <string>

namespace {
log_level_t read_log_level_from_env() {
    if (const char* level_env = std::getenv("LOG")) {
        const std::string level_val = level_env;
        if (level_val == "debug") {
            return log_level_t::debug;
        } else if (level_val == "info") {
            return log_level_t::info;
        } else if (level_val == "warning") {
            return log_level_t::warning;
        } else if (level_val == "error") {
            return log_level_t::error;
        }
    } else if (std::getenv("DEBUG")) {
        return log_level_t::debug;
    }
    return log_level_t::info;
}
}  // namespace

log_level_t current_log_level() {
    static const log_level_t level = read_log_level_from_env();
    return level;
}
