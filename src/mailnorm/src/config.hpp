#pragma once
#include <mailnorm/global.hpp>

#include <cstdint>
#include <filesystem>

namespace mailnorm::config {

inline constexpr std::string_view email_folder_env = "MAILNORM_EMAIL_FOLDER";
inline constexpr std::string_view max_attachment_size_env = "MAILNORM_MAX_ATTACHMENT_SIZE";

struct config_t {
    std::filesystem::path email_folder = "./emails";
    // Attachments above this size are not extracted by the command-line tool.
    uint64_t max_attachment_size = 100 * 1024 * 1024;
};

// Defaults overridden by environment. Malformed values are reported and ignored.
config_t load_from_env();

}  // namespace mailnorm::config
