#include "mail_directory.hpp"

#include "utils.hpp"

#include <algorithm>
#include <chrono>

namespace mailnorm::mail_directory {

namespace fs = std::filesystem;

std::vector<fs::path> list_message_files(const fs::path& folder) {
    std::vector<fs::path> result;

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        log_warning("mail folder '{}' does not exist", folder.string());
        return result;
    }

    fs::recursive_directory_iterator it{folder, fs::directory_options::skip_permission_denied, ec};
    if (ec) {
        log_warning("cannot list '{}': {}", folder.string(), ec);
        return result;
    }
    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            log_warning("error while listing '{}': {}", folder.string(), ec);
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (utils::iequals(it->path().extension().string(), ".msg")) {
            result.emplace_back(it->path());
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

types::EmailSummary make_placeholder_summary(const fs::path& path) {
    types::EmailSummary summary;
    summary.filename = path.filename().string();
    summary.subject = fmt::format("[Parse Error] {}", summary.filename);
    summary.sender = "Unknown";

    std::error_code ec;
    if (auto size = fs::file_size(path, ec); !ec) {
        summary.size = size;
    }

    auto mtime = fs::last_write_time(path, ec);
    if (!ec) {
        // file_clock and system_clock share no epoch; translate through "now".
        const auto sys_time = std::chrono::time_point_cast<std::chrono::seconds>(
            mtime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        summary.date = types::make_email_date(
            std::chrono::duration_cast<std::chrono::seconds>(sys_time.time_since_epoch()).count());
    }
    return summary;
}

std::vector<types::EmailSummary> summarize_directory(const email_parser_t& parser,
                                                     const fs::path& folder) {
    std::vector<types::EmailSummary> summaries;
    for (auto& path : list_message_files(folder)) {
        auto summary_or_err = parser.parse_summary(path);
        if (!summary_or_err) {
            log_warning("'{}' replaced by placeholder: {}", path.string(), summary_or_err.error());
            summaries.emplace_back(make_placeholder_summary(path));
            continue;
        }
        summaries.emplace_back(std::move(*summary_or_err));
    }
    log_info("summarized {} messages from '{}'", summaries.size(), folder.string());
    return summaries;
}

}  // namespace mailnorm::mail_directory
