#include "mime_types.hpp"

#include "utils.hpp"

#include <map>

namespace mailnorm::mime_types {

namespace {
const std::map<std::string, std::string, std::less<>>& extension_table() {
    static const std::map<std::string, std::string, std::less<>> table{
        {"7z", "application/x-7z-compressed"},
        {"bmp", "image/bmp"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"eml", "message/rfc822"},
        {"gif", "image/gif"},
        {"gz", "application/gzip"},
        {"htm", "text/html"},
        {"html", "text/html"},
        {"ico", "image/vnd.microsoft.icon"},
        {"ics", "text/calendar"},
        {"jpe", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"jpg", "image/jpeg"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
        {"msg", "application/vnd.ms-outlook"},
        {"odt", "application/vnd.oasis.opendocument.text"},
        {"pdf", "application/pdf"},
        {"png", "image/png"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"rar", "application/vnd.rar"},
        {"rtf", "application/rtf"},
        {"svg", "image/svg+xml"},
        {"tar", "application/x-tar"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"txt", "text/plain"},
        {"vcf", "text/vcard"},
        {"wav", "audio/x-wav"},
        {"webp", "image/webp"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"xml", "text/xml"},
        {"zip", "application/zip"},
    };
    return table;
}
}  // namespace

std::optional<std::string> guess_from_filename(std::string_view filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == filename.size()) {
        return std::nullopt;
    }
    const auto extension = utils::to_lower(filename.substr(dot + 1));

    const auto& table = extension_table();
    auto it = table.find(extension);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string resolve_content_type(const std::optional<std::string>& declared,
                                 const std::optional<std::string>& filename) {
    if (declared && !utils::trim(*declared).empty()) {
        return utils::to_lower(utils::trim(*declared));
    }
    if (filename) {
        if (auto guessed = guess_from_filename(*filename)) {
            return *guessed;
        }
    }
    return std::string{default_content_type};
}

}  // namespace mailnorm::mime_types
