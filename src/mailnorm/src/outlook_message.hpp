#pragma once
#include <mailnorm/global.hpp>
#include <mailnorm/types.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mailnorm::outlook {

struct outlook_attachment_t {
    std::optional<std::string> long_filename;
    std::optional<std::string> short_filename;
    // Raw attachment bytes, absent for attachments without a data stream (embedded messages,
    // OLE objects).
    std::optional<std::string> data;
    std::optional<std::string> mime_type;
    std::optional<std::string> content_id;
};

// Typed view of an Outlook structured-container message. Every accessor may fail; a failing
// accessor makes the whole container path fail.
class outlook_message_t {
   public:
    virtual ~outlook_message_t() = default;

    virtual expected<std::optional<std::string>> subject() const = 0;
    virtual expected<std::optional<std::string>> sender() const = 0;
    virtual expected<std::optional<std::string>> sender_email() const = 0;
    // Delimiter (';') joined display lists.
    virtual expected<std::optional<std::string>> to() const = 0;
    virtual expected<std::optional<std::string>> cc() const = 0;
    virtual expected<std::optional<std::string>> bcc() const = 0;
    virtual expected<std::optional<std::string>> body() const = 0;
    virtual expected<std::optional<std::string>> html_body() const = 0;
    // Submit time, delivery time, then the transport headers' Date field.
    virtual expected<std::optional<types::EmailDate>> date() const = 0;
    virtual expected<std::optional<std::string>> message_id() const = 0;
    virtual expected<types::HeaderMap> headers() const = 0;
    virtual expected<std::vector<outlook_attachment_t>> attachments() const = 0;
    // Number of attachments, without reading any of them.
    virtual expected<size_t> attachment_count() const = 0;
};

class outlook_reader_t {
   public:
    virtual ~outlook_reader_t() = default;

    virtual expected<std::shared_ptr<outlook_message_t>> open(
        const std::filesystem::path& path) = 0;
};

// Reader backed by libolecf (MS-OXMSG property streams).
std::shared_ptr<outlook_reader_t> make_olecf_reader();

}  // namespace mailnorm::outlook
