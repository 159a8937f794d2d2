#include "outlook_message.hpp"

#include "charset.hpp"
#include "errors.hpp"
#include "mime_message.hpp"
#include "oxmsg_properties.hpp"
#include "utils.hpp"

#include <libolecf.h>

#include <algorithm>

namespace mailnorm::outlook {

namespace {

// MS-OXMSG stream and storage names.
constexpr std::string_view properties_stream = "__properties_version1.0";
constexpr std::string_view attachment_storage_prefix = "__attach_version1.0_#";

constexpr std::string_view pid_subject = "0037";
constexpr std::string_view pid_transport_headers = "007D";
constexpr std::string_view pid_sender_name = "0C1A";
constexpr std::string_view pid_sender_email = "0C1F";
constexpr std::string_view pid_display_bcc = "0E02";
constexpr std::string_view pid_display_cc = "0E03";
constexpr std::string_view pid_display_to = "0E04";
constexpr std::string_view pid_body = "1000";
constexpr std::string_view pid_html = "1013";
constexpr std::string_view pid_message_id = "1035";
constexpr std::string_view pid_attach_data = "3701";
constexpr std::string_view pid_attach_short_filename = "3704";
constexpr std::string_view pid_attach_long_filename = "3707";
constexpr std::string_view pid_attach_mime_tag = "370E";
constexpr std::string_view pid_attach_content_id = "3712";

struct olecf_error_holder_t {
    libolecf_error_t* ptr = nullptr;

    ~olecf_error_holder_t() {
        if (ptr) {
            libolecf_error_free(&ptr);
        }
    }

    std::string describe() const {
        if (!ptr) {
            return "no details";
        }
        char buf[160];
        buf[0] = '\0';
        libolecf_error_sprint(ptr, buf, sizeof(buf));
        return buf;
    }
};

struct olecf_file_del {
    void operator()(libolecf_file_t* x) const {
        libolecf_file_close(x, nullptr);
        libolecf_file_free(&x, nullptr);
    }
};
struct olecf_item_del {
    void operator()(libolecf_item_t* x) const { libolecf_item_free(&x, nullptr); }
};

using olecf_file_ptr = std::unique_ptr<libolecf_file_t, olecf_file_del>;
using olecf_item_ptr = std::unique_ptr<libolecf_item_t, olecf_item_del>;

std::error_code container_error() {
    return make_error_code(parse_errc::container_parse_failed);
}

// Looks up a direct child of `dir`. Empty pointer when it does not exist.
expected<olecf_item_ptr> find_sub_item(libolecf_item_t* dir, std::string_view name) {
    olecf_error_holder_t err;
    libolecf_item_t* raw_item = nullptr;
    const int ret = libolecf_item_get_sub_item_by_utf8_path(
        dir, reinterpret_cast<const uint8_t*>(name.data()), name.size(), &raw_item, &err.ptr);
    if (ret < 0) {
        log_debug("looking up '{}' failed: {}", name, err.describe());
        return unexpected(container_error());
    }
    return olecf_item_ptr{ret == 0 ? nullptr : raw_item};
}

expected<std::string> slurp_stream(libolecf_item_t* stream) {
    olecf_error_holder_t err;
    uint32_t strm_size = 0;
    if (libolecf_item_get_size(stream, &strm_size, &err.ptr) < 1) {
        log_debug("stream size unavailable: {}", err.describe());
        return unexpected(container_error());
    }

    std::string buf(strm_size, '\0');
    for (size_t ofs = 0; ofs < strm_size;) {
        const auto ret = libolecf_stream_read_buffer(
            stream, reinterpret_cast<uint8_t*>(&buf[ofs]), strm_size - ofs, &err.ptr);
        if (ret < 0) {
            log_debug("stream read failed: {}", err.describe());
            return unexpected(container_error());
        } else if (ret == 0) {
            buf.resize(ofs);
            break;
        }
        ofs += static_cast<size_t>(ret);
    }
    return buf;
}

expected<std::optional<std::string>> read_named_stream(libolecf_item_t* dir,
                                                       std::string_view name) {
    MAILNORM_TRY_ASSIGN(item, find_sub_item(dir, name), "find_sub_item");
    if (!item) {
        return std::nullopt;
    }
    MAILNORM_TRY_ASSIGN(bytes, slurp_stream(item.get()), "slurp_stream");
    return bytes;
}

std::string substg_name(std::string_view property_id, std::string_view type) {
    return fmt::format("__substg1.0_{}{}", property_id, type);
}

std::string strip_trailing_nuls(std::string s) {
    while (!s.empty() && s.back() == '\0') {
        s.pop_back();
    }
    return s;
}

// PT_UNICODE (001F) first, PT_STRING8 (001E) second.
expected<std::optional<std::string>> read_string_property(libolecf_item_t* dir,
                                                          std::string_view property_id) {
    MAILNORM_TRY_ASSIGN(unicode, read_named_stream(dir, substg_name(property_id, "001F")),
                        "read unicode property");
    if (unicode) {
        auto text = charset::convert_to_utf8(*unicode, "UTF-16LE");
        if (!text) {
            log_warning("property {} is not valid UTF-16", property_id);
            return unexpected(container_error());
        }
        return strip_trailing_nuls(std::move(*text));
    }

    MAILNORM_TRY_ASSIGN(narrow, read_named_stream(dir, substg_name(property_id, "001E")),
                        "read string8 property");
    if (narrow) {
        auto decoded = charset::decode_with_fallback(strip_trailing_nuls(std::move(*narrow)),
                                                     charset::content_fallback_chain());
        return std::move(decoded.text);
    }
    return std::nullopt;
}

expected<std::optional<std::string>> read_binary_property(libolecf_item_t* dir,
                                                          std::string_view property_id) {
    return read_named_stream(dir, substg_name(property_id, "0102"));
}

expected<std::string> item_name(libolecf_item_t* item) {
    olecf_error_holder_t err;
    size_t name_size = 0;
    if (libolecf_item_get_utf8_name_size(item, &name_size, &err.ptr) < 1) {
        log_debug("item name size unavailable: {}", err.describe());
        return unexpected(container_error());
    }
    std::string name(name_size, '\0');
    if (name_size > 0 && libolecf_item_get_utf8_name(item, reinterpret_cast<uint8_t*>(name.data()),
                                                     name_size, &err.ptr) < 1) {
        log_debug("item name unavailable: {}", err.describe());
        return unexpected(container_error());
    }
    return strip_trailing_nuls(std::move(name));
}

class olecf_message_t : public outlook_message_t {
   public:
    olecf_message_t(olecf_file_ptr file, olecf_item_ptr root)
        : m_file(std::move(file)), m_root(std::move(root)) {}

    expected<std::optional<std::string>> subject() const override {
        return read_string_property(m_root.get(), pid_subject);
    }
    expected<std::optional<std::string>> sender() const override {
        return read_string_property(m_root.get(), pid_sender_name);
    }
    expected<std::optional<std::string>> sender_email() const override {
        return read_string_property(m_root.get(), pid_sender_email);
    }
    expected<std::optional<std::string>> to() const override {
        return read_string_property(m_root.get(), pid_display_to);
    }
    expected<std::optional<std::string>> cc() const override {
        return read_string_property(m_root.get(), pid_display_cc);
    }
    expected<std::optional<std::string>> bcc() const override {
        return read_string_property(m_root.get(), pid_display_bcc);
    }
    expected<std::optional<std::string>> body() const override {
        return read_string_property(m_root.get(), pid_body);
    }

    expected<std::optional<std::string>> html_body() const override {
        // PR_HTML is usually binary in the message's code page.
        MAILNORM_TRY_ASSIGN(binary, read_binary_property(m_root.get(), pid_html), "read html");
        if (binary) {
            auto decoded = charset::decode_with_fallback(strip_trailing_nuls(std::move(*binary)),
                                                         charset::content_fallback_chain());
            return std::move(decoded.text);
        }
        return read_string_property(m_root.get(), pid_html);
    }

    expected<std::optional<types::EmailDate>> date() const override {
        MAILNORM_TRY_ASSIGN(properties, read_named_stream(m_root.get(), properties_stream),
                            "read properties stream");
        if (properties) {
            for (auto property_id : {pid_client_submit_time, pid_message_delivery_time}) {
                auto filetime = find_fixed_property(*properties, top_level_properties_header_size,
                                                    make_property_tag(property_id, pt_systime));
                if (!filetime) {
                    continue;
                }
                if (auto unix_time = filetime_to_unix(*filetime)) {
                    return types::make_email_date(*unix_time);
                }
            }
        }

        MAILNORM_TRY_ASSIGN(all_headers, headers(), "read transport headers");
        for (auto& [name, value] : all_headers) {
            if (utils::iequals(name, "Date")) {
                return mime::parse_internet_date(value);
            }
        }
        return std::nullopt;
    }

    expected<std::optional<std::string>> message_id() const override {
        return read_string_property(m_root.get(), pid_message_id);
    }

    expected<types::HeaderMap> headers() const override {
        MAILNORM_TRY_ASSIGN(transport_headers,
                            read_string_property(m_root.get(), pid_transport_headers),
                            "read transport headers");
        if (!transport_headers || utils::trim(*transport_headers).empty()) {
            return types::HeaderMap{};
        }
        // The header block is parsed as a body-less message.
        auto header_block = std::string{utils::trim(*transport_headers)} + "\r\n\r\n";
        auto parsed_or_err = mime::parse_message(header_block, mime::content_mode::skip);
        if (!parsed_or_err) {
            log_warning("transport headers could not be parsed: {}", parsed_or_err.error());
            return types::HeaderMap{};
        }
        return parsed_or_err->header_map();
    }

    expected<std::vector<outlook_attachment_t>> attachments() const override {
        MAILNORM_TRY_ASSIGN(storages, attachment_storages(), "attachment_storages");

        std::vector<outlook_attachment_t> result;
        for (auto& [name, storage] : storages) {
            outlook_attachment_t attachment;
            MAILNORM_TRY_ASSIGN(long_filename,
                                read_string_property(storage.get(), pid_attach_long_filename),
                                "read long filename");
            MAILNORM_TRY_ASSIGN(short_filename,
                                read_string_property(storage.get(), pid_attach_short_filename),
                                "read short filename");
            MAILNORM_TRY_ASSIGN(data, read_binary_property(storage.get(), pid_attach_data),
                                "read attachment data");
            MAILNORM_TRY_ASSIGN(mime_type,
                                read_string_property(storage.get(), pid_attach_mime_tag),
                                "read mime tag");
            MAILNORM_TRY_ASSIGN(content_id,
                                read_string_property(storage.get(), pid_attach_content_id),
                                "read content id");
            attachment.long_filename = std::move(long_filename);
            attachment.short_filename = std::move(short_filename);
            attachment.data = std::move(data);
            attachment.mime_type = std::move(mime_type);
            attachment.content_id = std::move(content_id);
            log_debug("attachment storage {}: {} bytes", name,
                      attachment.data ? attachment.data->size() : 0);
            result.emplace_back(std::move(attachment));
        }
        return result;
    }

    expected<size_t> attachment_count() const override {
        MAILNORM_TRY_ASSIGN(storages, attachment_storages(), "attachment_storages");
        return storages.size();
    }

   private:
    // `__attach_version1.0_#XXXXXXXX` storages in name order. Nothing below them is read.
    expected<std::vector<std::pair<std::string, olecf_item_ptr>>> attachment_storages() const {
        olecf_error_holder_t err;
        int sub_items_count = 0;
        if (libolecf_item_get_number_of_sub_items(m_root.get(), &sub_items_count, &err.ptr) < 1) {
            log_debug("sub item count unavailable: {}", err.describe());
            return unexpected(container_error());
        }

        std::vector<std::pair<std::string, olecf_item_ptr>> storages;
        for (int i = 0; i < sub_items_count; ++i) {
            libolecf_item_t* raw_item = nullptr;
            if (libolecf_item_get_sub_item(m_root.get(), i, &raw_item, &err.ptr) < 1) {
                log_debug("sub item {} unavailable: {}", i, err.describe());
                return unexpected(container_error());
            }
            olecf_item_ptr item{raw_item};
            MAILNORM_TRY_ASSIGN(name, item_name(item.get()), "item_name");
            if (utils::starts_with(name, attachment_storage_prefix)) {
                storages.emplace_back(std::move(name), std::move(item));
            }
        }
        std::sort(storages.begin(), storages.end(),
                  [](auto& a, auto& b) { return a.first < b.first; });
        return storages;
    }

    olecf_file_ptr m_file;
    olecf_item_ptr m_root;
};

class olecf_reader_t : public outlook_reader_t {
   public:
    expected<std::shared_ptr<outlook_message_t>> open(const std::filesystem::path& path) override {
        olecf_error_holder_t err;
        libolecf_file_t* raw_file = nullptr;
        if (libolecf_file_initialize(&raw_file, &err.ptr) < 1) {
            log_error("libolecf_file_initialize failed: {}", err.describe());
            return unexpected(container_error());
        }
        olecf_file_ptr file{raw_file};

        if (libolecf_file_open(file.get(), path.c_str(), LIBOLECF_OPEN_READ, &err.ptr) < 1) {
            log_debug("'{}' not recognized as a compound file: {}", path.string(),
                      err.describe());
            return unexpected(container_error());
        }

        libolecf_item_t* raw_root = nullptr;
        if (libolecf_file_get_root_item(file.get(), &raw_root, &err.ptr) < 1) {
            log_debug("'{}' has no root storage: {}", path.string(), err.describe());
            return unexpected(container_error());
        }
        olecf_item_ptr root{raw_root};

        MAILNORM_TRY_ASSIGN(properties, find_sub_item(root.get(), properties_stream),
                            "find properties stream");
        if (!properties) {
            log_debug("'{}' is a compound file but not an Outlook message", path.string());
            return unexpected(container_error());
        }

        return std::make_shared<olecf_message_t>(std::move(file), std::move(root));
    }
};

}  // namespace

std::shared_ptr<outlook_reader_t> make_olecf_reader() {
    return std::make_shared<olecf_reader_t>();
}

}  // namespace mailnorm::outlook
