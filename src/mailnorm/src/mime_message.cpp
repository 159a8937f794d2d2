#include "mime_message.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <gmime/gmime.h>

#include <scope_guard/scope_guard.hpp>

namespace mailnorm::mime {

namespace {

std::string unfold_header_value(std::string_view raw) {
    std::string r;
    r.reserve(raw.size());
    for (char c : raw) {
        if (c != '\r' && c != '\n') {
            r += c;
        }
    }
    return std::string{utils::trim(r)};
}

std::optional<std::string> object_header(GMimeObject* object, const char* name) {
    const char* value = g_mime_object_get_header(object, name);
    if (!value) {
        return std::nullopt;
    }
    return std::string{value};
}

std::string read_stream(GMimeStream* stream) {
    // For the sake of simplicity data is read out before decoding.
    g_mime_stream_reset(stream);

    ssize_t bytes_read = 0;
    std::string all_content;
    std::string buffer(4096, 0);
    while ((bytes_read = g_mime_stream_read(stream, buffer.data(), buffer.size())) > 0) {
        all_content.append(buffer.data(), static_cast<size_t>(bytes_read));
    }
    return all_content;
}

std::string read_part_content(GMimePart* part) {
    GMimeDataWrapper* content = g_mime_part_get_content(part);
    if (!content) {
        log_debug("no content in part");
        return {};
    }

    GMimeStream* content_stream = g_mime_data_wrapper_get_stream(content);
    if (!content_stream) {
        log_warning("failed getting stream for content");
        return {};
    }

    return read_stream(content_stream);
}

mime_part_t describe_object(GMimeObject* object, int depth) {
    mime_part_t result;
    result.depth = depth;
    result.content_type = "text/plain";

    GMimeContentType* content_type = g_mime_object_get_content_type(object);
    if (content_type) {
        const char* type_str = g_mime_content_type_get_media_type(content_type);
        const char* media_subtype_str = g_mime_content_type_get_media_subtype(content_type);
        if (type_str && media_subtype_str) {
            result.content_type = utils::to_lower(fmt::format("{}/{}", type_str, media_subtype_str));
        }

        if (const char* charset = g_mime_content_type_get_parameter(content_type, "charset")) {
            result.charset = charset;
        }
    }
    result.content_type_declared = g_mime_object_get_header(object, "Content-Type") != nullptr;

    if (auto encoding = object_header(object, "Content-Transfer-Encoding")) {
        result.transfer_encoding = utils::to_lower(utils::trim(*encoding));
    }

    if (const char* disposition = g_mime_object_get_disposition(object)) {
        result.disposition = utils::to_lower(utils::trim(disposition));
    }

    result.content_id = object_header(object, "Content-ID");
    if (!result.content_id) {
        if (const char* content_id = g_mime_object_get_content_id(object)) {
            result.content_id = content_id;
        }
    }

    return result;
}

void flatten_object(GMimeObject* object,
                    int depth,
                    content_mode mode,
                    std::vector<mime_part_t>& parts) {
    auto part = describe_object(object, depth);

    if (GMIME_IS_MULTIPART(object)) {
        part.is_container = true;
        parts.emplace_back(std::move(part));

        auto* multipart = reinterpret_cast<GMimeMultipart*>(object);
        const int count = g_mime_multipart_get_count(multipart);
        for (int i = 0; i < count; ++i) {
            GMimeObject* child = g_mime_multipart_get_part(multipart, i);
            if (!child) {
                log_warning("null sub-part {} at depth {}", i, depth);
                continue;
            }
            flatten_object(child, depth + 1, mode, parts);
        }
    } else if (GMIME_IS_MESSAGE_PART(object)) {
        // message/rfc822: walk into the enclosed message's body as well.
        part.is_container = true;
        parts.emplace_back(std::move(part));

        GMimeMessage* inner =
            g_mime_message_part_get_message(reinterpret_cast<GMimeMessagePart*>(object));
        if (inner) {
            if (GMimeObject* inner_body = g_mime_message_get_mime_part(inner)) {
                flatten_object(inner_body, depth + 1, mode, parts);
            }
        }
    } else if (GMIME_IS_PART(object)) {
        auto* leaf = reinterpret_cast<GMimePart*>(object);
        if (const char* filename = g_mime_part_get_filename(leaf)) {
            part.filename = filename;
        }
        if (mode == content_mode::load) {
            part.encoded_content = read_part_content(leaf);
        }
        parts.emplace_back(std::move(part));
    } else {
        log_debug("skipping unknown mime object {}", part.content_type);
        parts.emplace_back(std::move(part));
    }
}

std::vector<std::pair<std::string, std::string>> collect_headers(GMimeObject* object) {
    std::vector<std::pair<std::string, std::string>> result;

    GMimeHeaderList* list = g_mime_object_get_header_list(object);
    if (!list) {
        log_warning("no headers in a message");
        return result;
    }

    const int list_size = g_mime_header_list_get_count(list);
    for (int i = 0; i < list_size; ++i) {
        auto header = g_mime_header_list_get_header_at(list, i);
        if (!header) {
            log_warning("null returned for header {}", i);
            continue;
        }
        auto header_name = g_mime_header_get_name(header);
        if (!header_name) {
            log_warning("header at {} does not have a name", i);
            continue;
        }
        auto header_value = g_mime_header_get_raw_value(header);
        result.emplace_back(header_name, unfold_header_value(header_value ? header_value : ""));
    }

    return result;
}

}  // namespace

std::optional<std::string> mime_message_t::header(std::string_view name) const {
    for (auto& [header_name, value] : headers) {
        if (utils::iequals(header_name, name)) {
            return value;
        }
    }
    return std::nullopt;
}

types::HeaderMap mime_message_t::header_map() const {
    types::HeaderMap result;
    for (auto& [name, value] : headers) {
        result.insert_or_assign(name, value);
    }
    return result;
}

expected<mime_message_t> parse_message(std::string_view message_data, content_mode mode) {
    GMimeStream* stream =
        g_mime_stream_mem_new_with_buffer(message_data.data(), message_data.size());
    if (!stream) {
        log_error("failed creating stream");
        return unexpected(make_error_code(parse_errc::text_parse_failed));
    }

    auto stream_guard = sg::make_scope_guard([stream] { g_object_unref(stream); });

    GMimeParser* parser = g_mime_parser_new_with_stream(stream);
    if (!parser) {
        log_error("failed creating parser from stream");
        return unexpected(make_error_code(parse_errc::text_parse_failed));
    }
    log_debug("parser created");

    auto parser_guard = sg::make_scope_guard([parser] { g_object_unref(parser); });

    GMimeMessage* message = g_mime_parser_construct_message(parser, nullptr);
    if (!message) {
        log_debug("failed constructing message from parser");
        return unexpected(make_error_code(parse_errc::text_parse_failed));
    }

    auto message_guard = sg::make_scope_guard([message] { g_object_unref(message); });

    mime_message_t result;
    result.headers = collect_headers(reinterpret_cast<GMimeObject*>(message));
    if (result.headers.empty()) {
        log_debug("no header lines, not an rfc822 message");
        return unexpected(make_error_code(parse_errc::text_parse_failed));
    }

    GMimeObject* body = g_mime_message_get_mime_part(message);
    if (body) {
        result.is_multipart = GMIME_IS_MULTIPART(body);
        flatten_object(body, 0, mode, result.parts);
    } else {
        log_debug("message has no body part");
    }

    log_debug("parsed rfc822 message: {} headers, {} parts", result.headers.size(),
              result.parts.size());
    return result;
}

std::optional<types::EmailDate> parse_internet_date(std::string_view date_value) {
    const std::string value{utils::trim(date_value)};
    if (value.empty()) {
        return std::nullopt;
    }

    GDateTime* date = g_mime_utils_header_decode_date(value.c_str());
    if (!date) {
        log_debug("unparsable date '{}'", value);
        return std::nullopt;
    }
    auto date_guard = sg::make_scope_guard([date] { g_date_time_unref(date); });

    GDateTime* utc = g_date_time_to_utc(date);
    if (!utc) {
        return std::nullopt;
    }
    auto utc_guard = sg::make_scope_guard([utc] { g_date_time_unref(utc); });

    return types::EmailDate{.year = g_date_time_get_year(utc),
                            .month = g_date_time_get_month(utc),
                            .day = g_date_time_get_day_of_month(utc),
                            .hours = g_date_time_get_hour(utc),
                            .minutes = g_date_time_get_minute(utc),
                            .seconds = g_date_time_get_second(utc),
                            .unix_time = g_date_time_to_unix(utc)};
}

}  // namespace mailnorm::mime
