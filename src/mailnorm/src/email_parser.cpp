#include "email_parser.hpp"

#include "attachment_extractor.hpp"
#include "body_extractor.hpp"
#include "cid_resolver.hpp"
#include "errors.hpp"
#include "header_decoder.hpp"
#include "mime_message.hpp"
#include "utils.hpp"

#include <fstream>
#include <iterator>

namespace mailnorm {

namespace {

struct source_file_t {
    std::string filename;
    std::string bytes;
};

expected<source_file_t> read_source(const std::filesystem::path& path) {
    std::ifstream file_stream(path, std::ios_base::in | std::ios_base::binary);
    if (!file_stream) {
        log_warning("cannot open '{}'", path.string());
        return unexpected(make_error_code(parse_errc::io_failure));
    }

    std::string bytes{std::istreambuf_iterator<char>(file_stream),
                      std::istreambuf_iterator<char>()};
    if (file_stream.bad()) {
        log_warning("failed reading '{}'", path.string());
        return unexpected(make_error_code(parse_errc::io_failure));
    }

    return source_file_t{.filename = path.filename().string(), .bytes = std::move(bytes)};
}

std::vector<std::string> split_recipients(const std::optional<std::string>& list, char delimiter) {
    std::vector<std::string> result;
    if (!list) {
        return result;
    }
    for (auto item : utils::split_views(*list, delimiter)) {
        item = utils::trim(item);
        if (!item.empty()) {
            result.emplace_back(header_decoder::decode_header(item));
        }
    }
    return result;
}

std::optional<std::string> find_header(const types::HeaderMap& headers, std::string_view name) {
    for (auto& [header_name, value] : headers) {
        if (utils::iequals(header_name, name)) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_present(const std::optional<std::string>& s) {
    return s && !utils::trim(*s).empty();
}

// Sender field, sender-email field, From header; first non-empty one wins.
std::string resolve_sender(std::initializer_list<std::optional<std::string>> candidates) {
    for (auto& candidate : candidates) {
        if (is_present(candidate)) {
            return header_decoder::decode_header(*candidate);
        }
    }
    return std::string{types::unknown_sender_placeholder};
}

std::string resolve_subject(const std::optional<std::string>& subject) {
    return header_decoder::decode_header(
        is_present(subject) ? *subject : std::string{types::no_subject_placeholder});
}

std::optional<types::EmailDate> resolve_date(const std::optional<std::string>& date) {
    if (!date) {
        return std::nullopt;
    }
    return mime::parse_internet_date(*date);
}

std::optional<std::string> non_empty(std::string s) {
    if (s.empty()) {
        return std::nullopt;
    }
    return s;
}

//////////////////////////////////////////////////////////////////////////////
// Outlook container path

expected<types::CanonicalEmail> detail_from_container(const outlook::outlook_message_t& message,
                                                      const source_file_t& source) {
    MAILNORM_TRY_ASSIGN(subject, message.subject(), "container subject");
    MAILNORM_TRY_ASSIGN(sender, message.sender(), "container sender");
    MAILNORM_TRY_ASSIGN(sender_email, message.sender_email(), "container sender email");
    MAILNORM_TRY_ASSIGN(to, message.to(), "container to");
    MAILNORM_TRY_ASSIGN(cc, message.cc(), "container cc");
    MAILNORM_TRY_ASSIGN(bcc, message.bcc(), "container bcc");
    MAILNORM_TRY_ASSIGN(body, message.body(), "container body");
    MAILNORM_TRY_ASSIGN(html_body, message.html_body(), "container html body");
    MAILNORM_TRY_ASSIGN(date, message.date(), "container date");
    MAILNORM_TRY_ASSIGN(message_id, message.message_id(), "container message id");
    MAILNORM_TRY_ASSIGN(headers, message.headers(), "container headers");
    MAILNORM_TRY_ASSIGN(attachments, message.attachments(), "container attachments");

    types::CanonicalEmail email;
    email.filename = source.filename;
    email.size = source.bytes.size();
    email.subject = resolve_subject(subject);
    email.sender = resolve_sender({sender, sender_email, find_header(headers, "From")});
    email.recipients = split_recipients(to, ';');
    email.cc = split_recipients(cc, ';');
    email.bcc = split_recipients(bcc, ';');
    email.date = date;
    email.message_id = message_id;

    body_extractor::message_bodies_t bodies;
    bodies.plain = body.value_or("");
    if (is_present(html_body)) {
        bodies.html = body_extractor::clean_html_content(*html_body);
    }
    body_extractor::promote_plain_to_html(bodies);

    if (!bodies.html.empty()) {
        const auto cid_map = cid_resolver::build_content_id_map(attachments);
        bodies.html = cid_resolver::inline_references(bodies.html, cid_map);
    }

    email.body = non_empty(std::move(bodies.plain));
    email.html_body = non_empty(std::move(bodies.html));
    email.attachments = attachment_extractor::list_attachments(attachments);
    email.headers = std::move(headers);
    return email;
}

expected<types::EmailSummary> summary_from_container(const outlook::outlook_message_t& message,
                                                     const source_file_t& source) {
    MAILNORM_TRY_ASSIGN(subject, message.subject(), "container subject");
    MAILNORM_TRY_ASSIGN(sender, message.sender(), "container sender");
    MAILNORM_TRY_ASSIGN(sender_email, message.sender_email(), "container sender email");
    MAILNORM_TRY_ASSIGN(to, message.to(), "container to");
    MAILNORM_TRY_ASSIGN(date, message.date(), "container date");
    MAILNORM_TRY_ASSIGN(headers, message.headers(), "container headers");
    MAILNORM_TRY_ASSIGN(attachment_count, message.attachment_count(),
                        "container attachment count");

    types::EmailSummary summary;
    summary.filename = source.filename;
    summary.size = source.bytes.size();
    summary.subject = resolve_subject(subject);
    summary.sender = resolve_sender({sender, sender_email, find_header(headers, "From")});
    summary.recipients = split_recipients(to, ';');
    summary.date = date;
    summary.attachment_count = attachment_count;
    summary.has_attachments = attachment_count > 0;
    return summary;
}

//////////////////////////////////////////////////////////////////////////////
// RFC-822 text path

expected<types::CanonicalEmail> detail_from_text(const source_file_t& source) {
    MAILNORM_TRY_ASSIGN(message, mime::parse_message(source.bytes), "parse rfc822");

    auto bodies = body_extractor::extract_bodies(message);
    if (!bodies.html.empty()) {
        const auto cid_map = cid_resolver::build_content_id_map(message);
        bodies.html = cid_resolver::inline_references(bodies.html, cid_map);
    }

    types::CanonicalEmail email;
    email.filename = source.filename;
    email.size = source.bytes.size();
    email.subject = resolve_subject(message.header("Subject"));
    email.sender = resolve_sender({std::nullopt, std::nullopt, message.header("From")});
    email.recipients = split_recipients(message.header("To"), ',');
    email.cc = split_recipients(message.header("Cc"), ',');
    email.bcc = split_recipients(message.header("Bcc"), ',');
    email.date = resolve_date(message.header("Date"));
    email.message_id = message.header("Message-ID");
    email.body = non_empty(std::move(bodies.plain));
    email.html_body = non_empty(std::move(bodies.html));
    email.attachments = attachment_extractor::list_attachments(message);
    email.headers = message.header_map();
    return email;
}

expected<types::EmailSummary> summary_from_text(const source_file_t& source) {
    MAILNORM_TRY_ASSIGN(message, mime::parse_message(source.bytes, mime::content_mode::skip),
                        "parse rfc822 structure");

    types::EmailSummary summary;
    summary.filename = source.filename;
    summary.size = source.bytes.size();
    summary.subject = resolve_subject(message.header("Subject"));
    summary.sender = resolve_sender({std::nullopt, std::nullopt, message.header("From")});
    summary.recipients = split_recipients(message.header("To"), ',');
    summary.date = resolve_date(message.header("Date"));
    summary.attachment_count = attachment_extractor::count_attachments(message);
    summary.has_attachments = summary.attachment_count > 0;
    return summary;
}

// Runs the container attempt and, if it fails for any reason, the text attempt.
template <class T, class ContainerFn, class TextFn>
expected<T> parse_with_fallback(outlook::outlook_reader_t& reader,
                                const std::filesystem::path& path,
                                ContainerFn from_container,
                                TextFn from_text) {
    auto source_or_err = read_source(path);
    if (!source_or_err) {
        return unexpected(make_error_code(parse_errc::parse_failure));
    }
    const auto& source = *source_or_err;

    auto container_attempt = [&]() -> expected<T> {
        MAILNORM_TRY_ASSIGN(message, reader.open(path), "open container");
        return from_container(*message, source);
    }();
    if (container_attempt) {
        return container_attempt;
    }
    log_debug("'{}' is not a readable Outlook message ({}), trying rfc822", source.filename,
              container_attempt.error());

    auto text_attempt = from_text(source);
    if (text_attempt) {
        return text_attempt;
    }
    log_error("'{}' could not be parsed: {}", source.filename, text_attempt.error());
    return unexpected(make_error_code(parse_errc::parse_failure));
}

}  // namespace

email_parser_t::email_parser_t(std::shared_ptr<outlook::outlook_reader_t> outlook_reader)
    : m_outlook_reader(std::move(outlook_reader)) {}

expected<types::CanonicalEmail> email_parser_t::parse_detail(
    const std::filesystem::path& path) const {
    return parse_with_fallback<types::CanonicalEmail>(*m_outlook_reader, path,
                                                      &detail_from_container, &detail_from_text);
}

expected<types::EmailSummary> email_parser_t::parse_summary(
    const std::filesystem::path& path) const {
    return parse_with_fallback<types::EmailSummary>(*m_outlook_reader, path,
                                                    &summary_from_container, &summary_from_text);
}

std::optional<std::string> email_parser_t::extract_attachment(const std::filesystem::path& path,
                                                              std::string_view name) const {
    auto container_attachments = [&]() -> expected<std::vector<outlook::outlook_attachment_t>> {
        MAILNORM_TRY_ASSIGN(message, m_outlook_reader->open(path), "open container");
        return message->attachments();
    }();
    if (container_attachments) {
        return attachment_extractor::find_attachment(*container_attachments, name);
    }

    auto source_or_err = read_source(path);
    if (!source_or_err) {
        return std::nullopt;
    }
    auto message_or_err = mime::parse_message(source_or_err->bytes);
    if (!message_or_err) {
        log_warning("'{}' could not be parsed for attachment '{}'", path.string(), name);
        return std::nullopt;
    }
    return attachment_extractor::find_attachment(*message_or_err, name);
}

std::shared_ptr<email_parser_t> make_email_parser() {
    return std::make_shared<email_parser_t>(outlook::make_olecf_reader());
}

}  // namespace mailnorm
