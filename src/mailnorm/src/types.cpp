#include <mailnorm/types.hpp>

#include <fmt/format.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <ctime>

namespace mailnorm::types {

using namespace rapidjson;

namespace {
template <class JsonWriter>
void encode_string(JsonWriter& writer, const std::string& s) {
    writer.String(s.data(), static_cast<SizeType>(s.size()));
}

template <class JsonWriter>
void encode_optional_string(JsonWriter& writer, const std::optional<std::string>& s) {
    if (s.has_value()) {
        encode_string(writer, *s);
    } else {
        writer.Null();
    }
}

template <class JsonWriter>
void encode_string_vec(JsonWriter& writer, const std::vector<std::string>& vec) {
    writer.StartArray();
    for (auto& a : vec) {
        encode_string(writer, a);
    }
    writer.EndArray();
}

template <class JsonWriter>
void encode_date(JsonWriter& writer, const std::optional<EmailDate>& date) {
    if (date.has_value()) {
        encode_string(writer, to_iso8601(*date));
    } else {
        writer.Null();
    }
}

template <class JsonWriter>
void encode_summary(JsonWriter& writer, const EmailSummary& summary) {
    writer.StartObject();

    writer.Key("filename");
    encode_string(writer, summary.filename);

    writer.Key("subject");
    encode_string(writer, summary.subject);

    writer.Key("sender");
    encode_string(writer, summary.sender);

    writer.Key("recipients");
    encode_string_vec(writer, summary.recipients);

    writer.Key("date");
    encode_date(writer, summary.date);

    writer.Key("size");
    writer.Uint64(summary.size);

    writer.Key("has_attachments");
    writer.Bool(summary.has_attachments);

    writer.Key("attachment_count");
    writer.Uint64(summary.attachment_count);

    writer.EndObject();
}
}  // namespace

EmailSummary to_summary(const CanonicalEmail& email) {
    return EmailSummary{.filename = email.filename,
                        .subject = email.subject,
                        .sender = email.sender,
                        .recipients = email.recipients,
                        .date = email.date,
                        .size = email.size,
                        .has_attachments = !email.attachments.empty(),
                        .attachment_count = email.attachments.size()};
}

std::optional<EmailDate> make_email_date(int64_t unix_time) {
    const time_t t = static_cast<time_t>(unix_time);
    struct tm utc {};
    if (!gmtime_r(&t, &utc)) {
        return std::nullopt;
    }
    return EmailDate{.year = utc.tm_year + 1900,
                     .month = utc.tm_mon + 1,
                     .day = utc.tm_mday,
                     .hours = utc.tm_hour,
                     .minutes = utc.tm_min,
                     .seconds = utc.tm_sec,
                     .unix_time = unix_time};
}

std::string to_iso8601(const EmailDate& date) {
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", date.year, date.month, date.day,
                       date.hours, date.minutes, date.seconds);
}

std::string to_json(const CanonicalEmail& email) {
    StringBuffer s;
    PrettyWriter<StringBuffer> writer(s);

    writer.StartObject();

    writer.Key("filename");
    encode_string(writer, email.filename);

    writer.Key("subject");
    encode_string(writer, email.subject);

    writer.Key("sender");
    encode_string(writer, email.sender);

    writer.Key("recipients");
    encode_string_vec(writer, email.recipients);

    writer.Key("cc");
    encode_string_vec(writer, email.cc);

    writer.Key("bcc");
    encode_string_vec(writer, email.bcc);

    // ISO8601
    writer.Key("date");
    encode_date(writer, email.date);

    writer.Key("body");
    encode_optional_string(writer, email.body);

    writer.Key("html_body");
    encode_optional_string(writer, email.html_body);

    writer.Key("attachments");
    writer.StartArray();
    for (auto& attachment : email.attachments) {
        writer.StartObject();
        writer.Key("filename");
        encode_optional_string(writer, attachment.filename);
        writer.Key("size");
        writer.Uint64(attachment.size);
        writer.Key("content_type");
        encode_string(writer, attachment.content_type);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("headers");
    writer.StartObject();
    for (auto& [name, value] : email.headers) {
        writer.Key(name.data(), static_cast<SizeType>(name.size()));
        encode_string(writer, value);
    }
    writer.EndObject();

    writer.Key("message_id");
    encode_optional_string(writer, email.message_id);

    writer.Key("size");
    writer.Uint64(email.size);

    writer.EndObject();

    return s.GetString();
}

std::string to_json(const EmailSummary& summary) {
    StringBuffer s;
    PrettyWriter<StringBuffer> writer(s);
    encode_summary(writer, summary);
    return s.GetString();
}

std::string to_json(const std::vector<EmailSummary>& summaries) {
    StringBuffer s;
    PrettyWriter<StringBuffer> writer(s);
    writer.StartArray();
    for (auto& summary : summaries) {
        encode_summary(writer, summary);
    }
    writer.EndArray();
    return s.GetString();
}

}  // namespace mailnorm::types
