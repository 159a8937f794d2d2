#pragma once

#include <mailnorm/global.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mailnorm::types {

// UTC date
struct EmailDate {
    int year;
    int month;
    int day;
    int hours;
    int minutes;
    int seconds;
    // Seconds since the POSIX epoch.
    int64_t unix_time;
};

struct AttachmentMeta {
    // Absent when the source does not name the attachment.
    optional<string> filename;
    // Decoded payload size, 0 when the payload is not available.
    uint64_t size = 0;
    string content_type;
    // Only used for inline (cid:) resolution, not part of the serialized record.
    optional<string> content_id;
};

// Normalized content-id (no angle brackets) -> data:<mime>;base64,<payload>
using ContentIdMap = std::map<std::string, std::string>;

// Header name -> raw (undecoded) value.
using HeaderMap = std::map<std::string, std::string>;

struct CanonicalEmail {
    string filename;
    string subject;
    string sender;
    vector<string> recipients;
    vector<string> cc;
    vector<string> bcc;
    optional<EmailDate> date;
    optional<string> body;
    optional<string> html_body;
    vector<AttachmentMeta> attachments;
    HeaderMap headers;
    optional<string> message_id;
    // Size of the source file in bytes.
    uint64_t size = 0;
};

struct EmailSummary {
    string filename;
    string subject;
    string sender;
    vector<string> recipients;
    optional<EmailDate> date;
    uint64_t size = 0;
    bool has_attachments = false;
    size_t attachment_count = 0;
};

inline constexpr std::string_view no_subject_placeholder = "No Subject";
inline constexpr std::string_view unknown_sender_placeholder = "Unknown Sender";

EmailSummary to_summary(const CanonicalEmail& email);

// UTC calendar fields for a POSIX time. Empty when the time cannot be represented.
std::optional<EmailDate> make_email_date(int64_t unix_time);

// YYYY-MM-DDTHH:MM:SSZ
std::string to_iso8601(const EmailDate& date);

std::string to_json(const CanonicalEmail& email);
std::string to_json(const EmailSummary& summary);
std::string to_json(const std::vector<EmailSummary>& summaries);

}  // namespace mailnorm::types
