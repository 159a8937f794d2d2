#include <email_parser.hpp>
#include <errors.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "test_messages.hpp"

using namespace mailnorm;
using namespace mailnorm::test_helpers;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class email_parser_tests : public ::testing::Test {
   protected:
    temp_dir_t m_dir{"email_parser"};
};

namespace {
std::shared_ptr<fake_outlook_message_t> make_container_message() {
    auto message = std::make_shared<fake_outlook_message_t>();
    message->fields = {
        {"subject", "=?UTF-8?Q?Caf=C3=A9_menu?="},
        {"sender", "Alice Example"},
        {"sender_email", "alice@example.com"},
        {"to", "Bob <bob@example.com>; ;Carol <carol@example.com> "},
        {"cc", "Dave <dave@example.com>"},
        {"body", "See the logo."},
        {"html_body", "<html><body><img src=\"cid:logo\"> hy&shy;phen</body></html>"},
        {"date", "Mon, 02 Jan 2023 10:00:00 +0100"},
        {"message_id", "<c1@example.com>"},
    };
    message->header_values = {{"From", "Alice Example <alice@example.com>"},
                              {"X-Mailer", "Outlook"}};

    outlook::outlook_attachment_t logo;
    logo.long_filename = "logo.png";
    logo.data = "PNG";
    logo.content_id = "<logo>";
    outlook::outlook_attachment_t report;
    report.long_filename = "report.pdf";
    report.short_filename = "REPORT.PDF";
    report.data = "%PDF-";
    message->attachment_values = {logo, report};
    return message;
}
}  // namespace

TEST_F(email_parser_tests, container_detail) {
    auto path = m_dir.write_file("container.msg", "0123456789");
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(make_container_message())};

    auto email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err) << email_or_err.error();
    auto& email = *email_or_err;

    EXPECT_EQ(email.filename, "container.msg");
    EXPECT_EQ(email.size, 10);
    EXPECT_EQ(email.subject, "Caf\xC3\xA9 menu");
    EXPECT_EQ(email.sender, "Alice Example");
    EXPECT_THAT(email.recipients, ElementsAre("Bob <bob@example.com>", "Carol <carol@example.com>"));
    EXPECT_THAT(email.cc, ElementsAre("Dave <dave@example.com>"));
    EXPECT_TRUE(email.bcc.empty());
    ASSERT_TRUE(email.date);
    EXPECT_EQ(email.date->hours, 9);
    EXPECT_EQ(email.body, "See the logo.");
    ASSERT_TRUE(email.html_body);
    EXPECT_THAT(*email.html_body, HasSubstr("<img src=\"data:image/png;base64,UE5H\">"));
    EXPECT_THAT(*email.html_body, HasSubstr("hyphen"));
    EXPECT_EQ(email.message_id, "<c1@example.com>");
    EXPECT_EQ(email.headers["X-Mailer"], "Outlook");

    ASSERT_EQ(email.attachments.size(), 2);
    EXPECT_EQ(email.attachments[0].filename, "logo.png");
    EXPECT_EQ(email.attachments[0].content_type, "image/png");
    EXPECT_EQ(email.attachments[1].filename, "report.pdf");
    EXPECT_EQ(email.attachments[1].size, 5);
}

TEST_F(email_parser_tests, container_placeholders_and_sender_fallback) {
    auto path = m_dir.write_file("sparse.msg", "x");
    auto message = std::make_shared<fake_outlook_message_t>();
    message->fields = {{"sender", "  "}, {"sender_email", "bob@example.com"}};
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(message)};

    auto email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err);
    EXPECT_EQ(email_or_err->subject, "No Subject");
    EXPECT_EQ(email_or_err->sender, "bob@example.com");
    EXPECT_FALSE(email_or_err->date);
    EXPECT_FALSE(email_or_err->body);
    EXPECT_FALSE(email_or_err->html_body);

    message->fields.clear();
    message->header_values = {{"from", "Header Sender <h@example.com>"}};
    email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err);
    EXPECT_EQ(email_or_err->sender, "Header Sender <h@example.com>");

    message->header_values.clear();
    email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err);
    EXPECT_EQ(email_or_err->sender, "Unknown Sender");
}

TEST_F(email_parser_tests, container_markup_body_is_promoted) {
    auto path = m_dir.write_file("promote.msg", "x");
    auto message = std::make_shared<fake_outlook_message_t>();
    message->fields = {{"body", "<div>only markup</div>"}};
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(message)};

    auto email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err);
    EXPECT_EQ(email_or_err->body, "<div>only markup</div>");
    EXPECT_EQ(email_or_err->html_body, "<div>only markup</div>");
}

TEST_F(email_parser_tests, failing_container_field_falls_back_to_text) {
    auto path = m_dir.write_file("mixed.msg", test_messages::related_message);
    auto message = make_container_message();
    message->failing_fields = {"attachments"};
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(message)};

    auto email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err);
    auto& email = *email_or_err;

    // Every field comes from the text path, none from the half-read container.
    EXPECT_EQ(email.subject, "caf\xC3\xA9");
    EXPECT_EQ(email.sender, "Alice <alice@example.com>");
    EXPECT_THAT(email.recipients, ElementsAre("Bob <bob@example.com>", "Carol <carol@example.com>"));
    EXPECT_THAT(email.cc, ElementsAre("Dave <dave@example.com>"));
    EXPECT_EQ(email.message_id, "<m1@example.com>");
    EXPECT_EQ(email.size, test_messages::related_message.size());
    ASSERT_TRUE(email.date);
    EXPECT_EQ(email.date->unix_time, 1672650000);
    EXPECT_EQ(email.headers.count("X-Mailer"), 0);

    ASSERT_TRUE(email.body);
    EXPECT_THAT(*email.body, HasSubstr("Hello plain"));
    ASSERT_TRUE(email.html_body);
    EXPECT_THAT(*email.html_body, HasSubstr("src=\"data:image/png;base64,UE5H\""));
    EXPECT_THAT(*email.html_body, HasSubstr("alt=\"logo\""));

    ASSERT_EQ(email.attachments.size(), 1);
    EXPECT_EQ(email.attachments[0].filename, "report.pdf");
    EXPECT_EQ(email.attachments[0].content_type, "application/pdf");
}

TEST_F(email_parser_tests, text_message_without_container) {
    auto path = m_dir.write_file("plain.eml", test_messages::plain_qp_message);
    auto reader = std::make_shared<fake_outlook_reader_t>();
    email_parser_t parser{reader};

    auto email_or_err = parser.parse_detail(path);
    ASSERT_TRUE(email_or_err);
    EXPECT_EQ(reader->open_calls, 1);
    EXPECT_EQ(email_or_err->subject, "Lunch");
    ASSERT_TRUE(email_or_err->body);
    EXPECT_THAT(*email_or_err->body, HasSubstr("caf\xC3\xA9"));
    EXPECT_FALSE(email_or_err->html_body);
    EXPECT_FALSE(email_or_err->date);
    EXPECT_TRUE(email_or_err->attachments.empty());
}

TEST_F(email_parser_tests, both_paths_failing_is_an_error) {
    auto path = m_dir.write_file("garbage.msg", "\x01\x02\x03\x04 no headers here");
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>()};

    auto email_or_err = parser.parse_detail(path);
    ASSERT_FALSE(email_or_err);
    EXPECT_EQ(email_or_err.error(), make_error_code(parse_errc::parse_failure));

    auto summary_or_err = parser.parse_summary(path);
    ASSERT_FALSE(summary_or_err);
    EXPECT_EQ(summary_or_err.error(), make_error_code(parse_errc::parse_failure));
}

TEST_F(email_parser_tests, missing_file_is_a_parse_failure) {
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>()};
    auto email_or_err = parser.parse_detail(m_dir.path() / "does-not-exist.msg");
    ASSERT_FALSE(email_or_err);
    EXPECT_EQ(email_or_err.error(), make_error_code(parse_errc::parse_failure));
}

TEST_F(email_parser_tests, container_summary) {
    auto path = m_dir.write_file("container.msg", "0123456789");
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(make_container_message())};

    auto summary_or_err = parser.parse_summary(path);
    ASSERT_TRUE(summary_or_err);
    EXPECT_EQ(summary_or_err->subject, "Caf\xC3\xA9 menu");
    EXPECT_EQ(summary_or_err->sender, "Alice Example");
    EXPECT_EQ(summary_or_err->recipients.size(), 2);
    EXPECT_EQ(summary_or_err->size, 10);
    EXPECT_TRUE(summary_or_err->has_attachments);
    EXPECT_EQ(summary_or_err->attachment_count, 2);
}

TEST_F(email_parser_tests, summary_does_not_need_bodies) {
    auto path = m_dir.write_file("container.msg", "0123456789");
    auto message = make_container_message();
    message->failing_fields = {"body", "html_body"};
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(message)};

    EXPECT_TRUE(parser.parse_summary(path));
}

TEST_F(email_parser_tests, summary_counts_attachments_without_reading_them) {
    auto path = m_dir.write_file("container.msg", "0123456789");
    auto message = make_container_message();
    message->failing_fields = {"attachments"};
    auto reader = std::make_shared<fake_outlook_reader_t>(message);
    email_parser_t parser{reader};

    auto summary_or_err = parser.parse_summary(path);
    ASSERT_TRUE(summary_or_err);
    EXPECT_EQ(reader->open_calls, 1);
    EXPECT_EQ(summary_or_err->subject, "Caf\xC3\xA9 menu");
    EXPECT_TRUE(summary_or_err->has_attachments);
    EXPECT_EQ(summary_or_err->attachment_count, 2);
}

TEST_F(email_parser_tests, failing_attachment_count_falls_back_to_text) {
    auto path = m_dir.write_file("container.msg", test_messages::plain_qp_message);
    auto message = make_container_message();
    message->failing_fields = {"attachment_count"};
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(message)};

    auto summary_or_err = parser.parse_summary(path);
    ASSERT_TRUE(summary_or_err);
    EXPECT_EQ(summary_or_err->subject, "Lunch");
    EXPECT_FALSE(summary_or_err->has_attachments);
}

TEST_F(email_parser_tests, text_summary_matches_detail) {
    auto path = m_dir.write_file("mixed.eml", test_messages::related_message);
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>()};

    auto summary_or_err = parser.parse_summary(path);
    ASSERT_TRUE(summary_or_err);
    auto detail_or_err = parser.parse_detail(path);
    ASSERT_TRUE(detail_or_err);

    auto derived = types::to_summary(*detail_or_err);
    EXPECT_EQ(summary_or_err->filename, derived.filename);
    EXPECT_EQ(summary_or_err->subject, derived.subject);
    EXPECT_EQ(summary_or_err->sender, derived.sender);
    EXPECT_EQ(summary_or_err->recipients, derived.recipients);
    EXPECT_EQ(summary_or_err->size, derived.size);
    EXPECT_EQ(summary_or_err->attachment_count, derived.attachment_count);
    EXPECT_TRUE(summary_or_err->has_attachments);
}

TEST_F(email_parser_tests, extract_attachment_from_container) {
    auto path = m_dir.write_file("container.msg", "0123456789");
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>(make_container_message())};

    EXPECT_EQ(parser.extract_attachment(path, "report.pdf"), "%PDF-");
    EXPECT_FALSE(parser.extract_attachment(path, "absent.doc"));
}

TEST_F(email_parser_tests, extract_attachment_from_text) {
    auto path = m_dir.write_file("mixed.eml", test_messages::related_message);
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>()};

    EXPECT_EQ(parser.extract_attachment(path, "report.pdf"), "%PDF-");
    EXPECT_FALSE(parser.extract_attachment(path, "absent.doc"));
}

TEST_F(email_parser_tests, extract_attachment_from_unreadable_source) {
    email_parser_t parser{std::make_shared<fake_outlook_reader_t>()};
    EXPECT_FALSE(parser.extract_attachment(m_dir.path() / "nope.msg", "report.pdf"));
}
