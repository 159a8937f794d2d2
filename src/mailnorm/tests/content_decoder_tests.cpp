#include <content_decoder.hpp>

#include <gtest/gtest.h>

using namespace mailnorm;

TEST(content_decoder_test, quoted_printable_utf8) {
    EXPECT_EQ(content_decoder::decode_content("caf=C3=A9", "quoted-printable", "utf-8"),
              "caf\xC3\xA9");
}

TEST(content_decoder_test, quoted_printable_soft_line_break) {
    EXPECT_EQ(content_decoder::decode_quoted_printable("long=\nline"), "longline");
}

TEST(content_decoder_test, base64_payload) {
    EXPECT_EQ(content_decoder::decode_transfer_encoding("aGVsbG8=", "base64"), "hello");
    EXPECT_EQ(content_decoder::decode_transfer_encoding("aGVs\r\nbG8=", " BASE64 "), "hello");
}

TEST(content_decoder_test, uuencode_framing_is_stripped) {
    const std::string framed = "begin 644 hello.txt\n%:&5L;&\\ \n`\nend\n";
    EXPECT_EQ(content_decoder::strip_uuencode_framing(framed), "%:&5L;&\\ \n`\n");
    EXPECT_EQ(content_decoder::decode_transfer_encoding(framed, "x-uuencode"), "hello");

    const std::string crlf = "begin 600 cat\r\n#0V%T\r\n`\r\nend\r\n";
    EXPECT_EQ(content_decoder::strip_uuencode_framing(crlf), "#0V%T\r\n`\r\n");
    EXPECT_EQ(content_decoder::decode_transfer_encoding(crlf, "x-uuencode"), "Cat");
}

TEST(content_decoder_test, uuencode_framing_edges) {
    // Preamble before the begin line is not part of the body.
    EXPECT_EQ(content_decoder::strip_uuencode_framing("note\nbegin 644 a\n#0V%T\nend\n"),
              "#0V%T\n");
    // No end line: everything after begin.
    EXPECT_EQ(content_decoder::strip_uuencode_framing("begin 644 a\n#0V%T\n"), "#0V%T\n");
    EXPECT_EQ(content_decoder::strip_uuencode_framing("begin 644 a"), "");
    EXPECT_EQ(content_decoder::strip_uuencode_framing("#0V%T\n`\n"), "#0V%T\n`\n");
}

TEST(content_decoder_test, identity_encodings_pass_through) {
    EXPECT_EQ(content_decoder::decode_transfer_encoding("aGVsbG8=", "7bit"), "aGVsbG8=");
    EXPECT_EQ(content_decoder::decode_transfer_encoding("raw", ""), "raw");
    EXPECT_EQ(content_decoder::decode_transfer_encoding("raw", "x-custom"), "raw");
}

TEST(content_decoder_test, declared_charset_is_tried_first) {
    // 0xE9 is e-acute in latin1; as UTF-8 it would be invalid.
    EXPECT_EQ(content_decoder::decode_content("caf\xE9", "8bit", "iso-8859-1"), "caf\xC3\xA9");
}

TEST(content_decoder_test, undeclared_charset_falls_back_to_latin1) {
    EXPECT_EQ(content_decoder::decode_content("caf\xE9", ""), "caf\xC3\xA9");
}

TEST(content_decoder_test, leftover_artifacts_are_cleaned) {
    EXPECT_EQ(content_decoder::clean_encoded_artifacts("a=3Db=20c=\r\nd"), "a=b cd");
    EXPECT_EQ(content_decoder::clean_encoded_artifacts("line=0D=0Anext"), "line\nnext");
    EXPECT_EQ(content_decoder::clean_encoded_artifacts("x = y"), "x = y");
}
