#include <header_decoder.hpp>
#include <utils.hpp>

#include <gtest/gtest.h>

using namespace mailnorm;
using header_decoder::decode_header;

TEST(header_decoder_test, plain_ascii_is_unchanged) {
    EXPECT_EQ(decode_header("Quarterly report"), "Quarterly report");
    EXPECT_EQ(decode_header("  spaced  out  "), "  spaced  out  ");
    EXPECT_EQ(decode_header(""), "");
}

TEST(header_decoder_test, base64_encoded_word) {
    const auto encoded = "=?UTF-8?B?" + utils::base64_naive_encode("caf\xC3\xA9") + "?=";
    EXPECT_EQ(decode_header(encoded), "caf\xC3\xA9");
}

TEST(header_decoder_test, q_encoded_word) {
    EXPECT_EQ(decode_header("=?UTF-8?Q?Hello_World?="), "Hello World");
    EXPECT_EQ(decode_header("=?iso-8859-1?q?caf=E9?="), "caf\xC3\xA9");
}

TEST(header_decoder_test, encoded_words_mixed_with_plain_text) {
    EXPECT_EQ(decode_header("Re: =?UTF-8?B?Y2Fmw6k=?= menu"), "Re: caf\xC3\xA9 menu");
}

TEST(header_decoder_test, whitespace_between_encoded_words_is_dropped) {
    EXPECT_EQ(decode_header("=?UTF-8?Q?foo?= =?UTF-8?Q?bar?="), "foobar");
    EXPECT_EQ(decode_header("=?UTF-8?Q?foo?=\r\n =?UTF-8?Q?bar?="), "foobar");
}

TEST(header_decoder_test, multibyte_sequence_split_across_words) {
    EXPECT_EQ(decode_header("=?UTF-8?Q?caf=C3?= =?UTF-8?Q?=A9?="), "caf\xC3\xA9");
}

TEST(header_decoder_test, language_suffix_is_ignored) {
    EXPECT_EQ(decode_header("=?UTF-8*en?Q?hi?="), "hi");
}

TEST(header_decoder_test, malformed_encoded_word_is_kept_literally) {
    EXPECT_EQ(decode_header("=?UTF-8?X?abc?="), "=?UTF-8?X?abc?=");
    EXPECT_EQ(decode_header("price =?unterminated"), "price =?unterminated");
}

TEST(header_decoder_test, raw_latin1_header_goes_through_fallback_chain) {
    EXPECT_EQ(decode_header("Jos\xE9"), "Jos\xC3\xA9");
}

TEST(header_decoder_test, unknown_declared_charset_falls_back) {
    EXPECT_EQ(decode_header("=?x-unknown?Q?abc?="), "abc");
}
