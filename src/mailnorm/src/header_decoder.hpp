#pragma once
#include <mailnorm/global.hpp>

#include <string>
#include <string_view>

namespace mailnorm::header_decoder {

// Decodes RFC 2047 encoded-words (=?charset?Q|B?text?=) interleaved with plain text into UTF-8.
// Never fails: undecodable spans go through the header fallback chain and, last, lossy UTF-8.
// Input without encoded-words is returned as is (after charset validation).
std::string decode_header(std::string_view raw_header_value);

}  // namespace mailnorm::header_decoder
