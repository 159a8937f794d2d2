#pragma once
#include <mailnorm/global.hpp>

#include <string>
#include <string_view>

namespace mailnorm::content_decoder {

// Undoes a Content-Transfer-Encoding (base64, quoted-printable, uuencode). Other encodings
// (7bit, 8bit, binary, unknown) are returned unchanged.
std::string decode_transfer_encoding(std::string_view payload, std::string_view transfer_encoding);

// Body lines between "begin <mode> <name>" and "end". A payload without a begin line is returned
// unchanged.
std::string_view strip_uuencode_framing(std::string_view payload);

// Unescapes =XX sequences and soft line breaks.
std::string decode_quoted_printable(std::string_view payload);

// Removes quoted-printable leftovers an earlier layer did not decode: soft line breaks, =3D, =20
// and =0D=0A.
std::string clean_encoded_artifacts(std::string s);

// Decodes a body payload into UTF-8 text: transfer encoding first, then the declared charset,
// UTF-8, ISO-8859-1 and finally lossy UTF-8. Never fails.
std::string decode_content(std::string_view payload,
                           std::string_view transfer_encoding,
                           std::string_view declared_charset = {});

}  // namespace mailnorm::content_decoder
