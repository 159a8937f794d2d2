#include "content_decoder.hpp"

#include "charset.hpp"
#include "utils.hpp"

#include <gmime/gmime.h>

#include <algorithm>
#include <optional>

namespace mailnorm::content_decoder {

namespace {
std::string run_gmime_decoder(std::string_view payload, GMimeContentEncoding encoding) {
    GMimeEncoding decoder;
    g_mime_encoding_init_decode(&decoder, encoding);

    const size_t out_bytes_needed = g_mime_encoding_outlen(&decoder, payload.size());
    std::string decoded_content(out_bytes_needed, '\0');
    const size_t n =
        g_mime_encoding_flush(&decoder, payload.data(), payload.size(), decoded_content.data());
    decoded_content.resize(n);
    return decoded_content;
}
}  // namespace

std::string_view strip_uuencode_framing(std::string_view payload) {
    std::optional<size_t> body_start;
    for (auto line : utils::split_views(payload, '\n')) {
        const auto line_offset = static_cast<size_t>(line.data() - payload.data());
        if (!body_start) {
            if (utils::starts_with(line, "begin ")) {
                body_start = std::min(line_offset + line.size() + 1, payload.size());
            }
        } else if (line == "end" || line == "end\r") {
            return payload.substr(*body_start, line_offset - *body_start);
        }
    }
    return body_start ? payload.substr(*body_start) : payload;
}

std::string decode_quoted_printable(std::string_view payload) {
    return run_gmime_decoder(payload, GMIME_CONTENT_ENCODING_QUOTEDPRINTABLE);
}

std::string decode_transfer_encoding(std::string_view payload,
                                     std::string_view transfer_encoding) {
    const auto encoding_name = utils::to_lower(utils::trim(transfer_encoding));
    if (encoding_name.empty() || payload.empty()) {
        return std::string{payload};
    }

    const GMimeContentEncoding encoding = g_mime_content_encoding_from_string(encoding_name.c_str());
    switch (encoding) {
        case GMIME_CONTENT_ENCODING_QUOTEDPRINTABLE:
        case GMIME_CONTENT_ENCODING_BASE64:
            return run_gmime_decoder(payload, encoding);
        case GMIME_CONTENT_ENCODING_UUENCODE:
            // The bare GMimeEncoding decodes body lines only; the begin/end lines are ours to drop.
            return run_gmime_decoder(strip_uuencode_framing(payload), encoding);
        default:
            return std::string{payload};
    }
}

std::string clean_encoded_artifacts(std::string s) {
    s = utils::replace_all(std::move(s), "=\r\n", "");
    s = utils::replace_all(std::move(s), "=\n", "");
    s = utils::replace_all(std::move(s), "=3D", "=");
    s = utils::replace_all(std::move(s), "=20", " ");
    s = utils::replace_all(std::move(s), "=0D=0A", "\n");
    return s;
}

std::string decode_content(std::string_view payload,
                           std::string_view transfer_encoding,
                           std::string_view declared_charset) {
    const auto bytes = decode_transfer_encoding(payload, transfer_encoding);

    std::vector<std::string> candidates;
    candidates.emplace_back(utils::trim(declared_charset));
    const auto& chain = charset::content_fallback_chain();
    candidates.insert(candidates.end(), chain.begin(), chain.end());

    auto decoded = charset::decode_with_fallback(bytes, candidates);
    if (decoded.lossy) {
        log_warning("content of {} bytes ({}) decoded lossily", bytes.size(),
                    transfer_encoding.empty() ? "no transfer encoding" : transfer_encoding);
    }

    return clean_encoded_artifacts(std::move(decoded.text));
}

}  // namespace mailnorm::content_decoder
