#pragma once
#include <mailnorm/global.hpp>

namespace mailnorm {

///////////////////////////////////////////////////////////////////////////////////////////////
// parse-errors
enum class parse_errc {
    // structured container could not be opened or one of its fields could not be read.
    container_parse_failed = 1,

    // RFC-822 text could not be interpreted as a message.
    text_parse_failed,

    // source could not be interpreted in any supported format.
    parse_failure,

    // source file could not be opened or read.
    io_failure,
};

std::error_code make_error_code(parse_errc);

}  // namespace mailnorm

namespace std {
template <>
struct is_error_code_enum<mailnorm::parse_errc> : true_type {};

}  // namespace std
