#include "errors.hpp"

namespace mailnorm {

namespace {
class parse_err_category_t : public std::error_category {
   public:
    const char* name() const noexcept override { return "mailnorm_parse_err"; }
    std::string message(int ev) const override {
        switch (static_cast<parse_errc>(ev)) {
            case parse_errc::container_parse_failed:
                return "structured container parse failed";
            case parse_errc::text_parse_failed:
                return "rfc822 text parse failed";
            case parse_errc::parse_failure:
                return "source is neither a structured container nor an rfc822 message";
            case parse_errc::io_failure:
                return "source could not be read";
            default:
                return "unknown error";
        }
    }
};
const parse_err_category_t the_parse_err_cat{};
}  // namespace

std::error_code make_error_code(parse_errc ec) {
    return std::error_code(static_cast<int>(ec), the_parse_err_cat);
}

}  // namespace mailnorm
