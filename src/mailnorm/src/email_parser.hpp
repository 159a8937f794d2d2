#pragma once
#include <mailnorm/global.hpp>
#include <mailnorm/types.hpp>

#include "outlook_message.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace mailnorm {

// Entry point of the engine. Every call tries the Outlook container path first and falls back
// to the RFC-822 text path; the only error reported to callers is parse_errc::parse_failure.
// Stateless between calls, so one instance may be shared by concurrent callers.
class email_parser_t {
   public:
    explicit email_parser_t(std::shared_ptr<outlook::outlook_reader_t> outlook_reader);

    expected<types::CanonicalEmail> parse_detail(const std::filesystem::path& path) const;

    // Skips body decoding and attachment payloads.
    expected<types::EmailSummary> parse_summary(const std::filesystem::path& path) const;

    // Raw bytes of the attachment called exactly `name`, empty when there is none.
    std::optional<std::string> extract_attachment(const std::filesystem::path& path,
                                                  std::string_view name) const;

   private:
    std::shared_ptr<outlook::outlook_reader_t> m_outlook_reader;
};

// Parser using the libolecf container reader.
std::shared_ptr<email_parser_t> make_email_parser();

}  // namespace mailnorm
