#pragma once
#include <mailnorm/global.hpp>
#include <mailnorm/types.hpp>

#include "email_parser.hpp"

#include <filesystem>
#include <vector>

namespace mailnorm::mail_directory {

// All *.msg files below `folder` (recursively), sorted by path. Empty for a missing folder.
std::vector<std::filesystem::path> list_message_files(const std::filesystem::path& folder);

// Summary built from filesystem data alone, for files the parser rejects.
types::EmailSummary make_placeholder_summary(const std::filesystem::path& path);

std::vector<types::EmailSummary> summarize_directory(const email_parser_t& parser,
                                                     const std::filesystem::path& folder);

}  // namespace mailnorm::mail_directory
