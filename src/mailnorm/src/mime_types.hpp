#pragma once
#include <mailnorm/global.hpp>

#include <string>
#include <string_view>

namespace mailnorm::mime_types {

inline constexpr std::string_view default_content_type = "application/octet-stream";

// MIME type for the extension of `filename` (case-insensitive), empty when unknown.
std::optional<std::string> guess_from_filename(std::string_view filename);

// Declared type if present, otherwise a guess from the filename, otherwise the default.
std::string resolve_content_type(const std::optional<std::string>& declared,
                                 const std::optional<std::string>& filename);

}  // namespace mailnorm::mime_types
