#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace mailnorm::outlook {

// MS-OXMSG fixed-size property entries, as stored in `__properties_version1.0`.

// Header sizes in front of the 16-byte entries.
inline constexpr size_t top_level_properties_header_size = 32;
inline constexpr size_t embedded_properties_header_size = 24;
inline constexpr size_t storage_properties_header_size = 8;

inline constexpr uint16_t pt_systime = 0x0040;
inline constexpr uint16_t pid_client_submit_time = 0x0039;
inline constexpr uint16_t pid_message_delivery_time = 0x0E06;

constexpr uint32_t make_property_tag(uint16_t property_id, uint16_t property_type) {
    return (static_cast<uint32_t>(property_id) << 16) | property_type;
}

// The 8-byte immediate value of the entry tagged `property_tag`. Empty when the stream has no such
// entry. A truncated trailing entry is ignored.
std::optional<uint64_t> find_fixed_property(std::string_view properties_stream, size_t header_size,
                                            uint32_t property_tag);

// FILETIME (100ns ticks since 1601-01-01) to POSIX seconds. Zero means "not set" and gives an
// empty result.
std::optional<int64_t> filetime_to_unix(uint64_t filetime);

}  // namespace mailnorm::outlook
