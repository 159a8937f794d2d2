#include "oxmsg_properties.hpp"

namespace mailnorm::outlook {

namespace {
constexpr size_t property_entry_size = 16;
constexpr uint64_t filetime_ticks_per_second = 10'000'000;
constexpr int64_t filetime_epoch_offset = 11'644'473'600;

uint64_t load_le(std::string_view bytes, size_t offset, size_t width) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(bytes[offset + i])) << (8 * i);
    }
    return value;
}
}  // namespace

std::optional<uint64_t> find_fixed_property(std::string_view properties_stream, size_t header_size,
                                            uint32_t property_tag) {
    for (size_t ofs = header_size; ofs + property_entry_size <= properties_stream.size();
         ofs += property_entry_size) {
        // tag (4), flags (4), value (8)
        if (static_cast<uint32_t>(load_le(properties_stream, ofs, 4)) == property_tag) {
            return load_le(properties_stream, ofs + 8, 8);
        }
    }
    return std::nullopt;
}

std::optional<int64_t> filetime_to_unix(uint64_t filetime) {
    if (filetime == 0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(filetime / filetime_ticks_per_second) - filetime_epoch_offset;
}

}  // namespace mailnorm::outlook
