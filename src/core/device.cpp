#include "core/device.hpp"

#include <cctype>

namespace cliped {

std::string normalize_device_name(std::string_view name) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    size_t begin = 0;
    size_t end = name.size();
    while (begin < end && is_space(name[begin])) ++begin;
    while (end > begin && is_space(name[end - 1])) --end;
    return std::string(name.substr(begin, end - begin));
}

std::optional<SyncMode> sync_mode_from_string(std::string_view text) {
    if (text == "total") return SyncMode::Total;
    if (text == "partial") return SyncMode::Partial;
    if (text == "disabled") return SyncMode::Disabled;
    return std::nullopt;
}

} // namespace cliped
