#include <ddrsync/config/SyncSettings.hpp>

#include <algorithm>
#include <cctype>

namespace DS::Config {

auto to_string(RoundMode mode) -> std::string_view {
    switch (mode) {
    case RoundMode::Frames:
        return "frames";
    case RoundMode::None:
        return "none";
    }
    return "frames";
}

auto parse_round_mode(std::string_view text) -> std::optional<RoundMode> {
    std::string normalized;
    normalized.reserve(text.size());
    for (unsigned char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (normalized == "frames") {
        return RoundMode::Frames;
    }
    if (normalized == "none") {
        return RoundMode::None;
    }
    return std::nullopt;
}

auto clamp_auto_sync_interval(int seconds) -> int {
    return std::clamp(seconds, kMinAutoSyncInterval, kMaxAutoSyncInterval);
}

} // namespace DS::Config
