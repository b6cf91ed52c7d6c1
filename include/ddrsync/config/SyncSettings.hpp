#pragma once

#include <ddrsync/remote/PlaybackDeviceClient.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace DS::Config {

inline constexpr int kDefaultAutoSyncInterval = 3;
inline constexpr int kMinAutoSyncInterval     = 2;
inline constexpr int kMaxAutoSyncInterval     = 10;

// Remote field ids driving one slot's on-air timer. Any of them may be
// missing; sync reports that as NotConfigured when it matters.
struct TimerFieldSet {
    std::optional<std::string> minutes_field;
    std::optional<std::string> seconds_field;
    std::optional<std::string> timer_field;

    auto has_duration_fields() const -> bool { return minutes_field.has_value() && seconds_field.has_value(); }
    auto operator==(TimerFieldSet const&) const -> bool = default;
};

enum class RoundMode {
    Frames,
    None,
};

auto to_string(RoundMode mode) -> std::string_view;
auto parse_round_mode(std::string_view text) -> std::optional<RoundMode>;

struct SyncSettings {
    // app name -> control app token
    std::map<std::string, std::string> control_tokens;
    // control app token used for timer sync
    std::string                        sync_token;
    std::map<int, TimerFieldSet>       timer_fields;
    RoundMode                          round_mode{RoundMode::Frames};
    Remote::DeviceEndpoint             device;
    bool                               auto_sync{false};
    int                                auto_sync_interval_seconds{kDefaultAutoSyncInterval};
};

[[nodiscard]] auto clamp_auto_sync_interval(int seconds) -> int;

} // namespace DS::Config
