#pragma once

#include <optional>
#include <string_view>

namespace DS::Timecode {

struct MinutesSeconds {
    int    minutes{0};
    double seconds{0.0};

    auto operator==(MinutesSeconds const&) const -> bool = default;
};

// Accepts "H:MM:SS.ff", "MM:SS.ff" or a bare number. Anything else is absent,
// which callers must keep distinct from zero.
[[nodiscard]] auto parse_timecode(std::string_view text) -> std::optional<double>;

// Rounds to two decimals, nudged so a value sitting on a boundary never rounds down.
[[nodiscard]] auto round_seconds(double value) -> double;

// Splits a duration into whole minutes and remaining seconds. Negative input
// clamps to zero and totals beyond the int minute range clamp to its top. With round_to_frames and a positive framerate the total is
// snapped to the nearest frame first. The returned seconds are always < 60.
[[nodiscard]] auto split_duration(double                total_seconds,
                                  std::optional<double> framerate,
                                  bool                  round_to_frames) -> MinutesSeconds;

} // namespace DS::Timecode
