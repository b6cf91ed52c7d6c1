#include <ddrsync/timecode/DurationCodec.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string_view>
#include <system_error>

namespace DS::Timecode {

namespace {

// Absorbs binary representation error so 0.125 style boundaries round up.
constexpr double kRoundingBias = 1e-9;

// Largest total whose minute count still fits an int after the carry below.
constexpr double kMaxDurationSeconds = static_cast<double>(std::numeric_limits<int>::max() - 1) * 60.0;

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

std::string_view strip_plus(std::string_view value) {
    if (value.size() > 1 && value.front() == '+') {
        value.remove_prefix(1);
    }
    return value;
}

std::optional<long long> parse_whole(std::string_view text) {
    text = strip_plus(trim(text));
    if (text.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_real(std::string_view text) {
    text = strip_plus(trim(text));
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto parse_timecode(std::string_view text) -> std::optional<double> {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed.find(':') == std::string_view::npos) {
        return parse_real(trimmed);
    }

    std::array<std::string_view, 3> parts{};
    std::size_t                     count = 0;
    std::size_t                     start = 0;
    while (true) {
        auto colon = trimmed.find(':', start);
        if (count == parts.size()) {
            return std::nullopt;
        }
        if (colon == std::string_view::npos) {
            parts[count++] = trimmed.substr(start);
            break;
        }
        parts[count++] = trimmed.substr(start, colon - start);
        start          = colon + 1;
    }

    if (count == 3) {
        auto hours   = parse_whole(parts[0]);
        auto minutes = parse_whole(parts[1]);
        auto seconds = parse_real(parts[2]);
        if (!hours || !minutes || !seconds) {
            return std::nullopt;
        }
        return static_cast<double>(*hours) * 3600.0 + static_cast<double>(*minutes) * 60.0 + *seconds;
    }
    if (count == 2) {
        auto minutes = parse_whole(parts[0]);
        auto seconds = parse_real(parts[1]);
        if (!minutes || !seconds) {
            return std::nullopt;
        }
        return static_cast<double>(*minutes) * 60.0 + *seconds;
    }
    return std::nullopt;
}

auto round_seconds(double value) -> double {
    return std::round((value + kRoundingBias) * 100.0) / 100.0;
}

auto split_duration(double                total_seconds,
                    std::optional<double> framerate,
                    bool                  round_to_frames) -> MinutesSeconds {
    double total = std::isfinite(total_seconds) ? std::clamp(total_seconds, 0.0, kMaxDurationSeconds) : 0.0;
    if (round_to_frames && framerate && std::isfinite(*framerate) && *framerate > 0.0) {
        auto snapped = std::round(total * *framerate) / *framerate;
        if (std::isfinite(snapped)) {
            total = std::clamp(snapped, 0.0, kMaxDurationSeconds);
        }
    }

    auto minutes = static_cast<int>(std::floor(total / 60.0));
    auto seconds = std::max(0.0, round_seconds(total - static_cast<double>(minutes) * 60.0));
    if (seconds >= 60.0) {
        minutes += 1;
        seconds = 0.0;
    }
    return MinutesSeconds{minutes, seconds};
}

} // namespace DS::Timecode
