#include <ddrsync/control/EventLog.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

namespace DS::Control {

EventLog::EventLog(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void EventLog::record(std::string_view kind, std::string_view detail) {
    auto    now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string line{"["};
    line.append(stamp);
    line.append("] ");
    line.append(kind);
    line.append(": ");
    line.append(detail);
    ds_log(line, "Events");

    std::lock_guard const lock{mutex_};
    lines_.push_back(std::move(line));
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

auto EventLog::recent(std::size_t limit) const -> std::vector<std::string> {
    std::lock_guard const lock{mutex_};
    auto const            count = std::min(limit, lines_.size());
    return std::vector<std::string>(lines_.end() - static_cast<std::ptrdiff_t>(count), lines_.end());
}

auto EventLog::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return lines_.size();
}

} // namespace DS::Control
