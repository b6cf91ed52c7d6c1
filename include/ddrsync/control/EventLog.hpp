#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace DS::Control {

inline constexpr std::size_t kEventLogCapacity = 200;

// Bounded operator-facing history, one "[YYYY-mm-dd HH:MM:SS] KIND: detail"
// line per action. The oldest lines fall off once capacity is reached.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = kEventLogCapacity);

    void record(std::string_view kind, std::string_view detail);

    // Up to `limit` most recent lines, oldest first.
    auto recent(std::size_t limit) const -> std::vector<std::string>;
    auto size() const -> std::size_t;

private:
    mutable std::mutex      mutex_;
    std::deque<std::string> lines_;
    std::size_t             capacity_;
};

} // namespace DS::Control
