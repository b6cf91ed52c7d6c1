#ifdef DS_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace DS {

// Tagged messages are queued by the caller and written to stderr by one worker
// thread as "time [tag][tag] [thread] [dir/file:line] message".
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           thread;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto set_thread_name(const std::string& name) -> void;
    auto set_enabled(bool enabled) -> void;
    // Messages carrying any of these tags are dropped before they are queued.
    auto set_skip_tags(std::set<std::string> tags) -> void;

    // Held while a line is written so test listeners do not interleave with it.
    static std::mutex outputMutex;

private:
    auto skipped(const std::set<std::string>& tags) const -> bool;
    auto thread_name() -> std::string;
    auto drain() -> void;
    auto write(const Entry& entry) const -> void;

    std::queue<Entry>       queue_;
    std::mutex              queue_mutex_;
    std::condition_variable queue_cv_;
    bool                    stopping_{false};
    std::thread             worker_;
    std::atomic<bool>       enabled_;

    std::set<std::string> skip_tags_{"FieldCache", "Transport"};
    mutable std::mutex    skip_mutex_;

    std::unordered_map<std::thread::id, std::string> thread_names_;
    std::mutex                                       names_mutex_;
    int                                              unnamed_threads_{0};
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed))
        return;

    Entry entry{std::chrono::system_clock::now(), {std::forward<Tags>(tags)...}, message, {}, location};
    if (skipped(entry.tags))
        return;
    entry.thread = thread_name();

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push(std::move(entry));
    queue_cv_.notify_one();
}

#define ds_log(message, ...) ::DS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace DS

#else
#define ds_log(message, ...) ((void)0)
#endif // DS_LOG_DEBUG
