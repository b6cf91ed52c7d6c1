#ifdef DS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace DS {

namespace {

// DDRSYNC_LOG set to anything but "" or "0" turns logging on at startup.
bool enabled_by_env() {
    const char* raw = std::getenv("DDRSYNC_LOG");
    return raw != nullptr && *raw != '\0' && std::strcmp(raw, "0") != 0;
}

// "src/ddrsync/sync/SyncOrchestrator.cpp" -> "sync/SyncOrchestrator.cpp"
std::string location_label(const std::source_location& location) {
    std::filesystem::path path{location.file_name()};
    auto                  label = path.has_parent_path() ? path.parent_path().filename() / path.filename() : path.filename();
    return label.string() + ":" + std::to_string(location.line());
}

} // namespace

std::mutex TaggedLogger::outputMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : enabled_(enabled_by_env()) {
    worker_ = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_one();
    worker_.join();
}

auto TaggedLogger::set_thread_name(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(names_mutex_);
    thread_names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::set_enabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::set_skip_tags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(skip_mutex_);
    skip_tags_ = std::move(tags);
}

auto TaggedLogger::skipped(const std::set<std::string>& tags) const -> bool {
    std::lock_guard<std::mutex> lock(skip_mutex_);
    for (auto const& tag : tags) {
        if (skip_tags_.contains(tag))
            return true;
    }
    return false;
}

auto TaggedLogger::thread_name() -> std::string {
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto [it, inserted] = thread_names_.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(unnamed_threads_++);
    return it->second;
}

// Worker loop: writes everything queued, exits once stopping with nothing left.
auto TaggedLogger::drain() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty())
            return;
        auto entry = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        write(entry);
        lock.lock();
    }
}

auto TaggedLogger::write(const Entry& entry) const -> void {
    auto const time   = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : entry.tags)
        line << '[' << tag << ']';
    line << " [" << entry.thread << "] [" << location_label(entry.location) << "] " << entry.message << '\n';

    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << line.str() << std::flush;
}

void set_thread_name(const std::string& name) {
    logger().set_thread_name(name);
}

void set_logging_enabled(bool enabled) {
    logger().set_enabled(enabled);
}

} // namespace DS
#endif // DS_LOG_DEBUG
