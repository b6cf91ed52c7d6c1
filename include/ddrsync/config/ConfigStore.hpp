#pragma once

#include <ddrsync/config/SyncSettings.hpp>
#include <ddrsync/core/Error.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace DS::Config {

/**
 * Thread-safe holder of the current SyncSettings.
 *
 * Callers take a snapshot per operation instead of keeping a copy. When a
 * path is set every change is written back to the settings file. Listeners
 * registered with on_timer_sync_saved run after save_timer_sync, outside the
 * lock.
 */
class ConfigStore {
public:
    ConfigStore() = default;
    explicit ConfigStore(SyncSettings initial, std::optional<std::filesystem::path> path = std::nullopt);

    ConfigStore(ConfigStore const&)            = delete;
    ConfigStore& operator=(ConfigStore const&) = delete;

    auto snapshot() const -> SyncSettings;

    // Applies `mutate` under the lock, then persists. The in-memory change
    // stands even when writing the file fails; the write error is returned.
    auto update(std::function<void(SyncSettings&)> const& mutate) -> DS::Expected<void>;

    auto save_timer_sync(std::string sync_token, RoundMode round_mode, std::map<int, TimerFieldSet> timer_fields)
            -> DS::Expected<void>;

    void on_timer_sync_saved(std::function<void()> listener);

    auto path() const -> std::optional<std::filesystem::path> const& { return path_; }

private:
    auto persist(SyncSettings const& settings) const -> DS::Expected<void>;

    mutable std::mutex                   mutex_;
    SyncSettings                         settings_;
    std::optional<std::filesystem::path> path_;
    std::vector<std::function<void()>>   timer_sync_listeners_;
};

} // namespace DS::Config
