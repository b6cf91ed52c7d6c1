#pragma once

#include <ddrsync/catalog/FieldResolutionCache.hpp>
#include <ddrsync/config/ConfigStore.hpp>
#include <ddrsync/config/SyncSettings.hpp>
#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/ControlAppClient.hpp>
#include <ddrsync/remote/HttpTransport.hpp>
#include <ddrsync/remote/PlaybackDeviceClient.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace DS::Sync {

enum class TimerCommand {
    Start,
    Pause,
    Reset,
};

auto to_string(TimerCommand command) -> std::string_view;
auto parse_timer_command(std::string_view text) -> std::optional<TimerCommand>;

struct SyncResult {
    int                   slot{0};
    double                duration_seconds{0.0};
    int                   minutes{0};
    double                seconds{0.0};
    std::optional<double> framerate;
    Config::RoundMode     round_mode{Config::RoundMode::Frames};
};

struct SlotError {
    int       slot{0};
    DS::Error error;
};

struct SyncAllReport {
    std::vector<SyncResult> results;
    std::vector<SlotError>  errors;

    auto ok() const -> bool { return errors.empty(); }
};

struct RestartAllReport {
    std::vector<int>       restarted;
    std::vector<SlotError> errors;

    auto ok() const -> bool { return errors.empty(); }
};

// Last (minutes, seconds) pushed for a slot, seconds rounded to 2 decimals.
struct AppliedValue {
    int    minutes{0};
    double seconds{0.0};

    auto operator==(AppliedValue const&) const -> bool = default;
};

struct AutoSyncStatus {
    bool                        enabled{false};
    bool                        running{false};
    int                         interval_seconds{Config::kDefaultAutoSyncInterval};
    std::optional<std::string>  last_sync;
    std::optional<std::string>  last_error;
    std::map<int, AppliedValue> cached_values;
};

enum class AutoSyncTransition {
    Started,
    Stopped,
    Unchanged,
};

struct SyncOrchestratorOptions {
    std::chrono::milliseconds                restart_delay{50};
    // Replaces the configured interval between polls when set.
    std::optional<std::chrono::milliseconds> poll_interval;
};

/**
 * Mirrors playback-slot durations onto the control app's timer fields.
 *
 * Every operation reads a fresh settings snapshot. On-demand calls run on the
 * caller's thread and return the first failure untouched. The auto-sync
 * worker runs the same patch path, pushes a slot only when its rounded
 * (minutes, seconds) pair differs from the last applied one, and turns
 * failures into last_error instead of stopping.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(Config::ConfigStore&            config,
                     Remote::HttpTransport&          device_transport,
                     Remote::ControlAppClient const& control,
                     Catalog::FieldResolutionCache&  field_cache,
                     SyncOrchestratorOptions         options = {});
    ~SyncOrchestrator();

    SyncOrchestrator(SyncOrchestrator const&)            = delete;
    SyncOrchestrator& operator=(SyncOrchestrator const&) = delete;

    auto sync_one(int slot) -> DS::Expected<SyncResult>;
    auto sync_all() -> SyncAllReport;

    auto send_timer_command(int slot, TimerCommand command) -> DS::Expected<void>;
    // pause, fixed delay, reset. Not atomic: a failed reset leaves the timer paused.
    auto restart(int slot) -> DS::Expected<void>;
    auto restart_all() -> RestartAllReport;

    // Returns false when a worker is already running.
    auto start_auto_sync() -> bool;
    // Signals the worker and joins it before returning.
    void stop_auto_sync();
    // Stores the toggle (and clamped interval), then starts or stops the worker.
    auto configure_auto_sync(bool enabled, std::optional<int> interval_seconds) -> DS::Expected<AutoSyncTransition>;

    // One polling pass over every slot, as the worker does between waits.
    void poll_once();

    auto status() const -> AutoSyncStatus;
    auto is_running() const -> bool { return running_.load(std::memory_order_acquire); }

private:
    auto device_for(Config::SyncSettings const& settings) const -> Remote::PlaybackDeviceClient;
    auto sync_slot(Config::SyncSettings const&                settings,
                   int                                        slot,
                   std::optional<Remote::SlotDuration> const& prefetched) -> DS::Expected<SyncResult>;
    auto send_command(Config::SyncSettings const& settings, int slot, TimerCommand command) -> DS::Expected<void>;
    auto patch_fields(std::string const& token, std::map<std::string, nlohmann::json> const& values)
            -> DS::Expected<void>;

    void poll(Config::SyncSettings const& settings);
    void run();
    void wait_for_next_poll(Config::SyncSettings const& settings);

    Config::ConfigStore&            config_;
    Remote::HttpTransport&          device_transport_;
    Remote::ControlAppClient const& control_;
    Catalog::FieldResolutionCache&  field_cache_;
    SyncOrchestratorOptions         options_;

    mutable std::mutex          state_mutex_;
    std::map<int, AppliedValue> applied_;
    std::optional<std::string>  last_sync_;
    std::optional<std::string>  last_error_;

    std::mutex              worker_mutex_;
    std::thread             worker_;
    std::atomic<bool>       running_{false};
    std::atomic<bool>       stop_requested_{false};
    std::mutex              wait_mutex_;
    std::condition_variable wake_;
};

} // namespace DS::Sync
