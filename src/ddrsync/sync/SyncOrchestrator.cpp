#include <ddrsync/sync/SyncOrchestrator.hpp>
#include <ddrsync/timecode/DurationCodec.hpp>

#include "log/TaggedLogger.hpp"

#include <ctime>
#include <set>
#include <utility>

namespace DS::Sync {

namespace {

using json = nlohmann::json;

auto slot_label(int slot) -> std::string {
    return "DDR " + std::to_string(slot);
}

auto not_configured(std::string message) -> std::unexpected<DS::Error> {
    return std::unexpected(DS::Error{DS::Error::Code::NotConfigured, std::move(message)});
}

auto clock_time_now() -> std::string {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[16]{};
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
    return buffer;
}

auto applied_value(Timecode::MinutesSeconds const& split) -> AppliedValue {
    return AppliedValue{split.minutes, Timecode::round_seconds(split.seconds)};
}

} // namespace

auto to_string(TimerCommand command) -> std::string_view {
    switch (command) {
    case TimerCommand::Start:
        return "start";
    case TimerCommand::Pause:
        return "pause";
    case TimerCommand::Reset:
        return "reset";
    }
    return "start";
}

auto parse_timer_command(std::string_view text) -> std::optional<TimerCommand> {
    if (text == "start") {
        return TimerCommand::Start;
    }
    if (text == "pause") {
        return TimerCommand::Pause;
    }
    if (text == "reset") {
        return TimerCommand::Reset;
    }
    return std::nullopt;
}

SyncOrchestrator::SyncOrchestrator(Config::ConfigStore&            config,
                                   Remote::HttpTransport&          device_transport,
                                   Remote::ControlAppClient const& control,
                                   Catalog::FieldResolutionCache&  field_cache,
                                   SyncOrchestratorOptions         options)
    : config_(config)
    , device_transport_(device_transport)
    , control_(control)
    , field_cache_(field_cache)
    , options_(options) {}

SyncOrchestrator::~SyncOrchestrator() {
    stop_auto_sync();
}

auto SyncOrchestrator::device_for(Config::SyncSettings const& settings) const -> Remote::PlaybackDeviceClient {
    return Remote::PlaybackDeviceClient{device_transport_, settings.device};
}

auto SyncOrchestrator::patch_fields(std::string const& token, std::map<std::string, json> const& values)
        -> DS::Expected<void> {
    std::set<std::string> field_ids;
    for (auto const& [field_id, value] : values) {
        field_ids.insert(field_id);
    }
    auto owners = field_cache_.resolve_fields(token, field_ids);
    if (!owners) {
        return std::unexpected(owners.error());
    }

    // The control endpoint takes one payload per owning composition.
    std::map<std::string, json> grouped;
    for (auto const& [field_id, value] : values) {
        auto owner = owners->find(field_id);
        if (owner == owners->end()) {
            return std::unexpected(DS::Error{DS::Error::Code::FieldNotResolved,
                                             "field '" + field_id + "' not found in control app model"});
        }
        grouped[owner->second][field_id] = value;
    }

    json items = json::array();
    for (auto& [composition_id, payload] : grouped) {
        items.push_back(json{{"subCompositionId", composition_id}, {"payload", std::move(payload)}});
    }
    auto patched = control_.patch_control(token, items);
    if (!patched) {
        return std::unexpected(patched.error());
    }
    return {};
}

auto SyncOrchestrator::sync_slot(Config::SyncSettings const&                settings,
                                 int                                        slot,
                                 std::optional<Remote::SlotDuration> const& prefetched) -> DS::Expected<SyncResult> {
    if (settings.sync_token.empty()) {
        return not_configured("no control app token configured for timer sync");
    }
    auto fields = settings.timer_fields.find(slot);
    if (fields == settings.timer_fields.end()) {
        return not_configured("no timer fields configured for " + slot_label(slot));
    }
    if (!fields->second.has_duration_fields()) {
        return not_configured(slot_label(slot) + " missing 'min' or 'sec' field configuration");
    }

    Remote::SlotDuration duration;
    if (prefetched) {
        duration = *prefetched;
    } else {
        auto fetched = device_for(settings).fetch_slot_duration(slot);
        if (!fetched) {
            return std::unexpected(fetched.error());
        }
        duration = *fetched;
    }

    auto const split = Timecode::split_duration(duration.seconds,
                                                duration.framerate,
                                                settings.round_mode == Config::RoundMode::Frames);

    std::map<std::string, json> values;
    values[*fields->second.minutes_field] = split.minutes;
    values[*fields->second.seconds_field] = split.seconds;
    if (auto patched = patch_fields(settings.sync_token, values); !patched) {
        return std::unexpected(patched.error());
    }

    {
        std::lock_guard const lock{state_mutex_};
        applied_[slot] = applied_value(split);
    }
    ds_log(slot_label(slot) + " synced: " + std::to_string(split.minutes) + "m " + std::to_string(split.seconds) + "s",
           "Sync");
    return SyncResult{slot, duration.seconds, split.minutes, split.seconds, duration.framerate, settings.round_mode};
}

auto SyncOrchestrator::sync_one(int slot) -> DS::Expected<SyncResult> {
    return sync_slot(config_.snapshot(), slot, std::nullopt);
}

auto SyncOrchestrator::sync_all() -> SyncAllReport {
    auto const    settings = config_.snapshot();
    SyncAllReport report;
    for (auto const& [slot, fields] : settings.timer_fields) {
        auto result = sync_slot(settings, slot, std::nullopt);
        if (result) {
            report.results.push_back(*result);
        } else {
            report.errors.push_back(SlotError{slot, result.error()});
        }
    }
    return report;
}

auto SyncOrchestrator::send_command(Config::SyncSettings const& settings, int slot, TimerCommand command)
        -> DS::Expected<void> {
    if (settings.sync_token.empty()) {
        return not_configured("no control app token configured for timer sync");
    }
    auto fields = settings.timer_fields.find(slot);
    if (fields == settings.timer_fields.end()) {
        return not_configured("no timer fields configured for " + slot_label(slot));
    }
    if (!fields->second.timer_field) {
        return not_configured(slot_label(slot) + " missing 'timer' field configuration");
    }
    std::map<std::string, json> values;
    values[*fields->second.timer_field] = json{{"command", std::string{to_string(command)}}};
    if (auto patched = patch_fields(settings.sync_token, values); !patched) {
        return patched;
    }
    ds_log(slot_label(slot) + " timer " + std::string{to_string(command)}, "Sync");
    return {};
}

auto SyncOrchestrator::send_timer_command(int slot, TimerCommand command) -> DS::Expected<void> {
    return send_command(config_.snapshot(), slot, command);
}

auto SyncOrchestrator::restart(int slot) -> DS::Expected<void> {
    auto const settings = config_.snapshot();
    if (auto paused = send_command(settings, slot, TimerCommand::Pause); !paused) {
        return paused;
    }
    std::this_thread::sleep_for(options_.restart_delay);
    return send_command(settings, slot, TimerCommand::Reset);
}

auto SyncOrchestrator::restart_all() -> RestartAllReport {
    auto const       settings = config_.snapshot();
    RestartAllReport report;
    for (auto const& [slot, fields] : settings.timer_fields) {
        auto restarted = send_command(settings, slot, TimerCommand::Pause);
        if (restarted) {
            std::this_thread::sleep_for(options_.restart_delay);
            restarted = send_command(settings, slot, TimerCommand::Reset);
        }
        if (restarted) {
            report.restarted.push_back(slot);
        } else {
            report.errors.push_back(SlotError{slot, restarted.error()});
        }
    }
    return report;
}

void SyncOrchestrator::poll(Config::SyncSettings const& settings) {
    if (settings.device.host.empty() || settings.sync_token.empty()) {
        return;
    }

    auto const                 device = device_for(settings);
    std::optional<std::string> iteration_error;
    auto record_failure = [&](int slot, DS::Error const& error) {
        auto message = slot_label(slot) + ": " + DS::describeError(error);
        ds_log(message, "AutoSync", "ERROR");
        if (!iteration_error) {
            iteration_error = std::move(message);
        }
    };

    for (auto const& [slot, fields] : settings.timer_fields) {
        if (!fields.has_duration_fields()) {
            continue;
        }
        auto duration = device.fetch_slot_duration(slot);
        if (!duration) {
            record_failure(slot, duration.error());
            continue;
        }
        auto const current = applied_value(Timecode::split_duration(duration->seconds,
                                                                    duration->framerate,
                                                                    settings.round_mode == Config::RoundMode::Frames));
        {
            std::lock_guard const lock{state_mutex_};
            if (auto it = applied_.find(slot); it != applied_.end() && it->second == current) {
                continue;
            }
        }
        auto synced = sync_slot(settings, slot, *duration);
        if (!synced) {
            record_failure(slot, synced.error());
            continue;
        }
        std::lock_guard const lock{state_mutex_};
        last_sync_ = clock_time_now();
    }

    std::lock_guard const lock{state_mutex_};
    last_error_ = std::move(iteration_error);
}

void SyncOrchestrator::poll_once() {
    poll(config_.snapshot());
}

void SyncOrchestrator::wait_for_next_poll(Config::SyncSettings const& settings) {
    auto interval = options_.poll_interval.value_or(
            std::chrono::seconds{Config::clamp_auto_sync_interval(settings.auto_sync_interval_seconds)});
    std::unique_lock lock{wait_mutex_};
    wake_.wait_for(lock, interval, [this] { return stop_requested_.load(std::memory_order_acquire); });
}

void SyncOrchestrator::run() {
    ds_log("Auto-sync started", "AutoSync");
    while (true) {
        {
            // Deciding to exit under the worker lock keeps start_auto_sync from
            // seeing a running worker that is about to leave.
            std::lock_guard const lock{worker_mutex_};
            if (stop_requested_.load(std::memory_order_acquire) || !config_.snapshot().auto_sync) {
                running_.store(false, std::memory_order_release);
                break;
            }
        }
        auto const settings = config_.snapshot();
        poll(settings);
        wait_for_next_poll(settings);
    }
    ds_log("Auto-sync stopped", "AutoSync");
}

auto SyncOrchestrator::start_auto_sync() -> bool {
    std::lock_guard const lock{worker_mutex_};
    if (running_.load(std::memory_order_acquire)) {
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    {
        std::lock_guard const wait_lock{wait_mutex_};
        stop_requested_.store(false, std::memory_order_release);
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] {
#ifdef DS_LOG_DEBUG
        DS::set_thread_name("AutoSync");
#endif
        run();
    });
    return true;
}

void SyncOrchestrator::stop_auto_sync() {
    std::thread worker;
    {
        std::lock_guard const lock{worker_mutex_};
        {
            std::lock_guard const wait_lock{wait_mutex_};
            stop_requested_.store(true, std::memory_order_release);
        }
        worker = std::move(worker_);
    }
    wake_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    running_.store(false, std::memory_order_release);
}

auto SyncOrchestrator::configure_auto_sync(bool enabled, std::optional<int> interval_seconds)
        -> DS::Expected<AutoSyncTransition> {
    auto saved = config_.update([&](Config::SyncSettings& settings) {
        if (interval_seconds) {
            settings.auto_sync_interval_seconds = Config::clamp_auto_sync_interval(*interval_seconds);
        }
        settings.auto_sync = enabled;
    });

    auto transition = AutoSyncTransition::Unchanged;
    if (enabled && !is_running()) {
        if (start_auto_sync()) {
            transition = AutoSyncTransition::Started;
        }
    } else if (!enabled && is_running()) {
        stop_auto_sync();
        transition = AutoSyncTransition::Stopped;
    }

    if (!saved) {
        return std::unexpected(saved.error());
    }
    return transition;
}

auto SyncOrchestrator::status() const -> AutoSyncStatus {
    auto const     settings = config_.snapshot();
    AutoSyncStatus status;
    status.enabled          = settings.auto_sync;
    status.running          = is_running();
    status.interval_seconds = settings.auto_sync_interval_seconds;
    std::lock_guard const lock{state_mutex_};
    status.last_sync     = last_sync_;
    status.last_error    = last_error_;
    status.cached_values = applied_;
    return status;
}

} // namespace DS::Sync
