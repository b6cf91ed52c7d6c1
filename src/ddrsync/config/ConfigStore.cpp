#include <ddrsync/config/ConfigStore.hpp>
#include <ddrsync/config/SettingsFile.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace DS::Config {

ConfigStore::ConfigStore(SyncSettings initial, std::optional<std::filesystem::path> path)
    : settings_(std::move(initial))
    , path_(std::move(path)) {
    settings_.auto_sync_interval_seconds = clamp_auto_sync_interval(settings_.auto_sync_interval_seconds);
}

auto ConfigStore::snapshot() const -> SyncSettings {
    std::lock_guard const lock{mutex_};
    return settings_;
}

auto ConfigStore::persist(SyncSettings const& settings) const -> DS::Expected<void> {
    if (!path_) {
        return {};
    }
    auto saved = save_settings_file(*path_, settings);
    if (!saved) {
        ds_log("Failed to save settings: " + DS::describeError(saved.error()), "Config", "ERROR");
    }
    return saved;
}

auto ConfigStore::update(std::function<void(SyncSettings&)> const& mutate) -> DS::Expected<void> {
    SyncSettings updated;
    {
        std::lock_guard const lock{mutex_};
        mutate(settings_);
        settings_.auto_sync_interval_seconds = clamp_auto_sync_interval(settings_.auto_sync_interval_seconds);
        updated = settings_;
    }
    return persist(updated);
}

auto ConfigStore::save_timer_sync(std::string sync_token, RoundMode round_mode, std::map<int, TimerFieldSet> timer_fields)
        -> DS::Expected<void> {
    auto saved = update([&](SyncSettings& settings) {
        settings.sync_token   = std::move(sync_token);
        settings.round_mode   = round_mode;
        settings.timer_fields = std::move(timer_fields);
    });

    std::vector<std::function<void()>> listeners;
    {
        std::lock_guard const lock{mutex_};
        listeners = timer_sync_listeners_;
    }
    // The in-memory settings changed even if the file write failed, so the
    // listeners run either way.
    for (auto const& listener : listeners) {
        listener();
    }
    return saved;
}

void ConfigStore::on_timer_sync_saved(std::function<void()> listener) {
    std::lock_guard const lock{mutex_};
    timer_sync_listeners_.push_back(std::move(listener));
}

} // namespace DS::Config
