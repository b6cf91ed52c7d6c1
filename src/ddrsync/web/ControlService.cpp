#include <ddrsync/web/ControlService.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace DS::Web {

ControlService::ControlService(Config::SyncSettings                 settings,
                               std::optional<std::filesystem::path> settings_path,
                               Remote::HttpTransport&               control_transport,
                               Remote::HttpTransport&               device_transport,
                               std::string                          api_base,
                               Sync::SyncOrchestratorOptions        sync_options)
    : config_(std::move(settings), std::move(settings_path))
    , device_transport_(device_transport)
    , control_(control_transport, std::move(api_base))
    , registry_(control_)
    , field_cache_(control_)
    , actions_(registry_, control_, events_)
    , orchestrator_(config_, device_transport, control_, field_cache_, sync_options) {
    config_.on_timer_sync_saved([this]() {
        field_cache_.invalidate();
        ds_log("Timer sync settings saved, field cache cleared", "FieldCache");
    });
}

auto ControlService::bootstrap() -> Catalog::RebuildReport {
    auto const settings = config_.snapshot();
    auto       report   = registry_.rebuild_all(settings.control_tokens);
    for (auto const& app : report.apps) {
        if (app.error) {
            ds_log("Registry build failed for " + app.app_name + ": " + DS::describeError(*app.error), "Registry", "WARN");
        }
    }
    if (settings.auto_sync) {
        orchestrator_.start_auto_sync();
    }
    return report;
}

auto ControlService::context(int port) -> ServerContext {
    return ServerContext{config_, registry_, field_cache_, orchestrator_, actions_, events_, device_transport_, port};
}

} // namespace DS::Web
