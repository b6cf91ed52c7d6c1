#pragma once

#include <ddrsync/catalog/FieldResolutionCache.hpp>
#include <ddrsync/catalog/Registry.hpp>
#include <ddrsync/config/ConfigStore.hpp>
#include <ddrsync/config/SyncSettings.hpp>
#include <ddrsync/control/ControlActions.hpp>
#include <ddrsync/control/EventLog.hpp>
#include <ddrsync/remote/ControlAppClient.hpp>
#include <ddrsync/remote/HttpTransport.hpp>
#include <ddrsync/sync/SyncOrchestrator.hpp>
#include <ddrsync/web/ControlServer.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace DS::Web {

/**
 * Owns the component graph behind the control server, wired in dependency
 * order. Saving timer-sync settings clears the field resolution cache.
 * The transports are borrowed and must outlive the service.
 */
class ControlService {
public:
    ControlService(Config::SyncSettings                 settings,
                   std::optional<std::filesystem::path> settings_path,
                   Remote::HttpTransport&               control_transport,
                   Remote::HttpTransport&               device_transport,
                   std::string                          api_base     = std::string{Remote::kDefaultControlApiBase},
                   Sync::SyncOrchestratorOptions        sync_options = {});

    ControlService(ControlService const&)            = delete;
    ControlService& operator=(ControlService const&) = delete;

    // Rebuilds the registry from the configured apps and starts the
    // auto-sync worker when the settings ask for it.
    auto bootstrap() -> Catalog::RebuildReport;

    auto context(int port) -> ServerContext;

    auto config() -> Config::ConfigStore& { return config_; }
    auto registry() -> Catalog::Registry& { return registry_; }
    auto field_cache() -> Catalog::FieldResolutionCache& { return field_cache_; }
    auto orchestrator() -> Sync::SyncOrchestrator& { return orchestrator_; }
    auto actions() -> Control::ControlActions& { return actions_; }
    auto events() -> Control::EventLog& { return events_; }

private:
    Config::ConfigStore           config_;
    Remote::HttpTransport&        device_transport_;
    Remote::ControlAppClient      control_;
    Catalog::Registry             registry_;
    Catalog::FieldResolutionCache field_cache_;
    Control::EventLog             events_;
    Control::ControlActions       actions_;
    Sync::SyncOrchestrator        orchestrator_;
};

} // namespace DS::Web
