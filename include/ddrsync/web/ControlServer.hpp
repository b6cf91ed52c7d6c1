#pragma once

#include <ddrsync/catalog/FieldResolutionCache.hpp>
#include <ddrsync/catalog/Registry.hpp>
#include <ddrsync/config/ConfigStore.hpp>
#include <ddrsync/control/ControlActions.hpp>
#include <ddrsync/control/EventLog.hpp>
#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/HttpTransport.hpp>
#include <ddrsync/sync/SyncOrchestrator.hpp>
#include <ddrsync/web/ServerOptions.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace httplib {
class Server;
}

namespace DS::Web {

inline constexpr std::string_view kServerVersion{"1.4.0"};

// Everything a route handler touches. The server never owns these.
struct ServerContext {
    Config::ConfigStore&           config;
    Catalog::Registry&             registry;
    Catalog::FieldResolutionCache& field_cache;
    Sync::SyncOrchestrator&        orchestrator;
    Control::ControlActions&       actions;
    Control::EventLog&             events;
    Remote::HttpTransport&         device_transport;
    int                            port{kDefaultServerPort};
};

void register_routes(httplib::Server& server, ServerContext& context);

class ControlServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        // 0 binds an ephemeral port.
        int         port = kDefaultServerPort;
    };

    ControlServer(ServerContext& context, Options options);
    ~ControlServer();

    ControlServer(ControlServer const&)                    = delete;
    auto operator=(ControlServer const&) -> ControlServer& = delete;

    [[nodiscard]] auto start() -> DS::Expected<void>;
    auto stop() -> void;
    auto join() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;

private:
    ServerContext&                   context_;
    Options                          options_;
    std::unique_ptr<httplib::Server> server_;
    std::thread                      server_thread_;
    std::atomic<bool>                running_{false};
    std::uint16_t                    bound_port_ = 0;
    mutable std::mutex               mutex_;
};

struct ServerLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

int RunControlServer(ServerContext& context, ServerOptions const& options);

int RunControlServerWithStopFlag(ServerContext&                          context,
                                 ServerOptions const&                    options,
                                 std::atomic<bool>&                      should_stop,
                                 ServerLogHooks const&                   log_hooks = {},
                                 std::function<void(DS::Expected<void>)> on_listen = {});

void RequestControlServerStop();
void ResetControlServerStopFlag();

} // namespace DS::Web
