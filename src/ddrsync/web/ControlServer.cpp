#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <ddrsync/web/ControlServer.hpp>

#include "log/TaggedLogger.hpp"
#include "web/Routes.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace DS::Web {

static std::atomic<bool> g_should_stop{false};

void register_routes(httplib::Server& server, ServerContext& context) {
    register_sync_routes(server, context);
    register_device_routes(server, context);
    register_control_routes(server, context);
}

ControlServer::ControlServer(ServerContext& context, Options options)
    : context_(context)
    , options_(std::move(options)) {}

ControlServer::~ControlServer() {
    this->stop();
}

auto ControlServer::start() -> DS::Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::unexpected(DS::Error{DS::Error::Code::InvalidArgument, "control server already running"});
    }

    server_ = std::make_unique<httplib::Server>();
    register_routes(*server_, context_);

    auto requested_port = options_.port;
    if (requested_port < 0) {
        requested_port = 0;
    }

    int bound_port = requested_port;
    if (requested_port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return std::unexpected(DS::Error{DS::Error::Code::IoFailure, "failed to bind control server"});
        }
    } else if (!server_->bind_to_port(options_.host, requested_port)) {
        server_.reset();
        return std::unexpected(DS::Error{DS::Error::Code::IoFailure,
                                         "failed to bind control server on " + options_.host + ":"
                                                 + std::to_string(requested_port)});
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    running_.store(true);

    auto* server   = server_.get();
    server_thread_ = std::thread([this, server]() {
#ifdef DS_LOG_DEBUG
        DS::set_thread_name("ControlServer");
#endif
        server->listen_after_bind();
        running_.store(false);
    });

    lock.unlock();
    server->wait_until_ready();
    lock.lock();
    if (!server->is_running()) {
        server->stop();
        lock.unlock();
        this->join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return std::unexpected(DS::Error{DS::Error::Code::IoFailure, "control server failed to start listening"});
    }

    ds_log("Control server listening on " + options_.host + ":" + std::to_string(bound_port_), "Server");
    return {};
}

auto ControlServer::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    this->join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto ControlServer::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto ControlServer::is_running() const -> bool {
    return running_.load();
}

auto ControlServer::port() const -> std::uint16_t {
    std::lock_guard const lock{mutex_};
    return bound_port_;
}

void RequestControlServerStop() {
    g_should_stop.store(true);
}

void ResetControlServerStopFlag() {
    g_should_stop.store(false);
}

int RunControlServerWithStopFlag(ServerContext&                          context,
                                 ServerOptions const&                    options,
                                 std::atomic<bool>&                      should_stop,
                                 ServerLogHooks const&                   log_hooks,
                                 std::function<void(DS::Expected<void>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](DS::Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    ControlServer server{context, ControlServer::Options{options.host, options.port}};
    auto          started = server.start();
    if (!started) {
        log_error(std::string{"[ddrsync] "} + DS::describeError(started.error()));
        report_listen_status(std::unexpected(started.error()));
        return EXIT_FAILURE;
    }

    log_info(std::string{"[ddrsync] Listening on http://"} + options.host + ":" + std::to_string(server.port()));
    report_listen_status({});

    while (!should_stop.load(std::memory_order_acquire) && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    bool const listener_died = !should_stop.load(std::memory_order_acquire);
    if (listener_died) {
        log_error("[ddrsync] Listener stopped unexpectedly");
    }

    server.stop();
    context.orchestrator.stop_auto_sync();
    log_info("[ddrsync] Stopped");
    return listener_died ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunControlServer(ServerContext& context, ServerOptions const& options) {
    return RunControlServerWithStopFlag(context, options, g_should_stop, {}, {});
}

} // namespace DS::Web
