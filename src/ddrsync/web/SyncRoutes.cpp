#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <ddrsync/config/SettingsFile.hpp>
#include <ddrsync/web/HttpHelpers.hpp>

#include "log/TaggedLogger.hpp"
#include "web/Routes.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DS::Web {

namespace {

using json = nlohmann::json;

inline constexpr std::string_view kRestartAction{"restart (paused/reset)"};

auto optional_number(std::optional<double> const& value) -> json {
    if (!value) {
        return nullptr;
    }
    return *value;
}

auto optional_string(std::optional<std::string> const& value) -> json {
    if (!value) {
        return nullptr;
    }
    return *value;
}

auto sync_result_json(Sync::SyncResult const& result) -> json {
    return json{{"ok", true},
                {"ddr", result.slot},
                {"duration_seconds", result.duration_seconds},
                {"minutes", result.minutes},
                {"seconds", result.seconds},
                {"fps", optional_number(result.framerate)},
                {"round_mode", std::string{Config::to_string(result.round_mode)}}};
}

auto restart_json(int slot) -> json {
    return json{{"ok", true}, {"ddr", slot}, {"action", std::string{kRestartAction}}};
}

auto slot_errors_json(std::vector<Sync::SlotError> const& errors) -> json {
    if (errors.empty()) {
        return nullptr;
    }
    json lines = json::array();
    for (auto const& failure : errors) {
        lines.push_back("DDR " + std::to_string(failure.slot) + ": " + error_text(failure.error));
    }
    return lines;
}

auto slot_from_match(httplib::Request const& req, httplib::Response& res) -> std::optional<int> {
    auto slot = parse_int_value(std::string{req.matches[1]});
    if (!slot || *slot <= 0) {
        respond_bad_request(res, "DDR number must be a positive integer");
        return std::nullopt;
    }
    return slot;
}

void handle_timer(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    auto slot = slot_from_match(req, res);
    if (!slot) {
        return;
    }
    std::string const action = req.matches[2];
    if (action == "restart") {
        auto restarted = ctx.orchestrator.restart(*slot);
        if (!restarted) {
            respond_error(res, restarted.error());
            return;
        }
        write_json_response(res, restart_json(*slot), 200);
        return;
    }

    auto command = Sync::parse_timer_command(action);
    if (!command) {
        respond_bad_request(res, "unknown timer command: " + action);
        return;
    }
    auto sent = ctx.orchestrator.send_timer_command(*slot, *command);
    if (!sent) {
        respond_error(res, sent.error());
        return;
    }
    write_json_response(res, json{{"ok", true}, {"ddr", *slot}, {"command", action}}, 200);
}

void handle_auto_sync(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    auto payload = read_json_object(req, res);
    if (!payload) {
        return;
    }
    auto enabled = payload->find("enabled");
    if (enabled == payload->end() || !enabled->is_boolean()) {
        respond_bad_request(res, "enabled must be a boolean");
        return;
    }
    std::optional<int> interval;
    if (auto it = payload->find("interval"); it != payload->end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            respond_bad_request(res, "interval must be an integer number of seconds");
            return;
        }
        interval = it->get<int>();
    }

    auto transition = ctx.orchestrator.configure_auto_sync(enabled->get<bool>(), interval);
    if (!transition) {
        respond_error(res, transition.error());
        return;
    }
    auto const current_interval = ctx.config.snapshot().auto_sync_interval_seconds;
    switch (*transition) {
    case Sync::AutoSyncTransition::Started:
        write_json_response(res,
                            json{{"ok", true}, {"message", "Auto-sync started"}, {"interval", current_interval}},
                            200);
        return;
    case Sync::AutoSyncTransition::Stopped:
        write_json_response(res, json{{"ok", true}, {"message", "Auto-sync stopped"}}, 200);
        return;
    case Sync::AutoSyncTransition::Unchanged:
        write_json_response(res,
                            json{{"ok", true},
                                 {"message", enabled->get<bool>() ? "Auto-sync enabled" : "Auto-sync disabled"},
                                 {"interval", current_interval}},
                            200);
        return;
    }
}

void handle_save_timer_sync(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    auto payload = read_json_object(req, res);
    if (!payload) {
        return;
    }

    std::string token;
    if (auto it = payload->find("singular_token"); it != payload->end() && !it->is_null()) {
        if (!it->is_string()) {
            respond_bad_request(res, "singular_token must be a string");
            return;
        }
        token = it->get<std::string>();
    }

    auto round_mode = Config::RoundMode::Frames;
    if (auto it = payload->find("round_mode"); it != payload->end() && !it->is_null()) {
        auto parsed = it->is_string() ? Config::parse_round_mode(it->get<std::string>()) : std::nullopt;
        if (!parsed) {
            respond_bad_request(res, "round_mode must be 'frames' or 'none'");
            return;
        }
        round_mode = *parsed;
    }

    std::map<int, Config::TimerFieldSet> timer_fields;
    if (auto it = payload->find("timer_fields"); it != payload->end() && !it->is_null()) {
        auto parsed = Config::timer_fields_from_json(*it);
        if (!parsed) {
            respond_error(res, parsed.error());
            return;
        }
        timer_fields = std::move(*parsed);
    }

    auto saved = ctx.config.save_timer_sync(std::move(token), round_mode, std::move(timer_fields));
    if (!saved) {
        respond_error(res, saved.error());
        return;
    }
    write_json_response(res, json{{"ok", true}, {"message", "Timer sync configuration saved"}}, 200);
}

} // namespace

void register_sync_routes(httplib::Server& server, ServerContext& context) {
    server.Get("/tricaster/sync/all", [&context](httplib::Request const&, httplib::Response& res) {
        auto report  = context.orchestrator.sync_all();
        json results = json::object();
        for (auto const& result : report.results) {
            results["ddr" + std::to_string(result.slot)] = sync_result_json(result);
        }
        write_json_response(res,
                            json{{"ok", report.ok()},
                                 {"results", std::move(results)},
                                 {"errors", slot_errors_json(report.errors)}},
                            200);
    });

    server.Get(R"(/tricaster/sync/(\d+))", [&context](httplib::Request const& req, httplib::Response& res) {
        auto slot = slot_from_match(req, res);
        if (!slot) {
            return;
        }
        auto result = context.orchestrator.sync_one(*slot);
        if (!result) {
            ds_log("Sync DDR " + std::to_string(*slot) + " failed: " + DS::describeError(result.error()), "Server");
            respond_error(res, result.error());
            return;
        }
        write_json_response(res, sync_result_json(*result), 200);
    });

    server.Get("/tricaster/timer/all/restart", [&context](httplib::Request const&, httplib::Response& res) {
        auto report  = context.orchestrator.restart_all();
        json results = json::array();
        for (int slot : report.restarted) {
            results.push_back(restart_json(slot));
        }
        write_json_response(res,
                            json{{"ok", report.ok()},
                                 {"results", std::move(results)},
                                 {"errors", slot_errors_json(report.errors)}},
                            200);
    });

    server.Get(R"(/tricaster/timer/(\d+)/(start|pause|reset|restart))",
               [&context](httplib::Request const& req, httplib::Response& res) { handle_timer(context, req, res); });

    server.Get("/tricaster/auto-sync/status", [&context](httplib::Request const&, httplib::Response& res) {
        auto status = context.orchestrator.status();
        json cached = json::object();
        for (auto const& [slot, value] : status.cached_values) {
            cached[std::to_string(slot)] = json{{"minutes", value.minutes}, {"seconds", value.seconds}};
        }
        write_json_response(res,
                            json{{"enabled", status.enabled},
                                 {"running", status.running},
                                 {"interval", status.interval_seconds},
                                 {"last_sync", optional_string(status.last_sync)},
                                 {"error", optional_string(status.last_error)},
                                 {"cached_values", std::move(cached)}},
                            200,
                            true);
    });

    server.Post("/tricaster/auto-sync", [&context](httplib::Request const& req, httplib::Response& res) {
        handle_auto_sync(context, req, res);
    });

    server.Get("/config/tricaster/timer-sync", [&context](httplib::Request const&, httplib::Response& res) {
        auto const settings = context.config.snapshot();
        json       token    = nullptr;
        if (!settings.sync_token.empty()) {
            token = settings.sync_token;
        }
        write_json_response(res,
                            json{{"singular_token", std::move(token)},
                                 {"round_mode", std::string{Config::to_string(settings.round_mode)}},
                                 {"timer_fields", Config::timer_fields_to_json(settings.timer_fields)}},
                            200,
                            true);
    });

    server.Post("/config/tricaster/timer-sync", [&context](httplib::Request const& req, httplib::Response& res) {
        handle_save_timer_sync(context, req, res);
    });
}

} // namespace DS::Web
