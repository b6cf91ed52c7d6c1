#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <ddrsync/web/HttpHelpers.hpp>

#include "log/TaggedLogger.hpp"
#include "web/Routes.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace DS::Web {

namespace {

using json = nlohmann::json;

inline constexpr std::size_t kEventsReturned = 100;

auto action_json(Control::ActionResult const& result, bool include_sent) -> json {
    json body{{"status", result.status}, {"id", result.id}, {"app", result.app_name}};
    if (include_sent) {
        body["sent"] = result.sent;
    }
    body["response"] = result.response;
    return body;
}

void respond_action(httplib::Response& res, DS::Expected<Control::ActionResult> const& result, bool include_sent) {
    if (!result) {
        respond_error(res, result.error());
        return;
    }
    write_json_response(res, action_json(*result, include_sent), 200);
}

void handle_in_out(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    std::string const app_name = req.matches[1];
    std::string const key      = req.matches[2];
    std::string const action   = req.matches[3];
    auto result = action == "in" ? ctx.actions.animate_in(app_name, key) : ctx.actions.animate_out(app_name, key);
    respond_action(res, result, false);
}

void handle_set(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    std::string const app_name = req.matches[1];
    std::string const key      = req.matches[2];

    auto field = query_value(req, "field");
    auto value = query_value(req, "value");
    if (!field || !value) {
        respond_bad_request(res, "field and value query parameters are required");
        return;
    }
    bool as_string = false;
    if (auto raw = query_value(req, "asString")) {
        auto parsed = parse_bool_value(*raw);
        if (!parsed) {
            respond_bad_request(res, "asString must be 0 or 1");
            return;
        }
        as_string = *parsed;
    }
    respond_action(res, ctx.actions.set_field(app_name, key, *field, *value, as_string), true);
}

void handle_timecontrol(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    std::string const app_name = req.matches[1];
    std::string const key      = req.matches[2];

    auto field = query_value(req, "field");
    if (!field) {
        respond_bad_request(res, "field query parameter is required");
        return;
    }

    Control::TimeControlRequest request;
    request.field = *field;
    if (auto raw = query_value(req, "run")) {
        auto parsed = parse_bool_value(*raw);
        if (!parsed) {
            respond_bad_request(res, "run must be a boolean");
            return;
        }
        request.run = *parsed;
    }
    if (auto raw = query_value(req, "value")) {
        auto parsed = parse_int_value(*raw);
        if (!parsed) {
            respond_bad_request(res, "value must be an integer");
            return;
        }
        request.value = *parsed;
    }
    if (auto raw = query_value(req, "utc")) {
        auto parsed = parse_double_value(*raw);
        if (!parsed) {
            respond_bad_request(res, "utc must be a number of milliseconds");
            return;
        }
        request.utc_ms = *parsed;
    }
    if (auto raw = query_value(req, "seconds")) {
        auto parsed = parse_int_value(*raw);
        if (!parsed) {
            respond_bad_request(res, "seconds must be an integer");
            return;
        }
        request.countdown_seconds = *parsed;
    }
    respond_action(res, ctx.actions.time_control(app_name, key, request), true);
}

void handle_fields(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    std::string const app_name = req.matches[1];
    if (!ctx.registry.contains(app_name)) {
        auto const settings = ctx.config.snapshot();
        if (auto token = settings.control_tokens.find(app_name); token != settings.control_tokens.end()) {
            auto rebuilt = ctx.registry.rebuild_app(app_name, token->second);
            if (rebuilt.error) {
                ds_log("Field catalog rebuild failed: " + DS::describeError(*rebuilt.error), "Server", "WARN");
            }
        }
    }
    auto catalog = ctx.registry.field_catalog(app_name);
    if (!catalog) {
        respond_not_found(res, "App '" + app_name + "' not found");
        return;
    }
    json fields = json::array();
    for (auto const& entry : *catalog) {
        fields.push_back(json{{"id", entry.id},
                              {"name", entry.title},
                              {"subcomposition", entry.subcomposition},
                              {"type", entry.type}});
    }
    write_json_response(res, json{{"fields", fields}, {"count", catalog->size()}}, 200);
}

} // namespace

void register_control_routes(httplib::Server& server, ServerContext& context) {
    server.Get("/health", [&context](httplib::Request const&, httplib::Response& res) {
        write_json_response(res,
                            json{{"status", "ok"}, {"version", std::string{kServerVersion}}, {"port", context.port}},
                            200);
    });

    server.Get("/events", [&context](httplib::Request const&, httplib::Response& res) {
        write_json_response(res, json{{"events", context.events.recent(kEventsReturned)}}, 200, true);
    });

    server.Get("/singular/list", [&context](httplib::Request const&, httplib::Response& res) {
        json body = json::object();
        for (auto const& [key, entry] : context.registry.snapshot()) {
            json fields = json::array();
            for (auto const& [field_id, meta] : entry.fields) {
                fields.push_back(field_id);
            }
            body[key.app_name + "/" + key.key] = json{{"id", entry.id},
                                                      {"name", entry.name},
                                                      {"app", entry.app_name},
                                                      {"fields", std::move(fields)}};
        }
        write_json_response(res, body, 200);
    });

    server.Post("/singular/refresh", [&context](httplib::Request const&, httplib::Response& res) {
        auto report = context.registry.rebuild_all(context.config.snapshot().control_tokens);
        json body{{"ok", report.ok()}, {"count", report.total_entries()}, {"apps", report.apps.size()}};
        json errors = json::object();
        for (auto const& app : report.apps) {
            if (app.error) {
                errors[app.app_name] = error_text(*app.error);
            }
        }
        if (!errors.empty()) {
            body["errors"] = std::move(errors);
        }
        write_json_response(res, body, 200);
    });

    server.Get("/singular/ping", [&context](httplib::Request const& req, httplib::Response& res) {
        auto report = context.actions.ping(context.config.snapshot().control_tokens, query_value(req, "app_name"));
        if (!report) {
            respond_error(res, report.error());
            return;
        }
        json apps = json::object();
        for (auto const& app : report->apps) {
            if (app.ok) {
                apps[app.app_name] = json{{"ok", true}, {"subs", app.subcompositions}};
            } else {
                apps[app.app_name] = json{{"ok", false}, {"error", app.error.value_or("unknown error")}};
            }
        }
        bool const ok = report->ok();
        write_json_response(res,
                            json{{"ok", ok},
                                 {"message", ok ? "Connected to Singular" : "Some connections failed"},
                                 {"apps", std::move(apps)},
                                 {"total_subs", report->total_subcompositions()}},
                            200,
                            true);
    });

    server.Get(R"(/api/singular/fields/([^/]+))", [&context](httplib::Request const& req, httplib::Response& res) {
        handle_fields(context, req, res);
    });

    auto in_out = [&context](httplib::Request const& req, httplib::Response& res) {
        handle_in_out(context, req, res);
    };
    server.Get(R"(/([^/]+)/([^/]+)/(in|out))", in_out);
    server.Post(R"(/([^/]+)/([^/]+)/(in|out))", in_out);

    auto set = [&context](httplib::Request const& req, httplib::Response& res) {
        handle_set(context, req, res);
    };
    server.Get(R"(/([^/]+)/([^/]+)/set)", set);
    server.Post(R"(/([^/]+)/([^/]+)/set)", set);

    auto timecontrol = [&context](httplib::Request const& req, httplib::Response& res) {
        handle_timecontrol(context, req, res);
    };
    server.Get(R"(/([^/]+)/([^/]+)/timecontrol)", timecontrol);
    server.Post(R"(/([^/]+)/([^/]+)/timecontrol)", timecontrol);
}

} // namespace DS::Web
