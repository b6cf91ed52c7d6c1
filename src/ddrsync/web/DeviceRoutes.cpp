#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <ddrsync/remote/PlaybackDeviceClient.hpp>
#include <ddrsync/web/HttpHelpers.hpp>

#include "log/TaggedLogger.hpp"
#include "web/Routes.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace DS::Web {

namespace {

using json = nlohmann::json;

struct ShortcutAlias {
    char const* path;
    char const* shortcut;
};

inline constexpr std::array<ShortcutAlias, 8> kShortcutAliases{{
        {"/tricaster/record/start", "record_start"},
        {"/tricaster/record/stop", "record_stop"},
        {"/tricaster/record/toggle", "record_toggle"},
        {"/tricaster/streaming/start", "streaming_start"},
        {"/tricaster/streaming/stop", "streaming_stop"},
        {"/tricaster/streaming/toggle", "streaming_toggle"},
        {"/tricaster/main/auto", "main_auto"},
        {"/tricaster/main/take", "main_take"},
}};

auto device_for(ServerContext& ctx) -> Remote::PlaybackDeviceClient {
    return Remote::PlaybackDeviceClient{ctx.device_transport, ctx.config.snapshot().device};
}

auto optional_string(std::optional<std::string> const& value) -> json {
    if (!value) {
        return nullptr;
    }
    return *value;
}

void run_shortcut(ServerContext&                            ctx,
                  httplib::Response&                        res,
                  std::string const&                        name,
                  std::map<std::string, std::string> const& params) {
    auto sent = device_for(ctx).send_shortcut(name, params);
    if (!sent) {
        respond_error(res, sent.error());
        return;
    }
    ctx.events.record("TRICASTER", name);
    json params_json = nullptr;
    if (!params.empty()) {
        params_json = params;
    }
    write_json_response(res, json{{"ok", true}, {"command", name}, {"params", std::move(params_json)}}, 200);
}

void handle_shortcut(ServerContext& ctx, httplib::Request const& req, httplib::Response& res) {
    std::string const                  name = req.matches[1];
    std::map<std::string, std::string> params;
    if (auto value = query_value(req, "value")) {
        params["value"] = *value;
    }
    if (auto index = query_value(req, "index")) {
        auto parsed = parse_int_value(*index);
        if (!parsed) {
            respond_bad_request(res, "index must be an integer");
            return;
        }
        params["index"] = std::to_string(*parsed);
    }
    run_shortcut(ctx, res, name, params);
}

} // namespace

void register_device_routes(httplib::Server& server, ServerContext& context) {
    server.Get("/tricaster/test", [&context](httplib::Request const&, httplib::Response& res) {
        auto device = device_for(context);
        if (device.endpoint().host.empty()) {
            write_json_response(res, json{{"ok", false}, {"error", "No TriCaster host configured"}}, 200);
            return;
        }
        auto version = device.test_connection();
        if (!version) {
            write_json_response(res, json{{"ok", false}, {"error", error_text(version.error())}}, 200);
            return;
        }
        write_json_response(res, json{{"ok", true}, {"host", device.endpoint().host}, {"response", *version}}, 200);
    });

    server.Get("/tricaster/ddr", [&context](httplib::Request const&, httplib::Response& res) {
        auto slots = device_for(context).slot_info();
        if (!slots) {
            if (slots.error().code == DS::Error::Code::ParseFailure) {
                write_json_response(res,
                                    json{{"ok", false}, {"error", "XML parse error: " + error_text(slots.error())}},
                                    200);
                return;
            }
            respond_error(res, slots.error());
            return;
        }
        json ddrs = json::object();
        for (auto const& info : *slots) {
            ddrs["ddr" + std::to_string(info.slot)] = json{{"duration", optional_string(info.duration)},
                                                           {"elapsed", optional_string(info.elapsed)},
                                                           {"remaining", optional_string(info.remaining)},
                                                           {"framerate", optional_string(info.framerate)},
                                                           {"playing", info.playing},
                                                           {"filename", optional_string(info.filename)}};
        }
        write_json_response(res, json{{"ok", true}, {"ddrs", std::move(ddrs)}}, 200, true);
    });

    server.Get("/tricaster/tally", [&context](httplib::Request const&, httplib::Response& res) {
        auto tally = device_for(context).tally();
        if (!tally) {
            write_json_response(res, json{{"ok", false}, {"error", error_text(tally.error())}}, 200);
            return;
        }
        write_json_response(res,
                            json{{"ok", true}, {"tally", json{{"program", tally->program}, {"preview", tally->preview}}}},
                            200,
                            true);
    });

    server.Get(R"(/tricaster/dictionary/([A-Za-z0-9_\-\.]+))",
               [&context](httplib::Request const& req, httplib::Response& res) {
                   auto raw = device_for(context).fetch_dictionary_raw(req.matches[1]);
                   if (!raw) {
                       respond_error(res, raw.error());
                       return;
                   }
                   write_json_response(res, json{{"raw_xml", *raw}}, 200, true);
               });

    auto shortcut = [&context](httplib::Request const& req, httplib::Response& res) {
        handle_shortcut(context, req, res);
    };
    server.Get(R"(/tricaster/shortcut/([A-Za-z0-9_\-\.]+))", shortcut);
    server.Post(R"(/tricaster/shortcut/([A-Za-z0-9_\-\.]+))", shortcut);

    for (auto const& alias : kShortcutAliases) {
        std::string const name{alias.shortcut};
        server.Get(alias.path, [&context, name](httplib::Request const&, httplib::Response& res) {
            run_shortcut(context, res, name, {});
        });
    }

    server.Get(R"(/tricaster/ddr/(\d+)/(play|stop))", [&context](httplib::Request const& req, httplib::Response& res) {
        std::string const slot   = req.matches[1];
        std::string const action = req.matches[2];
        run_shortcut(context, res, "ddr" + slot + "_" + action, {});
    });

    server.Get(R"(/tricaster/macro/([^/]+))", [&context](httplib::Request const& req, httplib::Response& res) {
        run_shortcut(context, res, "play_macro_byname", {{"value", std::string{req.matches[1]}}});
    });
}

} // namespace DS::Web
