#include <ddrsync/control/ControlActions.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <utility>

namespace DS::Control {

namespace {

using json = nlohmann::json;

auto lowercase(std::string_view text) -> std::string {
    std::string lowered;
    lowered.reserve(text.size());
    for (unsigned char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lowered;
}

auto trimmed(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    return text;
}

template <typename T>
auto parse_whole(std::string_view text) -> std::optional<T> {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto now_ms() -> double {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count()) / 1000.0;
}

} // namespace

auto coerce_value(Remote::FieldMeta const& field, std::string const& text, bool as_string) -> json {
    if (as_string) {
        return text;
    }
    auto const type = lowercase(field.type);
    if (type == "number" || type == "range" || type == "slider") {
        auto const number = trimmed(text);
        if (text.find('.') != std::string::npos) {
            if (auto value = parse_whole<double>(number); value && std::isfinite(*value)) {
                return *value;
            }
            return text;
        }
        if (auto value = parse_whole<std::int64_t>(number)) {
            return *value;
        }
        return text;
    }
    if (type == "checkbox" || type == "toggle" || type == "bool" || type == "boolean") {
        auto const lowered = lowercase(text);
        return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
    }
    return text;
}

auto PingReport::ok() const -> bool {
    return std::all_of(apps.begin(), apps.end(), [](AppPing const& app) { return app.ok; });
}

auto PingReport::total_subcompositions() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& app : apps) {
        total += app.subcompositions;
    }
    return total;
}

ControlActions::ControlActions(Catalog::Registry const&        registry,
                               Remote::ControlAppClient const& control,
                               EventLog&                       events)
    : registry_(registry)
    , control_(control)
    , events_(events) {}

auto ControlActions::send(Catalog::RegistryEntry const& entry, std::string key, json items) -> DS::Expected<ActionResult> {
    auto response = control_.patch_control(entry.token, items);
    if (!response) {
        return std::unexpected(response.error());
    }
    ActionResult result;
    result.status   = response->status;
    result.app_name = entry.app_name;
    result.key      = std::move(key);
    result.id       = entry.id;
    result.sent     = std::move(items);
    result.response = std::move(response->body);
    return result;
}

auto ControlActions::animate(std::string_view app_name, std::string_view key, std::string_view state)
        -> DS::Expected<ActionResult> {
    auto resolved = registry_.resolve(key, app_name);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto entry = registry_.find(resolved->app_name, resolved->key);
    if (!entry) {
        return std::unexpected(DS::Error{DS::Error::Code::NotFound, "subcomposition not found: " + std::string{key}});
    }
    json items = json::array({json{{"subCompositionId", entry->id}, {"state", std::string{state}}}});
    auto result = send(*entry, resolved->key, std::move(items));
    if (result) {
        events_.record(state == "In" ? "IN" : "OUT", resolved->app_name + "/" + resolved->key + " (" + entry->id + ")");
    }
    return result;
}

auto ControlActions::animate_in(std::string_view app_name, std::string_view key) -> DS::Expected<ActionResult> {
    return animate(app_name, key, "In");
}

auto ControlActions::animate_out(std::string_view app_name, std::string_view key) -> DS::Expected<ActionResult> {
    return animate(app_name, key, "Out");
}

auto ControlActions::set_field(std::string_view   app_name,
                               std::string_view   key,
                               std::string const& field,
                               std::string const& value,
                               bool               as_string) -> DS::Expected<ActionResult> {
    auto resolved = registry_.resolve(key, app_name);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto entry = registry_.find(resolved->app_name, resolved->key);
    if (!entry) {
        return std::unexpected(DS::Error{DS::Error::Code::NotFound, "subcomposition not found: " + std::string{key}});
    }
    auto meta = entry->fields.find(field);
    if (meta == entry->fields.end()) {
        return std::unexpected(DS::Error{DS::Error::Code::NotFound,
                                         "Field not found on " + resolved->app_name + "/" + resolved->key + ": " + field});
    }
    json payload = json::object();
    payload[field] = coerce_value(meta->second, value, as_string);
    json items = json::array({json{{"subCompositionId", entry->id}, {"payload", std::move(payload)}}});
    auto result = send(*entry, resolved->key, std::move(items));
    if (result) {
        events_.record("SET",
                       resolved->app_name + "/" + resolved->key + " (" + entry->id + ") field=" + field + " value=" + value);
    }
    return result;
}

auto ControlActions::time_control(std::string_view app_name, std::string_view key, TimeControlRequest const& request)
        -> DS::Expected<ActionResult> {
    auto resolved = registry_.resolve(key, app_name);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto entry = registry_.find(resolved->app_name, resolved->key);
    if (!entry) {
        return std::unexpected(DS::Error{DS::Error::Code::NotFound, "subcomposition not found: " + std::string{key}});
    }
    auto meta = entry->fields.find(request.field);
    if (meta == entry->fields.end()) {
        return std::unexpected(DS::Error{DS::Error::Code::NotFound,
                                         "Field not found on " + resolved->app_name + "/" + resolved->key + ": "
                                                 + request.field});
    }
    if (lowercase(meta->second.type) != "timecontrol") {
        return std::unexpected(DS::Error{DS::Error::Code::InvalidArgument,
                                         "Field '" + request.field + "' is not a timecontrol"});
    }

    json payload = json::object();
    if (request.countdown_seconds) {
        payload["Countdown Seconds"] = std::to_string(*request.countdown_seconds);
    }
    payload[request.field] = json{{"UTC", request.utc_ms.value_or(now_ms())},
                                  {"isRunning", request.run},
                                  {"value", request.value}};
    json items = json::array({json{{"subCompositionId", entry->id}, {"payload", payload}}});
    auto result = send(*entry, resolved->key, std::move(items));
    if (result) {
        result->sent = std::move(payload);
        events_.record("TIMECONTROL",
                       resolved->app_name + "/" + resolved->key + " (" + entry->id + ") field=" + request.field
                               + " run=" + (request.run ? "true" : "false") + " seconds="
                               + (request.countdown_seconds ? std::to_string(*request.countdown_seconds) : "none"));
    }
    return result;
}

auto ControlActions::ping(std::map<std::string, std::string> const& tokens, std::optional<std::string> const& app_name) const
        -> DS::Expected<PingReport> {
    if (tokens.empty()) {
        return std::unexpected(DS::Error{DS::Error::Code::NotConfigured, "no control app tokens configured"});
    }
    std::map<std::string, std::string> targets = tokens;
    if (app_name) {
        if (auto it = tokens.find(*app_name); it != tokens.end()) {
            targets = {{it->first, it->second}};
        }
    }

    PingReport report;
    for (auto const& [name, token] : targets) {
        AppPing ping;
        ping.app_name = name;
        auto model    = control_.fetch_control_model(token);
        if (model) {
            ping.ok              = true;
            ping.subcompositions = registry_.size(name);
        } else {
            ping.error = DS::describeError(model.error());
        }
        ds_log("Ping " + name + (ping.ok ? " ok" : " failed"), "Singular");
        report.apps.push_back(std::move(ping));
    }
    return report;
}

} // namespace DS::Control
