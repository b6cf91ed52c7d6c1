#pragma once

#include <ddrsync/catalog/Registry.hpp>
#include <ddrsync/control/EventLog.hpp>
#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/ControlAppClient.hpp>
#include <ddrsync/remote/ControlModel.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DS::Control {

// Typed value for a control field: number/range/slider become integers (or
// doubles when the text has a '.'), checkbox/toggle/bool/boolean become
// booleans. Everything else, and anything unparsable, stays a string.
[[nodiscard]] auto coerce_value(Remote::FieldMeta const& field, std::string const& text, bool as_string)
        -> nlohmann::json;

struct ActionResult {
    int            status{0};
    std::string    app_name;
    std::string    key;
    std::string    id;
    nlohmann::json sent;
    std::string    response;
};

struct TimeControlRequest {
    std::string           field;
    bool                  run{true};
    int                   value{0};
    // Milliseconds since the epoch; now when absent.
    std::optional<double> utc_ms;
    std::optional<int>    countdown_seconds;
};

struct AppPing {
    std::string                app_name;
    bool                       ok{false};
    std::size_t                subcompositions{0};
    std::optional<std::string> error;
};

struct PingReport {
    std::vector<AppPing> apps;

    auto ok() const -> bool;
    auto total_subcompositions() const -> std::size_t;
};

// Operator actions against registry entries. Every action resolves the
// entry first and reports NotFound before anything is sent.
class ControlActions {
public:
    ControlActions(Catalog::Registry const& registry, Remote::ControlAppClient const& control, EventLog& events);

    auto animate_in(std::string_view app_name, std::string_view key) -> DS::Expected<ActionResult>;
    auto animate_out(std::string_view app_name, std::string_view key) -> DS::Expected<ActionResult>;
    auto set_field(std::string_view   app_name,
                   std::string_view   key,
                   std::string const& field,
                   std::string const& value,
                   bool               as_string) -> DS::Expected<ActionResult>;
    auto time_control(std::string_view app_name, std::string_view key, TimeControlRequest const& request)
            -> DS::Expected<ActionResult>;

    // Fetches each app's model. With an app name that is configured, only
    // that app is checked.
    auto ping(std::map<std::string, std::string> const& tokens, std::optional<std::string> const& app_name) const
            -> DS::Expected<PingReport>;

private:
    auto animate(std::string_view app_name, std::string_view key, std::string_view state) -> DS::Expected<ActionResult>;
    auto send(Catalog::RegistryEntry const& entry, std::string key, nlohmann::json items) -> DS::Expected<ActionResult>;

    Catalog::Registry const&        registry_;
    Remote::ControlAppClient const& control_;
    EventLog&                       events_;
};

} // namespace DS::Control
