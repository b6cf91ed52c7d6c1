#include <ddrsync/config/SettingsFile.hpp>

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace DS::Config {

namespace {

using json = nlohmann::json;

auto string_or_empty(json const& document, char const* key, std::string const& fallback) -> std::string {
    auto it = document.find(key);
    if (it == document.end()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

auto optional_field(json const& entry, char const* key) -> std::optional<std::string> {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

auto null_if_empty(std::string const& value) -> json {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

auto parse_slot(std::string_view text) -> std::optional<int> {
    int  slot   = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), slot);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || slot <= 0) {
        return std::nullopt;
    }
    return slot;
}

auto read_env(char const* key) -> std::optional<std::string> {
    if (char const* raw = std::getenv(key); raw != nullptr && *raw != '\0') {
        return std::string{raw};
    }
    return std::nullopt;
}

} // namespace

auto timer_fields_to_json(std::map<int, TimerFieldSet> const& timer_fields) -> json {
    json document = json::object();
    for (auto const& [slot, fields] : timer_fields) {
        json entry = json::object();
        if (fields.minutes_field) {
            entry["min"] = *fields.minutes_field;
        }
        if (fields.seconds_field) {
            entry["sec"] = *fields.seconds_field;
        }
        if (fields.timer_field) {
            entry["timer"] = *fields.timer_field;
        }
        document[std::to_string(slot)] = std::move(entry);
    }
    return document;
}

auto timer_fields_from_json(json const& document) -> DS::Expected<std::map<int, TimerFieldSet>> {
    if (!document.is_object()) {
        return std::unexpected(DS::Error{DS::Error::Code::InvalidArgument, "timer fields must be a JSON object"});
    }
    std::map<int, TimerFieldSet> timer_fields;
    for (auto const& [slot_text, entry] : document.items()) {
        auto slot = parse_slot(slot_text);
        if (!slot || !entry.is_object()) {
            return std::unexpected(
                    DS::Error{DS::Error::Code::InvalidArgument, "invalid timer field entry '" + slot_text + "'"});
        }
        timer_fields[*slot] = TimerFieldSet{optional_field(entry, "min"),
                                            optional_field(entry, "sec"),
                                            optional_field(entry, "timer")};
    }
    return timer_fields;
}

auto settings_to_json(SyncSettings const& settings) -> json {
    json document = json::object();
    document["singular_tokens"]              = settings.control_tokens;
    document["tricaster_singular_token"]     = null_if_empty(settings.sync_token);
    document["tricaster_timer_fields"]       = timer_fields_to_json(settings.timer_fields);
    document["tricaster_round_mode"]         = std::string{to_string(settings.round_mode)};
    document["tricaster_auto_sync"]          = settings.auto_sync;
    document["tricaster_auto_sync_interval"] = settings.auto_sync_interval_seconds;
    document["enable_tricaster"]             = settings.device.enabled;
    document["tricaster_host"]               = null_if_empty(settings.device.host);
    document["tricaster_user"]               = settings.device.user;
    document["tricaster_pass"]               = null_if_empty(settings.device.password);
    return document;
}

auto settings_from_json(json const& document, SyncSettings defaults) -> DS::Expected<SyncSettings> {
    if (!document.is_object()) {
        return std::unexpected(DS::Error{DS::Error::Code::ParseFailure, "settings document must be a JSON object"});
    }
    SyncSettings settings = std::move(defaults);

    if (auto tokens = document.find("singular_tokens"); tokens != document.end() && tokens->is_object()) {
        settings.control_tokens.clear();
        for (auto const& [name, token] : tokens->items()) {
            if (token.is_string() && !token.get<std::string>().empty()) {
                settings.control_tokens[name] = token.get<std::string>();
            }
        }
    }
    if (settings.control_tokens.empty()) {
        if (auto legacy = optional_field(document, "singular_token")) {
            settings.control_tokens["Default"] = std::move(*legacy);
        }
    }

    settings.sync_token = string_or_empty(document, "tricaster_singular_token", settings.sync_token);

    if (auto fields = document.find("tricaster_timer_fields"); fields != document.end() && fields->is_object()) {
        settings.timer_fields.clear();
        for (auto const& [slot_text, entry] : fields->items()) {
            auto slot = parse_slot(slot_text);
            if (!slot || !entry.is_object()) {
                ds_log("Ignoring timer field entry '" + slot_text + "'", "Config", "WARN");
                continue;
            }
            settings.timer_fields[*slot] = TimerFieldSet{optional_field(entry, "min"),
                                                         optional_field(entry, "sec"),
                                                         optional_field(entry, "timer")};
        }
    }

    if (auto mode = document.find("tricaster_round_mode"); mode != document.end() && mode->is_string()) {
        // Anything other than "frames" never rounded to frames.
        settings.round_mode = parse_round_mode(mode->get<std::string>()).value_or(RoundMode::None);
    }
    if (auto flag = document.find("tricaster_auto_sync"); flag != document.end() && flag->is_boolean()) {
        settings.auto_sync = flag->get<bool>();
    }
    if (auto interval = document.find("tricaster_auto_sync_interval");
        interval != document.end() && interval->is_number()) {
        settings.auto_sync_interval_seconds = clamp_auto_sync_interval(interval->get<int>());
    }
    if (auto flag = document.find("enable_tricaster"); flag != document.end() && flag->is_boolean()) {
        settings.device.enabled = flag->get<bool>();
    }
    settings.device.host     = string_or_empty(document, "tricaster_host", settings.device.host);
    settings.device.user     = string_or_empty(document, "tricaster_user", settings.device.user);
    settings.device.password = string_or_empty(document, "tricaster_pass", settings.device.password);
    return settings;
}

auto settings_env_defaults() -> SyncSettings {
    SyncSettings settings;
    if (auto host = read_env("TRICASTER_HOST")) {
        settings.device.host = std::move(*host);
    }
    if (auto user = read_env("TRICASTER_USER")) {
        settings.device.user = std::move(*user);
    }
    if (auto password = read_env("TRICASTER_PASS")) {
        settings.device.password = std::move(*password);
    }
    if (auto token = read_env("TRICASTER_SINGULAR_TOKEN")) {
        settings.sync_token = std::move(*token);
    }
    if (auto mode = read_env("TRICASTER_ROUND_MODE")) {
        settings.round_mode = parse_round_mode(*mode).value_or(RoundMode::None);
    }
    if (auto legacy = read_env("SINGULAR_TOKEN")) {
        settings.control_tokens["Default"] = std::move(*legacy);
    }
    return settings;
}

auto load_settings_file(std::filesystem::path const& path, SyncSettings defaults) -> DS::Expected<SyncSettings> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return defaults;
    }
    std::ifstream input{path};
    if (!input) {
        return std::unexpected(DS::Error{DS::Error::Code::IoFailure, "cannot open settings file " + path.string()});
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(DS::Error{DS::Error::Code::ParseFailure,
                                         "settings file " + path.string() + " is not valid JSON"});
    }
    // File values override the seeded defaults; a file "singular_tokens" map
    // replaces the env-seeded legacy token.
    return settings_from_json(document, std::move(defaults));
}

auto save_settings_file(std::filesystem::path const& path, SyncSettings const& settings) -> DS::Expected<void> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(DS::Error{DS::Error::Code::IoFailure,
                                             "cannot create " + path.parent_path().string() + ": " + ec.message()});
        }
    }
    auto          temp = path;
    temp += ".tmp";
    std::ofstream output{temp, std::ios::trunc};
    if (!output) {
        return std::unexpected(DS::Error{DS::Error::Code::IoFailure, "cannot write settings file " + temp.string()});
    }
    output << settings_to_json(settings).dump(2) << '\n';
    output.close();
    if (!output) {
        return std::unexpected(DS::Error{DS::Error::Code::IoFailure, "short write to " + temp.string()});
    }
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return std::unexpected(DS::Error{DS::Error::Code::IoFailure,
                                         "cannot replace " + path.string() + ": " + ec.message()});
    }
    ds_log("Saved settings to " + path.string(), "Config");
    return {};
}

} // namespace DS::Config
