#pragma once

#include <ddrsync/config/SyncSettings.hpp>
#include <ddrsync/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>

namespace DS::Config {

// {"1": {"min": id, "sec": id, "timer": id}, ...}; empty ids count as unset.
auto timer_fields_to_json(std::map<int, TimerFieldSet> const& timer_fields) -> nlohmann::json;
auto timer_fields_from_json(nlohmann::json const& document) -> DS::Expected<std::map<int, TimerFieldSet>>;

// Settings as JSON, keyed the way existing deployments wrote them
// ("singular_tokens", "tricaster_timer_fields", ...).
auto settings_to_json(SyncSettings const& settings) -> nlohmann::json;

// Missing keys keep the value from `defaults`; unknown keys are ignored.
// A lone legacy "singular_token" becomes {"Default": token}.
auto settings_from_json(nlohmann::json const& document, SyncSettings defaults = {}) -> DS::Expected<SyncSettings>;

// Seeds device and sync defaults from TRICASTER_HOST, TRICASTER_USER,
// TRICASTER_PASS, TRICASTER_SINGULAR_TOKEN, TRICASTER_ROUND_MODE and the
// legacy SINGULAR_TOKEN.
auto settings_env_defaults() -> SyncSettings;

// A missing file yields `defaults` unchanged.
auto load_settings_file(std::filesystem::path const& path, SyncSettings defaults = {}) -> DS::Expected<SyncSettings>;
auto save_settings_file(std::filesystem::path const& path, SyncSettings const& settings) -> DS::Expected<void>;

} // namespace DS::Config
