#include <doctest/doctest.h>

#include <ddrsync/config/SettingsFile.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using DS::Config::RoundMode;
using DS::Config::SyncSettings;
using DS::Config::TimerFieldSet;
using json = nlohmann::json;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct TempDir {
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path       = std::filesystem::temp_directory_path() / ("ddrsync_settings_" + std::to_string(stamp));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

auto sample_settings() -> SyncSettings {
    SyncSettings settings;
    settings.control_tokens             = {{"Main", "tok-main"}, {"Clock", "tok-clock"}};
    settings.sync_token                 = "tok-clock";
    settings.timer_fields[1]            = TimerFieldSet{"m1", "s1", "t1"};
    settings.timer_fields[3]            = TimerFieldSet{std::nullopt, "s3", std::nullopt};
    settings.round_mode                 = RoundMode::None;
    settings.auto_sync                  = true;
    settings.auto_sync_interval_seconds = 5;
    settings.device                     = DS::Remote::DeviceEndpoint{true, "10.1.1.1", "operator", "pw"};
    return settings;
}

} // namespace

TEST_SUITE("config.file") {

TEST_CASE("Settings survive a save and load") {
    TempDir    dir;
    auto const path     = dir.path / "nested" / "ddrsync.json";
    auto const settings = sample_settings();

    REQUIRE(DS::Config::save_settings_file(path, settings).has_value());
    CHECK(std::filesystem::exists(path));

    auto loaded = DS::Config::load_settings_file(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->control_tokens == settings.control_tokens);
    CHECK(loaded->sync_token == "tok-clock");
    CHECK(loaded->timer_fields == settings.timer_fields);
    CHECK(loaded->round_mode == RoundMode::None);
    CHECK(loaded->auto_sync);
    CHECK(loaded->auto_sync_interval_seconds == 5);
    CHECK(loaded->device.enabled);
    CHECK(loaded->device.host == "10.1.1.1");
    CHECK(loaded->device.user == "operator");
    CHECK(loaded->device.password == "pw");
}

TEST_CASE("The document uses the established key names") {
    auto document = DS::Config::settings_to_json(sample_settings());
    CHECK(document["singular_tokens"]["Main"] == "tok-main");
    CHECK(document["tricaster_singular_token"] == "tok-clock");
    CHECK(document["tricaster_timer_fields"]["1"] == json{{"min", "m1"}, {"sec", "s1"}, {"timer", "t1"}});
    CHECK(document["tricaster_timer_fields"]["3"] == json{{"sec", "s3"}});
    CHECK(document["tricaster_round_mode"] == "none");
    CHECK(document["tricaster_auto_sync_interval"] == 5);
    CHECK(document["enable_tricaster"] == true);

    SyncSettings empty;
    auto         blank = DS::Config::settings_to_json(empty);
    CHECK(blank["tricaster_singular_token"].is_null());
    CHECK(blank["tricaster_host"].is_null());
}

TEST_CASE("A missing file yields the defaults") {
    TempDir      dir;
    SyncSettings defaults;
    defaults.sync_token = "seeded";

    auto loaded = DS::Config::load_settings_file(dir.path / "absent.json", defaults);
    REQUIRE(loaded.has_value());
    CHECK(loaded->sync_token == "seeded");
}

TEST_CASE("A corrupt file is a parse failure") {
    TempDir    dir;
    auto const path = dir.path / "bad.json";
    {
        std::ofstream output{path};
        output << "{not json";
    }

    auto loaded = DS::Config::load_settings_file(path);
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == DS::Error::Code::ParseFailure);

    auto array = DS::Config::settings_from_json(json::array());
    REQUIRE_FALSE(array.has_value());
    CHECK(array.error().code == DS::Error::Code::ParseFailure);
}

TEST_CASE("A lone legacy token becomes the Default app") {
    auto legacy = DS::Config::settings_from_json(json{{"singular_token", "old-token"}});
    REQUIRE(legacy.has_value());
    CHECK(legacy->control_tokens == std::map<std::string, std::string>{{"Default", "old-token"}});

    auto both = DS::Config::settings_from_json(json{{"singular_token", "old-token"},
                                                    {"singular_tokens", json{{"Main", "new-token"}}}});
    REQUIRE(both.has_value());
    CHECK(both->control_tokens == std::map<std::string, std::string>{{"Main", "new-token"}});
}

TEST_CASE("Loaded values are normalized") {
    auto loaded = DS::Config::settings_from_json(json{{"tricaster_auto_sync_interval", 60},
                                                      {"tricaster_round_mode", "seconds"},
                                                      {"tricaster_timer_fields",
                                                       json{{"1", json{{"min", "m"}, {"sec", ""}}},
                                                            {"zero", json{{"min", "x"}}},
                                                            {"2", "not an object"}}}});
    REQUIRE(loaded.has_value());
    CHECK(loaded->auto_sync_interval_seconds == DS::Config::kMaxAutoSyncInterval);
    CHECK(loaded->round_mode == RoundMode::None);
    REQUIRE(loaded->timer_fields.size() == 1);
    CHECK(loaded->timer_fields.at(1).minutes_field == "m");
    CHECK_FALSE(loaded->timer_fields.at(1).seconds_field.has_value());

    auto low = DS::Config::settings_from_json(json{{"tricaster_auto_sync_interval", 0}});
    REQUIRE(low.has_value());
    CHECK(low->auto_sync_interval_seconds == DS::Config::kMinAutoSyncInterval);
}

TEST_CASE("Strict timer field parsing rejects bad entries") {
    auto good = DS::Config::timer_fields_from_json(json{{"2", json{{"timer", "tc"}}}});
    REQUIRE(good.has_value());
    CHECK(good->at(2).timer_field == "tc");

    auto bad_slot = DS::Config::timer_fields_from_json(json{{"-1", json::object()}});
    REQUIRE_FALSE(bad_slot.has_value());
    CHECK(bad_slot.error().code == DS::Error::Code::InvalidArgument);

    auto not_object = DS::Config::timer_fields_from_json(json::array());
    REQUIRE_FALSE(not_object.has_value());
    CHECK(not_object.error().code == DS::Error::Code::InvalidArgument);
}

TEST_CASE("Environment variables seed the defaults") {
    EnvGuard host{"TRICASTER_HOST", "192.168.0.20"};
    EnvGuard user{"TRICASTER_USER", nullptr};
    EnvGuard pass{"TRICASTER_PASS", "hunter2"};
    EnvGuard token{"TRICASTER_SINGULAR_TOKEN", "sync-tok"};
    EnvGuard mode{"TRICASTER_ROUND_MODE", "none"};
    EnvGuard legacy{"SINGULAR_TOKEN", "legacy-tok"};

    auto defaults = DS::Config::settings_env_defaults();
    CHECK(defaults.device.host == "192.168.0.20");
    CHECK(defaults.device.user == "admin");
    CHECK(defaults.device.password == "hunter2");
    CHECK(defaults.sync_token == "sync-tok");
    CHECK(defaults.round_mode == RoundMode::None);
    CHECK(defaults.control_tokens.at("Default") == "legacy-tok");

    auto merged = DS::Config::settings_from_json(json{{"tricaster_host", "10.9.9.9"}}, defaults);
    REQUIRE(merged.has_value());
    CHECK(merged->device.host == "10.9.9.9");
    CHECK(merged->device.password == "hunter2");
}

} // TEST_SUITE
