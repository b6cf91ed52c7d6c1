#include <doctest/doctest.h>

#include <ddrsync/web/ServerOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

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

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

struct ClearServerEnv {
    EnvGuard host{"DDRSYNC_HOST", nullptr};
    EnvGuard port{"DDRSYNC_PORT", nullptr};
    EnvGuard config{"DDRSYNC_CONFIG", nullptr};
};

} // namespace

TEST_CASE("ServerOptions defaults apply without arguments") {
    ClearServerEnv env;
    ArgvBuilder    argv{"ddrsync_server"};
    auto           parsed = DS::Web::ParseServerArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "127.0.0.1");
    CHECK(parsed->port == DS::Web::kDefaultServerPort);
    CHECK(parsed->config_path == "ddrsync.json");
    CHECK(parsed->singular_api_base == DS::Remote::kDefaultControlApiBase);
    CHECK_FALSE(parsed->show_help);
}

TEST_CASE("ServerOptions validation helpers guard ranges") {
    CHECK(DS::Web::IsValidServerPort(80));
    CHECK(DS::Web::IsValidServerPort(65535));
    CHECK_FALSE(DS::Web::IsValidServerPort(0));
    CHECK_FALSE(DS::Web::IsValidServerPort(70000));
}

TEST_CASE("ServerOptions Validate detects invalid combinations") {
    DS::Web::ServerOptions options{};
    options.port = 70000;
    auto error   = DS::Web::ValidateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--port") != std::string::npos);

    options.port              = 8080;
    options.singular_api_base = "ftp://example";
    error                     = DS::Web::ValidateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--singular-api-base") != std::string::npos);

    options.singular_api_base = "http://localhost:9000";
    options.config_path.clear();
    error = DS::Web::ValidateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--config") != std::string::npos);
}

TEST_CASE("Command line flags override defaults") {
    ClearServerEnv env;
    ArgvBuilder    argv{"ddrsync_server",
                     "--host",
                     "0.0.0.0",
                     "--port",
                     "8080",
                     "--config",
                     "/tmp/ddr.json",
                     "--singular-api-base",
                     "http://localhost:9000/api"};
    auto           parsed = DS::Web::ParseServerArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 8080);
    CHECK(parsed->config_path == "/tmp/ddr.json");
    CHECK(parsed->singular_api_base == "http://localhost:9000/api");
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    EnvGuard host{"DDRSYNC_HOST", "0.0.0.0"};
    EnvGuard port{"DDRSYNC_PORT", "9090"};
    EnvGuard config{"DDRSYNC_CONFIG", "/etc/ddrsync.json"};

    ArgvBuilder argv{"ddrsync_server"};
    auto        parsed = DS::Web::ParseServerArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9090);
    CHECK(parsed->config_path == "/etc/ddrsync.json");

    ArgvBuilder flagged{"ddrsync_server", "--port", "7000"};
    auto        overridden = DS::Web::ParseServerArguments(flagged.argc(), flagged.argv());
    REQUIRE(overridden.has_value());
    CHECK(overridden->port == 7000);
}

TEST_CASE("Invalid environment values are rejected") {
    ClearServerEnv env;
    EnvGuard       port{"DDRSYNC_PORT", "not-a-port"};

    ArgvBuilder argv{"ddrsync_server"};
    CHECK_FALSE(DS::Web::ParseServerArguments(argv.argc(), argv.argv()).has_value());
}

TEST_CASE("Bad arguments fail parsing") {
    ClearServerEnv env;

    ArgvBuilder unknown{"ddrsync_server", "--verbose"};
    CHECK_FALSE(DS::Web::ParseServerArguments(unknown.argc(), unknown.argv()).has_value());

    ArgvBuilder missing{"ddrsync_server", "--port"};
    CHECK_FALSE(DS::Web::ParseServerArguments(missing.argc(), missing.argv()).has_value());

    ArgvBuilder zero{"ddrsync_server", "--port", "0"};
    CHECK_FALSE(DS::Web::ParseServerArguments(zero.argc(), zero.argv()).has_value());

    ArgvBuilder base{"ddrsync_server", "--singular-api-base", "app.singular.live"};
    CHECK_FALSE(DS::Web::ParseServerArguments(base.argc(), base.argv()).has_value());
}

TEST_CASE("Help stops argument processing") {
    ClearServerEnv env;
    ArgvBuilder    argv{"ddrsync_server", "--help", "--bogus"};
    auto           parsed = DS::Web::ParseServerArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->show_help);
}
