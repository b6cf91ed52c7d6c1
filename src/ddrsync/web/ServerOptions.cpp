#include <ddrsync/web/ServerOptions.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace DS::Web {

namespace {

bool is_http_url(std::string_view value) {
    return value.starts_with("http://") || value.starts_with("https://");
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidServerPort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateServerOptions(ServerOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidServerPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.config_path.empty()) {
        return std::string{"--config must not be empty"};
    }
    if (!is_http_url(options.singular_api_base)) {
        return std::string{"--singular-api-base must be an http(s) URL"};
    }
    return std::nullopt;
}

bool ApplyServerEnvOverrides(ServerOptions& options) {
    if (!apply_env("DDRSYNC_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "DDRSYNC_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DDRSYNC_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "DDRSYNC_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("DDRSYNC_CONFIG", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "DDRSYNC_CONFIG must not be empty\n";
                return false;
            }
            options.config_path = std::string{value};
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintServerUsage() {
    std::cout << "Usage: ddrsync_server [options]\n"
              << "  --host <host>              Bind address (default 127.0.0.1)\n"
              << "  --port <port>              Bind port (default 3113)\n"
              << "  --config <path>            Settings file (default ddrsync.json)\n"
              << "  --singular-api-base <url>  Control app API base (default " << Remote::kDefaultControlApiBase
              << ")\n"
              << "  --help                     Show this help\n"
              << "Environment: DDRSYNC_HOST, DDRSYNC_PORT, DDRSYNC_CONFIG override the defaults;\n"
              << "TRICASTER_HOST, TRICASTER_USER, TRICASTER_PASS, TRICASTER_SINGULAR_TOKEN and\n"
              << "TRICASTER_ROUND_MODE seed settings missing from the file.\n";
}

std::optional<ServerOptions> ParseServerArguments(int argc, char** argv) {
    ServerOptions options{};
    if (!ApplyServerEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--config") {
            if (auto value = require_value(i, "--config")) {
                if (value->empty()) {
                    std::cerr << "--config must not be empty\n";
                    return std::nullopt;
                }
                options.config_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--singular-api-base") {
            if (auto value = require_value(i, "--singular-api-base")) {
                if (!is_http_url(*value)) {
                    std::cerr << "--singular-api-base must be an http(s) URL\n";
                    return std::nullopt;
                }
                options.singular_api_base = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateServerOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace DS::Web
