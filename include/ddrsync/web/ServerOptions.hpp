#pragma once

#include <ddrsync/remote/ControlAppClient.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace DS::Web {

inline constexpr int kDefaultServerPort = 3113;

struct ServerOptions {
    std::string host{"127.0.0.1"};
    int         port{kDefaultServerPort};
    std::string config_path{"ddrsync.json"};
    std::string singular_api_base{Remote::kDefaultControlApiBase};
    bool        show_help{false};
};

auto ParseServerArguments(int argc, char** argv) -> std::optional<ServerOptions>;

void PrintServerUsage();

bool ApplyServerEnvOverrides(ServerOptions& options);

auto ValidateServerOptions(ServerOptions const& options) -> std::optional<std::string>;

bool IsValidServerPort(int port);

} // namespace DS::Web
