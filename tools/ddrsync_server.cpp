#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <utility>

#include <ddrsync/config/SettingsFile.hpp>
#include <ddrsync/remote/HttpTransport.hpp>
#include <ddrsync/web/ControlServer.hpp>
#include <ddrsync/web/ControlService.hpp>
#include <ddrsync/web/ServerOptions.hpp>

namespace {
void handle_signal(int) {
    DS::Web::RequestControlServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = DS::Web::ParseServerArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        DS::Web::PrintServerUsage();
        return EXIT_SUCCESS;
    }

    auto settings = DS::Config::load_settings_file(options.config_path, DS::Config::settings_env_defaults());
    if (!settings) {
        std::cerr << "[ddrsync] Failed to load " << options.config_path << ": "
                  << DS::describeError(settings.error()) << "\n";
        return EXIT_FAILURE;
    }

    DS::Remote::HttplibTransport control_transport;
    DS::Remote::HttplibTransport device_transport;
    DS::Web::ControlService      service{std::move(*settings),
                                    std::filesystem::path{options.config_path},
                                    control_transport,
                                    device_transport,
                                    options.singular_api_base};

    auto report = service.bootstrap();
    std::cout << "[ddrsync] Registry: " << report.total_entries() << " subcompositions across "
              << report.apps.size() << " apps\n";

    DS::Web::ResetControlServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto context = service.context(options.port);
    return DS::Web::RunControlServer(context, options);
}
