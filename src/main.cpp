#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "core/types/DiscoveryError.hpp"
#include "infrastructure/streaming/JsonSerialization.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    netsweep::app::CommandLineOptions options;
    try {
        options = netsweep::app::CommandLine::parse(argc, argv);
    } catch (const netsweep::core::ValidationError& e) {
        std::cout << netsweep::infra::toJsonText(netsweep::infra::errorToJson(e)) << '\n';
        std::cerr << netsweep::app::CommandLine::usage();
        return 1;
    }

    if (options.help) {
        std::cout << netsweep::app::CommandLine::usage();
        return 0;
    }

    try {
        netsweep::app::Application app(std::move(options));
        return app.run(std::cout);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cout << netsweep::infra::toJsonText(netsweep::infra::errorToJson(e)) << '\n';
        return 1;
    }
}
