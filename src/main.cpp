#include "app/Application.hpp"
#include "core/types/Errors.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    po::options_description options("Options");
    options.add_options()
        ("help,h", "Show help message")
        ("config-dir,c", po::value<std::string>(), "Configuration directory")
        ("cidr,r", po::value<std::string>(), "Subnet to scan, e.g. 192.168.1.0/24")
        ("watch,w", "Rescan periodically until interrupted")
        ("detail,d", po::value<std::string>(), "Fetch extended attributes for ADDRESS after the scan")
        ("log-level,l", po::value<std::string>(), "Console log level (trace, debug, info, warn, error)");

    netsweep::app::AppOptions appOptions;
    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "netsweep - subnet discovery and device classification\n\n"
                      << "Usage: " << argv[0] << " [options]\n\n"
                      << options << std::endl;
            return 0;
        }

        if (vm.count("config-dir")) {
            appOptions.configDir = vm["config-dir"].as<std::string>();
        }
        if (vm.count("cidr")) {
            appOptions.cidr = vm["cidr"].as<std::string>();
        }
        if (vm.count("detail")) {
            appOptions.detailAddress = vm["detail"].as<std::string>();
        }
        if (vm.count("log-level")) {
            appOptions.logLevel = vm["log-level"].as<std::string>();
        }
        appOptions.watch = vm.count("watch") > 0;
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << options << std::endl;
        return 2;
    }

    try {
        netsweep::app::Application app(std::move(appOptions));
        return app.run();
    } catch (const netsweep::core::InvalidConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const netsweep::core::InvalidRangeError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
