#include "app/Application.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/serialization/DeviceJson.hpp"

#include <asio.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>

namespace netsweep::app {

Application::Application(AppOptions options) : options_(std::move(options)) {
    if (options_.configDir.empty()) {
        options_.configDir = defaultConfigDir();
    }

    config_ = std::make_unique<infra::ConfigManager>(options_.configDir);
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }
    if (options_.cidr) {
        config_->config().cidr = *options_.cidr;
    }
    if (options_.logLevel) {
        config_->config().logLevel = *options_.logLevel;
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (scheduler_) {
        scheduler_->stop();
    }
    scheduler_.reset();

    // Outstanding scans still need the I/O threads to drain.
    engine_.reset();

    if (asioContext_) {
        asioContext_->stop();
    }
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "netsweep";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".config" / "netsweep";
    }
    return std::filesystem::current_path() / ".netsweep";
}

void Application::initializeLogging() {
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(config_->config().logLevel));

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("netsweep", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("netsweep starting...");
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Fail before any thread or socket is created
    cfg.scan.validate();

    asioContext_ = std::make_unique<infra::AsioContext>(
        static_cast<size_t>(std::max(1, cfg.ioThreads)));
    asioContext_->start();

    livenessProbe_ = std::make_unique<infra::LivenessProbe>(*asioContext_, cfg.useIcmp);
    portProbe_ = std::make_unique<infra::PortProbe>(*asioContext_);

    if (cfg.detailEnabled) {
        detailFetcher_ = std::make_unique<infra::HostnameDetailFetcher>(
            *asioContext_, std::chrono::milliseconds(cfg.detailTimeoutMs));
    }

    engine_ = std::make_unique<DiscoveryEngine>(*asioContext_, *livenessProbe_, *portProbe_,
                                                detailFetcher_.get(), cfg.classification);

    spdlog::info("Application components initialized");
}

int Application::run() {
    const auto cidr = config_->config().cidr;

    if (options_.watch || config_->config().scheduleEnabled) {
        return runWatch(cidr);
    }

    int rc = runOnce(cidr);
    if (rc == 0 && options_.detailAddress) {
        rc = printDetail(*options_.detailAddress);
    }
    return rc;
}

int Application::runOnce(const std::string& cidr) {
    auto result = engine_->runScan(cidr, config_->config().scan);

    auto j = infra::scanResultToJson(result);
    j["inventory"] = infra::devicesToJson(engine_->listDevices());
    std::cout << j.dump(2) << std::endl;

    return result.cancelled ? 1 : 0;
}

int Application::runWatch(const std::string& cidr) {
    const auto& cfg = config_->config();

    engine_->setChangeCallback([](uint64_t, const std::vector<core::InventoryChange>& changes) {
        for (const auto& change : changes) {
            std::cout << infra::changeToJson(change).dump() << std::endl;
        }
    });

    auto interval = std::chrono::minutes(std::max(1, cfg.scheduleIntervalMinutes));
    scheduler_ = std::make_unique<infra::ScanScheduler>(
        *asioContext_, std::chrono::duration_cast<std::chrono::milliseconds>(interval),
        [this, cidr]() {
            if (engine_->isScanning()) {
                spdlog::warn("Previous scan still running, skipping scheduled scan");
                return;
            }
            engine_->startScan(cidr, config_->config().scan);
        });

    std::promise<int> stopped;
    auto stoppedFuture = stopped.get_future();

    asio::signal_set signals(asioContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([&stopped](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, stopping", signalNumber);
        stopped.set_value(0);
    });

    spdlog::info("Watching {} every {} minute(s)", cidr, interval.count());
    scheduler_->start(true);

    int rc = stoppedFuture.get();

    scheduler_->stop();
    engine_->cancelScans();

    std::cout << infra::devicesToJson(engine_->listDevices()).dump(2) << std::endl;
    return rc;
}

int Application::printDetail(const std::string& address) {
    try {
        auto detail = engine_->getDeviceDetail(address);
        std::cout << infra::detailToJson(detail).dump(2) << std::endl;
        return 0;
    } catch (const core::DeviceNotFoundError& e) {
        spdlog::error("{}", e.what());
    } catch (const core::DetailUnavailableError& e) {
        spdlog::error("{}", e.what());
    }
    return 1;
}

} // namespace netsweep::app
