#include "app/Application.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Validation.hpp"
#include "discovery/DeviceIdentityResolver.hpp"
#include "discovery/HashOuiClassifier.hpp"
#include "discovery/MacAddressDiscoveryEngine.hpp"
#include "discovery/SubnetScanner.hpp"
#include "discovery/VlanDiscoveryEngine.hpp"
#include "infrastructure/snmp/SnmpTransport.hpp"
#include "infrastructure/streaming/JsonLinesSink.hpp"
#include "infrastructure/streaming/JsonSerialization.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <ostream>

namespace netsweep::app {

namespace {
constexpr size_t LOG_FILE_SIZE = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;
constexpr size_t ASIO_THREADS = 4;
} // namespace

Application::Application(CommandLineOptions options, std::shared_ptr<core::ISnmpTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    if (registry_) {
        registry_->stopReaper();
    }
    if (asioContext_) {
        asioContext_->stop();
    }
    spdlog::debug("NetSweep shutting down");
}

void Application::initializeLogging() {
    // stdout carries the JSON results, so the console log goes to stderr
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(options_.logLevel.value_or("info")));

    auto logger = std::make_shared<spdlog::logger>("netsweep", spdlog::sinks_init_list{consoleSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
}

void Application::attachFileLog() {
    auto logPath = config_->logPath();
    try {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), LOG_FILE_SIZE,
                                                                               LOG_FILE_COUNT);
        fileSink->set_level(spdlog::level::debug);
        spdlog::default_logger()->sinks().push_back(fileSink);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Cannot open log file {}: {}", logPath.string(), e.what());
        return;
    }

    if (!options_.logLevel) {
        spdlog::default_logger()->sinks().front()->set_level(
            spdlog::level::from_str(config_->config().logging.level));
    }

    spdlog::debug("NetSweep {} starting, log file {}", VERSION, logPath.string());
}

void Application::initializeComponents() {
    config_ = std::make_unique<infra::ConfigManager>(
        options_.configDir.value_or(infra::ConfigManager::defaultConfigDir()));
    config_->load();
    attachFileLog();

    const auto& cfg = config_->config();

    if (!transport_) {
        transport_ = std::make_shared<infra::SnmpTransport>();
    }

    asioContext_ = std::make_unique<infra::AsioContext>(ASIO_THREADS);
    asioContext_->start();

    infra::SessionSettings sessionSettings;
    sessionSettings.idleTtl = std::chrono::minutes(cfg.sessions.idleTtlMinutes);
    sessionSettings.sweepInterval = std::chrono::minutes(cfg.sessions.sweepIntervalMinutes);
    registry_ = std::make_unique<infra::SessionRegistry>(transport_, std::make_shared<core::SystemClock>(),
                                                         sessionSettings);
    registry_->startReaper(asioContext_->getContext());

    resolver_ = std::make_shared<discovery::DeviceIdentityResolver>(
        transport_, static_cast<size_t>(cfg.discovery.inventoryMaxRows));
    vlanEngine_ = std::make_shared<discovery::VlanDiscoveryEngine>(transport_);

    discovery::MacDiscoverySettings macSettings;
    macSettings.walkTimeout = std::chrono::milliseconds(cfg.discovery.macWalkTimeoutMs);
    macSettings.sessionTimeoutMs = cfg.discovery.macSessionTimeoutMs;
    macSettings.vlanSessionTimeoutMs = cfg.discovery.vlanSessionTimeoutMs;
    macEngine_ = std::make_unique<discovery::MacAddressDiscoveryEngine>(
        transport_, vlanEngine_, std::make_shared<discovery::HashOuiClassifier>(), registry_.get(),
        macSettings);
}

int Application::run(std::ostream& out) {
    try {
        if (options_.command == "identify") {
            runIdentify(out);
        } else if (options_.command == "vlans") {
            runVlans(out);
        } else if (options_.command == "macs") {
            runMacs(out);
        } else if (options_.command == "scan") {
            runScan(out);
        } else if (options_.command == "health") {
            runHealth(out);
        } else if (options_.command == "config") {
            runConfig(out);
        } else {
            throw core::ValidationError("Unknown command: " + options_.command);
        }
        return 0;
    } catch (const core::DiscoveryError& e) {
        spdlog::error("{} failed: {}", options_.command, e.what());
        out << infra::toJsonText(infra::errorToJson(e)) << '\n';
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{} failed unexpectedly: {}", options_.command, e.what());
        out << infra::toJsonText(infra::errorToJson(e)) << '\n';
        return 1;
    }
}

core::SnmpTarget Application::targetFor(const std::string& address) const {
    const auto& snmp = config_->config().snmp;

    core::SnmpTarget target;
    target.address = address;
    target.community = options_.community.value_or(config_->defaultCommunity());
    target.version = options_.version ? core::requireSnmpVersion(*options_.version) : snmp.version;
    target.port = snmp.port;
    target.timeoutMs = snmp.timeoutMs;
    target.retries = snmp.retries;
    return target;
}

void Application::runIdentify(std::ostream& out) {
    auto info = resolver_->identify(targetFor(options_.arguments.at(0)));

    auto j = infra::deviceInfoToJson(info);
    j["status"] = "success";
    out << infra::toJsonText(j, 2) << '\n';
}

void Application::runVlans(std::ostream& out) {
    auto target = targetFor(options_.arguments.at(0));
    target.timeoutMs = config_->config().discovery.vlanSessionTimeoutMs;
    auto result = vlanEngine_->discoverVlans(target);

    auto j = infra::vlanResultToJson(result);
    j["status"] = "success";
    j["address"] = target.address;
    out << infra::toJsonText(j, 2) << '\n';
}

void Application::runMacs(std::ostream& out) {
    auto target = targetFor(options_.arguments.at(0));
    auto sessionId = registry_->connect(target);

    core::MacDiscoveryRequest request;
    request.sessionId = sessionId;
    request.vlans.vlanIds = options_.vlanIds;

    infra::JsonLinesSink sink(out);
    auto progress = [](const std::string& message, int percent) {
        spdlog::info("[{:3}%] {}", percent, message);
    };

    try {
        macEngine_->discoverMacAddresses(request, sink, progress);
    } catch (const std::exception&) {
        registry_->disconnect(sessionId);
        throw;
    }
    registry_->disconnect(sessionId);
}

void Application::runScan(std::ostream& out) {
    const auto& cfg = config_->config();
    const auto& cidr = options_.arguments.at(0);

    discovery::ScanSettings settings;
    settings.concurrency = static_cast<size_t>(cfg.scan.concurrency);
    settings.maxHosts = static_cast<size_t>(cfg.scan.maxHosts);
    settings.timeoutMs = cfg.scan.timeoutMs;
    settings.port = cfg.snmp.port;

    auto version = options_.version ? core::requireSnmpVersion(*options_.version) : cfg.snmp.version;
    auto community = options_.community.value_or(config_->defaultCommunity());

    discovery::SubnetScanner scanner(resolver_, *asioContext_, settings);
    auto hosts = scanner.scan(cidr, community, version, [](size_t done, size_t total) {
        spdlog::debug("[Scan] {}/{} hosts done", done, total);
    });

    nlohmann::json list = nlohmann::json::array();
    size_t reachable = 0;
    for (const auto& host : hosts) {
        list.push_back(infra::scannedHostToJson(host));
        if (host.reachable) ++reachable;
    }

    nlohmann::json j;
    j["status"] = "success";
    j["range"] = cidr;
    j["scanned"] = hosts.size();
    j["reachable"] = reachable;
    j["hosts"] = list;
    out << infra::toJsonText(j, 2) << '\n';
}

void Application::runHealth(std::ostream& out) {
    nlohmann::json j;
    j["status"] = "ok";
    j["version"] = VERSION;
    j["activeSessions"] = registry_->count();
    j["configPath"] = config_->configPath().string();
    out << infra::toJsonText(j, 2) << '\n';
}

void Application::runConfig(std::ostream& out) {
    const auto& community = options_.arguments.at(1);
    if (!core::isValidCommunity(community)) {
        throw core::ValidationError("Community string is required");
    }
    config_->setSecureValue(infra::ConfigManager::COMMUNITY_SECRET, community);
    spdlog::info("Stored default community in {}", config_->configPath().string());

    nlohmann::json j;
    j["status"] = "success";
    j["stored"] = infra::ConfigManager::COMMUNITY_SECRET;
    out << infra::toJsonText(j, 2) << '\n';
}

} // namespace netsweep::app
