#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace netsweep::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        config_ = fromJson(j);
        if (j.contains("secure") && j["secure"].is_object()) {
            secureValues_ = j["secure"];
        }

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson(config_);
        if (!secureValues_.empty()) {
            j["secure"] = secureValues_;
        }

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson(const AppConfig& config) {
    nlohmann::json j;

    j["snmp"]["community"] = config.snmp.community;
    j["snmp"]["version"] = core::snmpVersionToString(config.snmp.version);
    j["snmp"]["port"] = config.snmp.port;
    j["snmp"]["timeout_ms"] = config.snmp.timeoutMs;
    j["snmp"]["retries"] = config.snmp.retries;

    j["discovery"]["mac_walk_timeout_ms"] = config.discovery.macWalkTimeoutMs;
    j["discovery"]["mac_session_timeout_ms"] = config.discovery.macSessionTimeoutMs;
    j["discovery"]["vlan_session_timeout_ms"] = config.discovery.vlanSessionTimeoutMs;
    j["discovery"]["inventory_max_rows"] = config.discovery.inventoryMaxRows;

    j["sessions"]["idle_ttl_minutes"] = config.sessions.idleTtlMinutes;
    j["sessions"]["sweep_interval_minutes"] = config.sessions.sweepIntervalMinutes;

    j["scan"]["concurrency"] = config.scan.concurrency;
    j["scan"]["max_hosts"] = config.scan.maxHosts;
    j["scan"]["timeout_ms"] = config.scan.timeoutMs;

    j["logging"]["level"] = config.logging.level;
    j["logging"]["file"] = config.logging.file;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig config;

    if (j.contains("snmp")) {
        const auto& s = j["snmp"];
        config.snmp.community = s.value("community", "public");
        auto version = core::snmpVersionFromString(s.value("version", "2c"));
        if (!version) {
            spdlog::warn("Unsupported SNMP version in config, using 2c");
        }
        config.snmp.version = version.value_or(core::SnmpVersion::V2c);
        config.snmp.port = s.value("port", uint16_t{161});
        config.snmp.timeoutMs = s.value("timeout_ms", 5000);
        config.snmp.retries = s.value("retries", 1);
    }

    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        config.discovery.macWalkTimeoutMs = d.value("mac_walk_timeout_ms", 3000);
        config.discovery.macSessionTimeoutMs = d.value("mac_session_timeout_ms", 2000);
        config.discovery.vlanSessionTimeoutMs = d.value("vlan_session_timeout_ms", 5000);
        config.discovery.inventoryMaxRows = d.value("inventory_max_rows", 10);
    }

    if (j.contains("sessions")) {
        const auto& s = j["sessions"];
        config.sessions.idleTtlMinutes = s.value("idle_ttl_minutes", 30);
        config.sessions.sweepIntervalMinutes = s.value("sweep_interval_minutes", 5);
    }

    if (j.contains("scan")) {
        const auto& s = j["scan"];
        config.scan.concurrency = s.value("concurrency", 8);
        config.scan.maxHosts = s.value("max_hosts", 254);
        config.scan.timeoutMs = s.value("timeout_ms", 1000);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = l.value("level", "info");
        config.logging.file = l.value("file", "netsweep.log");
    }

    return config;
}

void ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    secureValues_[key] = secureStorage_->seal(key, value);
    if (!save()) {
        throw std::runtime_error("Failed to save configuration to " + configPath_.string());
    }
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    auto it = secureValues_.find(key);
    if (it == secureValues_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return secureStorage_->open(key, it->get<std::string>());
}

std::string ConfigManager::defaultCommunity() const {
    if (auto stored = getSecureValue(COMMUNITY_SECRET)) {
        return *stored;
    }
    return config_.snmp.community;
}

std::filesystem::path ConfigManager::logPath() const {
    std::filesystem::path file(config_.logging.file);
    return file.is_absolute() ? file : configDir_ / file;
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "netsweep";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "netsweep";
    }
    return std::filesystem::current_path() / ".netsweep";
}

} // namespace netsweep::infra
