#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace netsweep::infra;
using namespace netsweep::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir() : configDir_(std::filesystem::temp_directory_path() / "netsweep_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "netsweep_config_new_test";
        std::filesystem::remove_all(tempPath);

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));
        REQUIRE(manager.configPath() == tempPath / "config.json");
        REQUIRE(std::filesystem::exists(tempPath / ".key"));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Log path is relative to the config directory") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());
        REQUIRE(manager.logPath() == testDir.path() / "netsweep.log");

        manager.config().logging.file = "/var/log/netsweep.log";
        REQUIRE(manager.logPath() == std::filesystem::path("/var/log/netsweep.log"));
    }
}

TEST_CASE("ConfigManager load", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Missing file writes defaults") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.snmp.community == "public");
        REQUIRE(config.snmp.version == SnmpVersion::V2c);
        REQUIRE(config.snmp.port == 161);
        REQUIRE(config.discovery.macWalkTimeoutMs == 3000);
        REQUIRE(config.discovery.macSessionTimeoutMs == 2000);
        REQUIRE(config.sessions.idleTtlMinutes == 30);
        REQUIRE(config.sessions.sweepIntervalMinutes == 5);
        REQUIRE(config.scan.maxHosts == 254);
    }

    SECTION("Values are read from the file") {
        writeFile(testDir.path() / "config.json", R"({
            "snmp": {"community": "ops", "version": "1", "port": 1161},
            "discovery": {"mac_walk_timeout_ms": 9000},
            "sessions": {"idle_ttl_minutes": 5},
            "scan": {"concurrency": 32},
            "logging": {"level": "debug"}
        })");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.snmp.community == "ops");
        REQUIRE(config.snmp.version == SnmpVersion::V1);
        REQUIRE(config.snmp.port == 1161);
        REQUIRE(config.snmp.timeoutMs == 5000);
        REQUIRE(config.discovery.macWalkTimeoutMs == 9000);
        REQUIRE(config.discovery.macSessionTimeoutMs == 2000);
        REQUIRE(config.sessions.idleTtlMinutes == 5);
        REQUIRE(config.scan.concurrency == 32);
        REQUIRE(config.logging.level == "debug");
    }

    SECTION("Unsupported version falls back to 2c") {
        writeFile(testDir.path() / "config.json", R"({"snmp": {"version": "3"}})");
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().snmp.version == SnmpVersion::V2c);
    }

    SECTION("Malformed JSON is reported") {
        writeFile(testDir.path() / "config.json", "{ not json");
        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().snmp.community == "public");
    }
}

TEST_CASE("ConfigManager save round trip", "[ConfigManager]") {
    TestConfigDir testDir;

    {
        ConfigManager manager(testDir.path());
        manager.config().snmp.retries = 3;
        manager.config().scan.timeoutMs = 250;
        REQUIRE(manager.save());
    }

    ConfigManager reloaded(testDir.path());
    REQUIRE(reloaded.load());
    REQUIRE(reloaded.config().snmp.retries == 3);
    REQUIRE(reloaded.config().scan.timeoutMs == 250);

    auto j = ConfigManager::toJson(reloaded.config());
    REQUIRE(j["snmp"]["version"] == "2c");
    REQUIRE(j["scan"]["timeout_ms"] == 250);
}

TEST_CASE("Secure community storage", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Default community comes from the plain setting when nothing is stored") {
        ConfigManager manager(testDir.path());
        manager.load();
        REQUIRE(manager.defaultCommunity() == "public");
        REQUIRE_FALSE(manager.getSecureValue(ConfigManager::COMMUNITY_SECRET).has_value());
    }

    SECTION("Stored community survives a reload and is not written in clear") {
        {
            ConfigManager manager(testDir.path());
            manager.load();
            manager.setSecureValue(ConfigManager::COMMUNITY_SECRET, "n0c-private");
        }

        std::ifstream file(testDir.path() / "config.json");
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        REQUIRE(content.find("n0c-private") == std::string::npos);
        REQUIRE(content.find("secure") != std::string::npos);

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.defaultCommunity() == "n0c-private");
    }

    SECTION("A value that no longer opens falls back to the plain setting") {
        writeFile(testDir.path() / "config.json",
                  R"({"snmp": {"community": "fallback"}, "secure": {"snmp.community": "AAAA"}})");
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.defaultCommunity() == "fallback");
    }
}

TEST_CASE("Default config directory", "[ConfigManager]") {
    auto dir = ConfigManager::defaultConfigDir();
    REQUIRE((dir.filename() == "netsweep" || dir.filename() == ".netsweep"));
}
