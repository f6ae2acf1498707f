#pragma once

#include "core/types/SnmpTypes.hpp"
#include "infrastructure/crypto/SecureStorage.hpp"

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace netsweep::infra {

/**
 * @brief Defaults applied to every SNMP request unless overridden on the command line.
 */
struct SnmpConfig {
    std::string community{"public"};
    core::SnmpVersion version{core::SnmpVersion::V2c};
    uint16_t port{161};
    int timeoutMs{5000};
    int retries{1};
};

/**
 * @brief Timeouts and limits of the discovery engines.
 */
struct DiscoveryConfig {
    int macWalkTimeoutMs{3000};      ///< Wall-clock bound of one per-VLAN MAC walk.
    int macSessionTimeoutMs{2000};   ///< Request timeout of per-VLAN MAC sessions.
    int vlanSessionTimeoutMs{5000};  ///< Request timeout used while enumerating VLANs.
    int inventoryMaxRows{10};        ///< Rows read from entPhysicalModelName.
};

struct SessionConfig {
    int idleTtlMinutes{30};
    int sweepIntervalMinutes{5};
};

struct ScanConfig {
    int concurrency{8};   ///< Identifications running at once.
    int maxHosts{254};    ///< Hosts sampled from a large range.
    int timeoutMs{1000};  ///< Per-host request timeout.
};

struct LoggingConfig {
    std::string level{"info"};        ///< Console level; the file always logs debug.
    std::string file{"netsweep.log"}; ///< Relative to the config directory.
};

/**
 * @brief Application configuration settings.
 */
struct AppConfig {
    SnmpConfig snmp;
    DiscoveryConfig discovery;
    SessionConfig sessions;
    ScanConfig scan;
    LoggingConfig logging;
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves config.json in the config directory. Secrets are kept
 * encrypted under the "secure" section.
 */
class ConfigManager {
public:
    /** @brief Name of the secure entry holding the default community. */
    static constexpr const char* COMMUNITY_SECRET = "snmp.community";

    /**
     * @param configDir Configuration directory; created when missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults when the file is missing.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Encrypts and stores a secret, then saves the file.
     * @throws std::runtime_error if the configuration file cannot be written.
     */
    void setSecureValue(const std::string& key, const std::string& value);

    /**
     * @return Decrypted value if present and intact, nullopt otherwise.
     */
    std::optional<std::string> getSecureValue(const std::string& key) const;

    /**
     * @brief Community for requests without an explicit -c: the stored
     *        secret if any, else the plain snmp.community setting.
     */
    std::string defaultCommunity() const;

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path logPath() const;
    const std::filesystem::path& configDir() const { return configDir_; }

    /**
     * @brief $XDG_CONFIG_HOME/netsweep, else ~/.config/netsweep, else ./.netsweep.
     */
    static std::filesystem::path defaultConfigDir();

    static nlohmann::json toJson(const AppConfig& config);
    static AppConfig fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

} // namespace netsweep::infra
