#pragma once

#include "app/CommandLine.hpp"
#include "core/services/ISnmpTransport.hpp"
#include "infrastructure/async/AsioContext.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/snmp/SessionRegistry.hpp"

#include <iosfwd>
#include <memory>

namespace netsweep::discovery {
class DeviceIdentityResolver;
class VlanDiscoveryEngine;
class MacAddressDiscoveryEngine;
} // namespace netsweep::discovery

namespace netsweep::app {

class Application {
public:
    static constexpr const char* VERSION = "1.0.0";

    /**
     * @param options Parsed command line.
     * @param transport Transport override; the UDP transport when null.
     */
    explicit Application(CommandLineOptions options, std::shared_ptr<core::ISnmpTransport> transport = nullptr);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Executes the command and writes its JSON result.
     * @return Process exit code: 0 on success, 1 on any error.
     */
    int run(std::ostream& out);

    infra::ConfigManager& config() { return *config_; }
    infra::SessionRegistry& sessions() { return *registry_; }

private:
    void initializeLogging();
    void initializeComponents();
    void attachFileLog();

    void runIdentify(std::ostream& out);
    void runVlans(std::ostream& out);
    void runMacs(std::ostream& out);
    void runScan(std::ostream& out);
    void runHealth(std::ostream& out);
    void runConfig(std::ostream& out);

    core::SnmpTarget targetFor(const std::string& address) const;

    CommandLineOptions options_;
    std::shared_ptr<core::ISnmpTransport> transport_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::SessionRegistry> registry_;

    std::shared_ptr<discovery::DeviceIdentityResolver> resolver_;
    std::shared_ptr<discovery::VlanDiscoveryEngine> vlanEngine_;
    std::unique_ptr<discovery::MacAddressDiscoveryEngine> macEngine_;
};

} // namespace netsweep::app
