#pragma once

#include "core/types/DeviceInfo.hpp"
#include "discovery/DeviceIdentityResolver.hpp"
#include "infrastructure/async/AsioContext.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace netsweep::discovery {

/**
 * @brief Limits of a subnet sweep.
 */
struct ScanSettings {
    size_t concurrency{8};   ///< Identifications in flight at once
    size_t maxHosts{254};    ///< Larger ranges are sampled down to this many hosts
    int timeoutMs{1000};     ///< Per-host request timeout
    uint16_t port{161};
};

/**
 * @brief Identifies every SNMP agent in an IPv4 range.
 *
 * Each host is identified with zero retries so one silent address cannot
 * stall the batch. Failures are reported per host and never abort the scan.
 */
class SubnetScanner {
public:
    using ProgressCallback = std::function<void(size_t completed, size_t total)>;

    SubnetScanner(std::shared_ptr<DeviceIdentityResolver> resolver, infra::AsioContext& context,
                  ScanSettings settings = {});

    /**
     * @brief Scans the hosts of a CIDR range.
     * @param cidr Range such as "10.0.0.0/24"; a bare address scans one host.
     * @param community Community string.
     * @param version Protocol version.
     * @param onProgress Called from worker threads after each host.
     * @return One entry per scanned host, in address order.
     * @throws core::ValidationError for a malformed range or empty community.
     * @throws std::runtime_error if the context is not running.
     */
    std::vector<core::ScannedHost> scan(const std::string& cidr, const std::string& community,
                                        core::SnmpVersion version,
                                        const ProgressCallback& onProgress = nullptr);

    [[nodiscard]] const ScanSettings& settings() const { return settings_; }

private:
    core::ScannedHost scanHost(const core::SnmpTarget& target);

    std::shared_ptr<DeviceIdentityResolver> resolver_;
    infra::AsioContext& context_;
    ScanSettings settings_;
};

} // namespace netsweep::discovery
