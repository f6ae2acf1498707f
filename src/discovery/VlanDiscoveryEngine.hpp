#pragma once

#include "core/services/ISnmpTransport.hpp"
#include "core/types/Vlan.hpp"

#include <memory>

namespace netsweep::discovery {

/**
 * @brief Enumerates the VLANs configured on a device from the VTP MIB.
 *
 * The state walk decides which ids are valid; the name walk only decorates
 * accepted VLANs, so a malformed name response can never introduce a VLAN
 * that failed validation.
 */
class VlanDiscoveryEngine {
public:
    explicit VlanDiscoveryEngine(std::shared_ptr<core::ISnmpTransport> transport);
    virtual ~VlanDiscoveryEngine() = default;

    /**
     * @brief Walks vtpVlanState and vtpVlanName on the target.
     * @param target Agent to query.
     * @return Accepted and rejected VLANs with counts and raw responses.
     * @throws core::ValidationError for a bad address or empty community.
     * @throws core::DiscoveryError if either walk fails; the session is closed regardless.
     */
    virtual core::VlanDiscoveryResult discoverVlans(const core::SnmpTarget& target);

private:
    std::shared_ptr<core::ISnmpTransport> transport_;
};

} // namespace netsweep::discovery
