#pragma once

#include "core/services/ISnmpTransport.hpp"
#include "core/types/DeviceInfo.hpp"

#include <memory>

namespace netsweep::discovery {

/**
 * @brief Identifies vendor, model and type of an SNMP agent.
 *
 * One session is opened per call. The system MIB scalars are fetched with a
 * single GET; Cisco devices are refined from the entity table, and devices
 * still classified as Other are refined from their interface types. Both
 * refinements are best effort and never invalidate the base identity.
 */
class DeviceIdentityResolver {
public:
    /** @brief Default cap on entity table rows read during refinement. */
    static constexpr size_t DEFAULT_INVENTORY_ROWS = 10;

    explicit DeviceIdentityResolver(std::shared_ptr<core::ISnmpTransport> transport,
                                    size_t inventoryMaxRows = DEFAULT_INVENTORY_ROWS);

    /**
     * @brief Identifies the device at the given target.
     * @param target Agent address, community, version, timeout and retries.
     * @return The identity; absent attributes stay unset.
     * @throws core::ValidationError for a bad address or empty community.
     * @throws core::ConnectError, core::RequestTimeout, core::RequestError
     */
    core::DeviceInfo identify(const core::SnmpTarget& target);

private:
    void fetchSystemInfo(core::ISnmpSession& session, core::DeviceInfo& info);
    void refineFromInventory(core::ISnmpSession& session, core::DeviceInfo& info);
    void refineFromInterfaces(core::ISnmpSession& session, core::DeviceInfo& info);

    std::shared_ptr<core::ISnmpTransport> transport_;
    size_t inventoryMaxRows_;
};

} // namespace netsweep::discovery
