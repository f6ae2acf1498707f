#include "core/types/Vlan.hpp"

#include <algorithm>

namespace netsweep::core {

void VlanDiscoveryResult::updateCounts() {
    validCount = static_cast<int>(vlans.size());
    invalidCount = static_cast<int>(invalidVlans.size());
    totalDiscovered = validCount + invalidCount;
    activeCount = validCount;
    inactiveCount = static_cast<int>(
        std::count_if(invalidVlans.begin(), invalidVlans.end(),
                      [](const InvalidVlan& v) { return v.reason == VLAN_REASON_INACTIVE; }));
}

std::vector<int> VlanDiscoveryResult::vlanIds() const {
    std::vector<int> ids;
    ids.reserve(vlans.size());
    for (const auto& vlan : vlans) {
        ids.push_back(vlan.vlanId);
    }
    return ids;
}

} // namespace netsweep::core
