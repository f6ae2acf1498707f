#include "discovery/VlanDiscoveryEngine.hpp"

#include "core/types/Validation.hpp"
#include "discovery/WalkUtils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <map>
#include <set>

namespace netsweep::discovery {

namespace {
int decodeState(const core::SnmpVarBind& vb) {
    if (vb.intValue) {
        return static_cast<int>(*vb.intValue);
    }
    if (vb.isText()) {
        std::string text = trim(vb.value);
        int state = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), state);
        if (ec == std::errc{}) {
            return state;
        }
    }
    return 0;
}

std::string joinIds(const std::vector<core::Vlan>& vlans) {
    std::string ids;
    for (const auto& vlan : vlans) {
        if (!ids.empty()) ids += ", ";
        ids += std::to_string(vlan.vlanId);
    }
    return ids;
}
} // anonymous namespace

VlanDiscoveryEngine::VlanDiscoveryEngine(std::shared_ptr<core::ISnmpTransport> transport)
    : transport_(std::move(transport)) {}

core::VlanDiscoveryResult VlanDiscoveryEngine::discoverVlans(const core::SnmpTarget& target) {
    core::requireValidTarget(target.address, target.community);

    spdlog::info("[SNMP] Discovering VLANs from {} (v{})", target.address,
                 core::snmpVersionToString(target.version));

    core::ScopedSession session(transport_->open(target));
    core::VlanDiscoveryResult result;
    std::map<int, size_t> candidateIndex;
    std::set<long long> processed;

    // State pass
    auto stateWalk = session->walk(core::SnmpOids::VTP_VLAN_STATE);
    while (auto batch = stateWalk->next()) {
        for (const auto& vb : *batch) {
            if (vb.isError()) {
                spdlog::debug("[SNMP] Skipping {} ({})", vb.oid, core::snmpDataTypeToString(vb.type));
                continue;
            }
            result.rawResponses.vlanState.push_back({vb.oid, vb.value});

            auto id = lastOidComponent(vb.oid);
            if (!id || processed.count(*id) > 0) {
                continue;
            }
            processed.insert(*id);

            if (!core::isValidVlanId(*id)) {
                result.invalidVlans.push_back({static_cast<int64_t>(*id), core::VLAN_REASON_RANGE});
                continue;
            }

            int vlanId = static_cast<int>(*id);
            int state = decodeState(vb);
            if (state == core::VLAN_STATE_OPERATIONAL) {
                spdlog::debug("[SNMP] Found active VLAN {} on {}", vlanId, target.address);
                core::Vlan vlan;
                vlan.vlanId = vlanId;
                vlan.name = core::Vlan::placeholderName(vlanId);
                vlan.usedBy.push_back(target.address);
                candidateIndex[vlanId] = result.vlans.size();
                result.vlans.push_back(std::move(vlan));
            } else {
                result.invalidVlans.push_back({vlanId, core::VLAN_REASON_INACTIVE});
            }
        }
    }
    spdlog::debug("[SNMP] State walk complete, active VLAN IDs: {}", joinIds(result.vlans));

    // Name pass
    if (!result.vlans.empty()) {
        processed.clear();
        auto nameWalk = session->walk(core::SnmpOids::VTP_VLAN_NAME);
        while (auto batch = nameWalk->next()) {
            for (const auto& vb : *batch) {
                if (vb.isError()) {
                    continue;
                }
                result.rawResponses.vlanName.push_back({vb.oid, vb.value});

                auto id = lastOidComponent(vb.oid);
                if (!id || !core::isValidVlanId(*id) || processed.count(*id) > 0) {
                    continue;
                }
                processed.insert(*id);

                auto it = candidateIndex.find(static_cast<int>(*id));
                if (it == candidateIndex.end() || !vb.isText()) {
                    continue;
                }
                auto& vlan = result.vlans[it->second];
                std::string name = trim(vb.value);
                vlan.name = name.empty() ? core::Vlan::placeholderName(vlan.vlanId) : name;
                spdlog::debug("[SNMP] VLAN {} name: {}", vlan.vlanId, vlan.name);
            }
        }
    }

    if (result.vlans.size() > static_cast<size_t>(core::MAX_VLAN_ID)) {
        spdlog::warn("[SNMP] Found {} VLANs which exceeds the maximum of {}, limiting", result.vlans.size(),
                     core::MAX_VLAN_ID);
        std::sort(result.vlans.begin(), result.vlans.end(),
                  [](const core::Vlan& a, const core::Vlan& b) { return a.vlanId < b.vlanId; });
        for (size_t i = core::MAX_VLAN_ID; i < result.vlans.size(); ++i) {
            result.invalidVlans.push_back({result.vlans[i].vlanId, core::VLAN_REASON_OVER_CAP});
        }
        result.vlans.resize(core::MAX_VLAN_ID);
    }

    result.updateCounts();
    spdlog::info("[SNMP] Found {} active VLANs on {} (ignored {} inactive and {} invalid VLANs)",
                 result.activeCount, target.address, result.inactiveCount,
                 result.invalidCount - result.inactiveCount);
    return result;
}

} // namespace netsweep::discovery
