#include "discovery/DeviceIdentityResolver.hpp"

#include "core/discovery/DeviceClassifier.hpp"
#include "core/types/DiscoveryError.hpp"
#include "core/types/Validation.hpp"
#include "discovery/WalkUtils.hpp"
#include "infrastructure/snmp/SnmpCodec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netsweep::discovery {

namespace {
const std::vector<std::string>& identityOids() {
    static const std::vector<std::string> oids = {
        core::SnmpOids::SYS_DESCR,
        core::SnmpOids::SYS_OBJECT_ID,
        core::SnmpOids::SYS_NAME,
        core::SnmpOids::SYS_LOCATION,
    };
    return oids;
}

void storeSystemValue(core::DeviceInfo& info, const core::SnmpVarBind& vb) {
    if (vb.oid == core::SnmpOids::SYS_DESCR) {
        info.sysDescr = vb.value;
    } else if (vb.oid == core::SnmpOids::SYS_OBJECT_ID) {
        info.sysObjectID = vb.value;
    } else if (vb.oid == core::SnmpOids::SYS_NAME) {
        info.sysName = vb.value;
    } else if (vb.oid == core::SnmpOids::SYS_LOCATION) {
        info.sysLocation = vb.value;
    }
}
} // anonymous namespace

DeviceIdentityResolver::DeviceIdentityResolver(std::shared_ptr<core::ISnmpTransport> transport,
                                               size_t inventoryMaxRows)
    : transport_(std::move(transport)), inventoryMaxRows_(inventoryMaxRows) {}

core::DeviceInfo DeviceIdentityResolver::identify(const core::SnmpTarget& target) {
    core::requireValidTarget(target.address, target.community);

    spdlog::info("[SNMP] Identifying device {} (v{})", target.address,
                 core::snmpVersionToString(target.version));

    core::ScopedSession session(transport_->open(target));

    core::DeviceInfo info;
    info.address = target.address;
    fetchSystemInfo(*session, info);

    info.manufacturer = core::DeviceClassifier::manufacturerFromObjectId(info.sysObjectID);
    info.model = core::DeviceClassifier::modelFromDescription(info.sysDescr, info.manufacturer);
    info.type = core::DeviceClassifier::typeFromSystemInfo(info.sysDescr, info.sysObjectID);

    if (info.manufacturer == "Cisco") {
        refineFromInventory(*session, info);
    }
    if (info.type == core::DeviceType::Other) {
        refineFromInterfaces(*session, info);
    }

    spdlog::info("[SNMP] Device info discovery complete for {}: hostname={}, manufacturer={}, "
                 "model={}, type={}",
                 target.address, info.sysName.value_or("-"), info.manufacturer.value_or("-"),
                 info.model.value_or("-"), info.typeToString());
    return info;
}

void DeviceIdentityResolver::fetchSystemInfo(core::ISnmpSession& session, core::DeviceInfo& info) {
    std::vector<core::SnmpVarBind> varbinds;
    try {
        varbinds = session.get(identityOids());
    } catch (const core::RequestError& e) {
        if (e.errorStatus() != infra::SnmpCodec::ERR_NO_SUCH_NAME) {
            throw;
        }
        // v1 agents fail the whole request when one OID is missing
        spdlog::debug("[SNMP] {} rejected combined GET ({}), querying OIDs individually",
                      session.target().address, e.what());
        for (const auto& oid : identityOids()) {
            try {
                auto single = session.get({oid});
                varbinds.insert(varbinds.end(), single.begin(), single.end());
            } catch (const core::RequestError& inner) {
                spdlog::warn("[SNMP] Error for OID {}: {}", oid, inner.what());
            }
        }
    }

    for (const auto& vb : varbinds) {
        if (vb.isError()) {
            spdlog::warn("[SNMP] Error for OID {}: {}", vb.oid, core::snmpDataTypeToString(vb.type));
            continue;
        }
        spdlog::debug("[RAW SNMP DEVICE INFO] {} ({}) = {}: {}", vb.oid, core::systemOidName(vb.oid),
                      core::snmpDataTypeToString(vb.type), vb.value);
        storeSystemValue(info, vb);
    }
}

void DeviceIdentityResolver::refineFromInventory(core::ISnmpSession& session, core::DeviceInfo& info) {
    try {
        auto stream = session.walk(core::SnmpOids::ENT_PHYSICAL_MODEL_NAME);
        auto rows = collectWalk(*stream, inventoryMaxRows_);

        std::vector<std::pair<long long, std::string>> indexed;
        for (const auto& vb : rows) {
            auto index = lastOidComponent(vb.oid);
            if (!index) {
                continue;
            }
            indexed.emplace_back(*index, trim(vb.value));
        }
        std::stable_sort(indexed.begin(), indexed.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<std::string> names;
        names.reserve(indexed.size());
        for (auto& [index, name] : indexed) {
            names.push_back(std::move(name));
        }

        if (auto exact = core::DeviceClassifier::exactModelFromInventory(names)) {
            spdlog::debug("[SNMP] Inventory model for {}: {}", info.address, *exact);
            info.exactModel = *exact;
            info.model = *exact;
        }
    } catch (const std::exception& e) {
        spdlog::debug("[SNMP] Inventory refinement failed for {}: {}", info.address, e.what());
    }
}

void DeviceIdentityResolver::refineFromInterfaces(core::ISnmpSession& session, core::DeviceInfo& info) {
    try {
        auto stream = session.walk(core::SnmpOids::IF_TYPE);
        auto rows = collectWalk(*stream);

        std::vector<int64_t> ifTypes;
        ifTypes.reserve(rows.size());
        for (const auto& vb : rows) {
            if (vb.intValue) {
                ifTypes.push_back(*vb.intValue);
            }
        }

        auto type = core::DeviceClassifier::typeFromInterfaceTypes(ifTypes);
        if (type != core::DeviceType::Other) {
            info.type = type;
            spdlog::debug("[SNMP] Classified {} as {} from {} interfaces", info.address,
                          info.typeToString(), ifTypes.size());
        }
    } catch (const std::exception& e) {
        spdlog::debug("[SNMP] Interface refinement failed for {}: {}", info.address, e.what());
    }
}

} // namespace netsweep::discovery
