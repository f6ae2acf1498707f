#include "infrastructure/streaming/JsonSerialization.hpp"

#include "core/types/DiscoveryError.hpp"

namespace netsweep::infra {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

nlohmann::json rawResponsesToJson(const std::vector<core::RawResponse>& responses) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : responses) {
        list.push_back({{"oid", r.oid}, {"value", r.value}});
    }
    return list;
}

} // namespace

nlohmann::json deviceInfoToJson(const core::DeviceInfo& info) {
    nlohmann::json j;
    j["address"] = info.address;
    j["sysDescr"] = optionalToJson(info.sysDescr);
    j["sysObjectID"] = optionalToJson(info.sysObjectID);
    j["sysName"] = optionalToJson(info.sysName);
    j["sysLocation"] = optionalToJson(info.sysLocation);
    j["manufacturer"] = optionalToJson(info.manufacturer);
    j["model"] = optionalToJson(info.model);
    j["exactModel"] = optionalToJson(info.exactModel);
    j["type"] = info.typeToString();
    return j;
}

nlohmann::json vlanResultToJson(const core::VlanDiscoveryResult& result) {
    nlohmann::json vlans = nlohmann::json::array();
    for (const auto& vlan : result.vlans) {
        vlans.push_back({{"vlanId", vlan.vlanId},
                         {"name", vlan.name},
                         {"state", vlan.state},
                         {"usedBy", vlan.usedBy}});
    }

    nlohmann::json invalid = nlohmann::json::array();
    for (const auto& entry : result.invalidVlans) {
        invalid.push_back({{"vlanId", entry.vlanId}, {"reason", entry.reason}});
    }

    nlohmann::json j;
    j["vlans"] = vlans;
    j["invalidVlans"] = invalid;
    j["totalDiscovered"] = result.totalDiscovered;
    j["validCount"] = result.validCount;
    j["invalidCount"] = result.invalidCount;
    j["activeCount"] = result.activeCount;
    j["inactiveCount"] = result.inactiveCount;
    j["rawResponses"]["vlanState"] = rawResponsesToJson(result.rawResponses.vlanState);
    j["rawResponses"]["vlanName"] = rawResponsesToJson(result.rawResponses.vlanName);
    return j;
}

nlohmann::json macRecordToJson(const core::MacAddressRecord& record) {
    nlohmann::json j;
    j["macAddress"] = record.macAddress;
    j["vlanId"] = record.vlanId;
    j["deviceType"] = record.deviceType;
    j["bridgePort"] = optionalToJson(record.bridgePort);
    j["port"] = optionalToJson(record.port);
    return j;
}

nlohmann::json macChunkToJson(int vlanId, const std::vector<core::MacAddressRecord>& records) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& record : records) {
        list.push_back(macRecordToJson(record));
    }

    nlohmann::json j;
    j["type"] = "macAddresses";
    j["vlanId"] = vlanId;
    j["macAddresses"] = list;
    return j;
}

nlohmann::json macSummaryToJson(const core::MacSweepSummary& summary) {
    nlohmann::json j;
    j["type"] = "summary";
    j["status"] = summary.status;
    j["vlanIds"] = summary.vlanIds;
    j["totalMacAddresses"] = summary.totalMacAddresses;
    j["failedVlans"] = summary.failedVlans;
    j["timedOutVlans"] = summary.timedOutVlans;
    return j;
}

nlohmann::json scannedHostToJson(const core::ScannedHost& host) {
    nlohmann::json j;
    j["address"] = host.address;
    j["reachable"] = host.reachable;
    j["device"] = host.device ? deviceInfoToJson(*host.device) : nlohmann::json(nullptr);
    j["error"] = optionalToJson(host.error);
    return j;
}

nlohmann::json errorToJson(const std::exception& error) {
    nlohmann::json j;
    j["status"] = "error";
    if (const auto* discovery = dynamic_cast<const core::DiscoveryError*>(&error)) {
        j["errorType"] = discovery->kind();
    } else {
        j["errorType"] = "InternalError";
    }
    j["error"] = error.what();
    return j;
}

std::string toJsonText(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace netsweep::infra
