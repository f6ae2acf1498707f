#include "core/types/Validation.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Vlan.hpp"

#include <regex>

namespace netsweep::core {

namespace {
const std::regex& ipv4Pattern() {
    static const std::regex pattern(
        R"(^(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.)"
        R"((25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)");
    return pattern;
}
} // anonymous namespace

bool isValidIpAddress(const std::string& address) {
    return std::regex_match(address, ipv4Pattern());
}

bool isValidCommunity(const std::string& community) {
    return !community.empty();
}

bool isValidSnmpVersion(const std::string& version) {
    return version == "1" || version == "2c";
}

bool isValidVlanId(long long vlanId) {
    return vlanId >= MIN_VLAN_ID && vlanId <= MAX_VLAN_ID;
}

void requireValidTarget(const std::string& address, const std::string& community) {
    if (address.empty()) {
        throw ValidationError("IP address is required");
    }
    if (!isValidIpAddress(address)) {
        throw ValidationError("Invalid IP address format: " + address);
    }
    if (!isValidCommunity(community)) {
        throw ValidationError("Community string must not be empty");
    }
}

SnmpVersion requireSnmpVersion(const std::string& version) {
    if (version == "3" || version == "v3") {
        throw ValidationError("SNMP version 3 is not supported");
    }
    auto parsed = snmpVersionFromString(version);
    if (!parsed) {
        throw ValidationError("Invalid SNMP version: " + version);
    }
    return *parsed;
}

void requireValidVlanId(long long vlanId) {
    if (!isValidVlanId(vlanId)) {
        throw ValidationError("Invalid VLAN ID: " + std::to_string(vlanId));
    }
}

} // namespace netsweep::core
