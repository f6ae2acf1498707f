#include "core/types/DeviceInfo.hpp"

namespace netsweep::core {

std::string DeviceInfo::typeToString() const {
    switch (type) {
    case DeviceType::Switch:
        return "Switch";
    case DeviceType::Router:
        return "Router";
    case DeviceType::AP:
        return "AP";
    case DeviceType::Firewall:
        return "Firewall";
    case DeviceType::Controller:
        return "Controller";
    case DeviceType::Other:
        return "Other";
    }
    return "Other";
}

DeviceType DeviceInfo::typeFromString(const std::string& str) {
    if (str == "Switch")
        return DeviceType::Switch;
    if (str == "Router")
        return DeviceType::Router;
    if (str == "AP")
        return DeviceType::AP;
    if (str == "Firewall")
        return DeviceType::Firewall;
    if (str == "Controller")
        return DeviceType::Controller;
    return DeviceType::Other;
}

} // namespace netsweep::core
