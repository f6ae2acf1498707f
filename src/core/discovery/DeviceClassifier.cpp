#include "core/discovery/DeviceClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>
#include <utility>

namespace netsweep::core {

namespace {

struct VendorPrefix {
    const char* prefix;
    const char* vendor;
};

constexpr VendorPrefix VENDOR_PREFIXES[] = {
    {"1.3.6.1.4.1.9.", "Cisco"},
    {"1.3.6.1.4.1.2636.", "Juniper"},
    {"1.3.6.1.4.1.4526.", "Aruba"},
    {"1.3.6.1.4.1.11.", "HP"},
    {"1.3.6.1.4.1.171.", "D-Link"},
    {"1.3.6.1.4.1.1916.", "Extreme"},
    {"1.3.6.1.4.1.6889.", "Avaya"},
    {"1.3.6.1.4.1.890.", "Zyxel"},
    {"1.3.6.1.4.1.3375.", "F5"},
    {"1.3.6.1.4.1.12356.", "Fortinet"},
    {"1.3.6.1.4.1.14988.", "Mikrotik"},
    {"1.3.6.1.4.1.25461.", "Palo Alto"},
    {"1.3.6.1.4.1.1991.", "Brocade"},
};

struct ModelRule {
    std::function<bool(const std::string&)> appliesTo;
    std::regex pattern;
    bool upperCase;
};

const std::vector<ModelRule>& modelRules() {
    static const std::vector<ModelRule> rules = {
        {[](const std::string& m) { return m == "Cisco"; },
         std::regex(R"(C\d+|CSR\d+|ASR\d+|ISR\d+|Nexus \d+|WS-\w+)", std::regex::icase), false},
        {[](const std::string& m) { return m == "Juniper"; },
         std::regex(R"(srx\d+|ex\d+|mx\d+|qfx\d+)", std::regex::icase), true},
        {[](const std::string& m) { return m == "HP" || m == "Aruba"; },
         std::regex(R"(\b[A-Z]\d{4}[A-Z]?\b|\bJ\d{4}[A-Z]\b)"), false},
        {[](const std::string&) { return true; }, std::regex(R"([A-Z0-9]+-[A-Z0-9]+)"), false},
    };
    return rules;
}

struct ObjectIdRule {
    std::vector<const char*> fragments;
    DeviceType type;
};

const std::vector<ObjectIdRule>& objectIdRules() {
    static const std::vector<ObjectIdRule> rules = {
        {{"1.3.6.1.4.1.9.1.516", "1.3.6.1.4.1.9.1.1745"}, DeviceType::Switch},
        {{"1.3.6.1.4.1.9.1.525", "1.3.6.1.4.1.9.1.1639"}, DeviceType::Router},
        {{"1.3.6.1.4.1.9.1.1250", "1.3.6.1.4.1.12356.101.1"}, DeviceType::Firewall},
    };
    return rules;
}

struct KeywordRule {
    std::vector<const char*> keywords;
    DeviceType type;
};

const std::vector<KeywordRule>& keywordRules() {
    static const std::vector<KeywordRule> rules = {
        {{"switch", "catalyst", "nexus"}, DeviceType::Switch},
        {{"router", "isr", "asr"}, DeviceType::Router},
        {{"wireless", "access point", "aironet"}, DeviceType::AP},
        {{"firewall", "asa", "fortigate"}, DeviceType::Firewall},
        {{"controller"}, DeviceType::Controller},
    };
    return rules;
}

// ifType values counted as Ethernet-like ports
constexpr int64_t ETHERNET_IF_TYPES[] = {6, 7, 62, 117};
constexpr int64_t IF_TYPE_PPP = 23;
constexpr int64_t IF_TYPE_TUNNEL = 131;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // anonymous namespace

std::optional<std::string> DeviceClassifier::manufacturerFromObjectId(
    const std::optional<std::string>& sysObjectID) {
    if (!sysObjectID || sysObjectID->empty()) {
        return std::nullopt;
    }

    const VendorPrefix* best = nullptr;
    size_t bestLength = 0;
    for (const auto& entry : VENDOR_PREFIXES) {
        std::string prefix = entry.prefix;
        if (sysObjectID->compare(0, prefix.size(), prefix) == 0 && prefix.size() > bestLength) {
            best = &entry;
            bestLength = prefix.size();
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return std::string(best->vendor);
}

std::optional<std::string> DeviceClassifier::modelFromDescription(
    const std::optional<std::string>& sysDescr, const std::optional<std::string>& manufacturer) {
    if (!sysDescr || sysDescr->empty()) {
        return std::nullopt;
    }

    const std::string vendor = manufacturer.value_or("");
    for (const auto& rule : modelRules()) {
        if (!rule.appliesTo(vendor)) {
            continue;
        }
        // Only the first applicable rule is consulted
        std::smatch match;
        if (!std::regex_search(*sysDescr, match, rule.pattern)) {
            return std::nullopt;
        }
        return rule.upperCase ? toUpper(match.str(0)) : match.str(0);
    }
    return std::nullopt;
}

DeviceType DeviceClassifier::typeFromSystemInfo(const std::optional<std::string>& sysDescr,
                                                const std::optional<std::string>& sysObjectID) {
    if (sysObjectID && !sysObjectID->empty()) {
        for (const auto& rule : objectIdRules()) {
            for (const char* fragment : rule.fragments) {
                if (sysObjectID->find(fragment) != std::string::npos) {
                    return rule.type;
                }
            }
        }
    }

    if (sysDescr && !sysDescr->empty()) {
        std::string lower = toLower(*sysDescr);
        for (const auto& rule : keywordRules()) {
            for (const char* keyword : rule.keywords) {
                if (lower.find(keyword) != std::string::npos) {
                    return rule.type;
                }
            }
        }
    }

    return DeviceType::Other;
}

bool DeviceClassifier::isModelLikeInventoryName(const std::string& name) {
    static const std::regex pattern(R"(^(WS-|C\d|N\dK|ISR|ASR|CSR|AIR-|ASA))");
    return std::regex_search(name, pattern);
}

std::optional<std::string> DeviceClassifier::exactModelFromInventory(const std::vector<std::string>& names) {
    size_t considered = 0;
    for (const auto& name : names) {
        if (name.empty()) {
            continue;
        }
        if (++considered > INVENTORY_CANDIDATES) {
            break;
        }
        if (isModelLikeInventoryName(name)) {
            return name;
        }
    }
    return std::nullopt;
}

DeviceType DeviceClassifier::typeFromInterfaceTypes(const std::vector<int64_t>& ifTypes) {
    int ethernet = 0;
    int wan = 0;
    for (int64_t ifType : ifTypes) {
        if (std::find(std::begin(ETHERNET_IF_TYPES), std::end(ETHERNET_IF_TYPES), ifType) !=
            std::end(ETHERNET_IF_TYPES)) {
            ++ethernet;
        } else if (ifType == IF_TYPE_PPP || ifType == IF_TYPE_TUNNEL) {
            ++wan;
        }
    }

    if (ethernet > SWITCH_ETHERNET_THRESHOLD) {
        return DeviceType::Switch;
    }
    if (wan > ROUTER_WAN_THRESHOLD) {
        return DeviceType::Router;
    }
    return DeviceType::Other;
}

} // namespace netsweep::core
