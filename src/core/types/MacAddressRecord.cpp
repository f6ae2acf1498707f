#include "core/types/MacAddressRecord.hpp"

#include <charconv>
#include <cstdio>

namespace netsweep::core {

std::optional<std::string> formatMacAddress(const std::vector<int>& octets) {
    if (octets.size() != 6) {
        return std::nullopt;
    }

    std::string mac;
    mac.reserve(17);
    for (size_t i = 0; i < octets.size(); ++i) {
        int octet = octets[i];
        if (octet < 0 || octet > 255) {
            return std::nullopt;
        }
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02X", octet);
        if (i > 0) {
            mac += ':';
        }
        mac += buf;
    }
    return mac;
}

std::optional<std::string> macAddressFromOidSuffix(const std::string& oid) {
    std::vector<int> components;
    size_t start = 0;
    while (start <= oid.size()) {
        size_t end = oid.find('.', start);
        if (end == std::string::npos) {
            end = oid.size();
        }
        int value = 0;
        const char* first = oid.data() + start;
        const char* last = oid.data() + end;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (first == last || ec != std::errc{} || ptr != last) {
            // A non-numeric component anywhere in the suffix makes it unusable
            components.push_back(-1);
        } else {
            components.push_back(value);
        }
        start = end + 1;
    }

    if (components.size() < 6) {
        return std::nullopt;
    }
    std::vector<int> suffix(components.end() - 6, components.end());
    return formatMacAddress(suffix);
}

} // namespace netsweep::core
