#include "discovery/HashOuiClassifier.hpp"

#include <charconv>

namespace netsweep::discovery {

std::string HashOuiClassifier::classify(const std::string& macAddress) const {
    // OUI is the first three octets: "AA:BB:CC"
    if (macAddress.size() < 8 || macAddress[2] != ':' || macAddress[5] != ':') {
        return "Unknown";
    }

    unsigned sum = 0;
    for (size_t offset : {size_t{0}, size_t{3}, size_t{6}}) {
        unsigned octet = 0;
        const char* first = macAddress.data() + offset;
        auto [ptr, ec] = std::from_chars(first, first + 2, octet, 16);
        if (ec != std::errc{} || ptr != first + 2) {
            return "Unknown";
        }
        sum += octet;
    }

    return CATEGORIES[sum % CATEGORIES.size()];
}

} // namespace netsweep::discovery
