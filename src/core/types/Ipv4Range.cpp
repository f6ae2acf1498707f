#include "core/types/Ipv4Range.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Validation.hpp"

#include <algorithm>
#include <charconv>

namespace netsweep::core {

uint32_t Ipv4Range::addressFromString(const std::string& address) {
    if (!isValidIpAddress(address)) {
        throw ValidationError("Invalid IPv4 address: " + address);
    }

    uint32_t value = 0;
    size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        size_t end = address.find('.', start);
        if (end == std::string::npos) {
            end = address.size();
        }
        unsigned octet = 0;
        std::from_chars(address.data() + start, address.data() + end, octet);
        value = (value << 8) | (octet & 0xFF);
        start = end + 1;
    }
    return value;
}

std::string Ipv4Range::addressToString(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

Ipv4Range Ipv4Range::parse(const std::string& cidr) {
    auto slash = cidr.find('/');
    std::string addressPart = cidr.substr(0, slash);
    int prefix = 32;

    if (slash != std::string::npos) {
        std::string prefixPart = cidr.substr(slash + 1);
        auto [ptr, ec] =
            std::from_chars(prefixPart.data(), prefixPart.data() + prefixPart.size(), prefix);
        if (prefixPart.empty() || ec != std::errc{} || ptr != prefixPart.data() + prefixPart.size() ||
            prefix < 0 || prefix > 32) {
            throw ValidationError("Invalid prefix length in CIDR: " + cidr);
        }
    }

    uint32_t base = addressFromString(addressPart);
    if (prefix == 32) {
        return Ipv4Range(base, base, prefix);
    }

    uint32_t hostBits = 32 - static_cast<uint32_t>(prefix);
    uint32_t hostMask = hostBits == 32 ? 0xFFFFFFFFu : ((1u << hostBits) - 1);
    uint32_t network = base & ~hostMask;
    uint32_t broadcast = network | hostMask;

    if (prefix == 31) {
        return Ipv4Range(network, broadcast, prefix);
    }
    return Ipv4Range(network + 1, broadcast - 1, prefix);
}

std::vector<std::string> Ipv4Range::hosts(size_t limit) const {
    std::vector<std::string> result;
    if (limit == 0) {
        return result;
    }

    uint64_t total = size();
    uint64_t step = 1;
    if (total > limit) {
        step = total / limit;
    }

    result.reserve(static_cast<size_t>(std::min<uint64_t>(total, limit)));
    for (uint64_t current = first_; current <= last_ && result.size() < limit; current += step) {
        result.push_back(addressToString(static_cast<uint32_t>(current)));
    }
    return result;
}

} // namespace netsweep::core
