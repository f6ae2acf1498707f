/**
 * @file Ipv4Range.hpp
 * @brief IPv4 CIDR ranges and host enumeration for subnet sweeps.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Usable host range of an IPv4 CIDR block.
 *
 * A /32 holds a single host and a /31 holds both of its addresses. Any
 * shorter prefix excludes the network and broadcast addresses.
 */
class Ipv4Range {
public:
    /** @brief Default cap on the number of hosts returned by hosts(). */
    static constexpr size_t DEFAULT_HOST_LIMIT = 254;

    /**
     * @brief Parses "a.b.c.d/n" notation. A bare address is treated as /32.
     * @param cidr The CIDR text.
     * @return The usable range.
     * @throws ValidationError if the address or prefix length is malformed.
     */
    static Ipv4Range parse(const std::string& cidr);

    /**
     * @brief Enumerates host addresses in ascending order.
     *
     * When the range holds more usable hosts than @p limit, addresses are
     * sampled from the first usable host with a step of floor(total / limit).
     *
     * @param limit Maximum number of hosts to return.
     * @return Dotted-quad addresses.
     */
    [[nodiscard]] std::vector<std::string> hosts(size_t limit = DEFAULT_HOST_LIMIT) const;

    [[nodiscard]] uint32_t firstHost() const { return first_; }
    [[nodiscard]] uint32_t lastHost() const { return last_; }
    [[nodiscard]] int prefixLength() const { return prefix_; }

    /**
     * @brief Number of usable host addresses in the range.
     */
    [[nodiscard]] uint64_t size() const { return static_cast<uint64_t>(last_) - first_ + 1; }

    /**
     * @brief Parses a dotted-quad address.
     * @throws ValidationError if the text is not a valid IPv4 address.
     */
    static uint32_t addressFromString(const std::string& address);

    static std::string addressToString(uint32_t address);

private:
    Ipv4Range(uint32_t first, uint32_t last, int prefix) : first_(first), last_(last), prefix_(prefix) {}

    uint32_t first_;
    uint32_t last_;
    int prefix_;
};

} // namespace netsweep::core
