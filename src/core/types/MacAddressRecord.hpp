/**
 * @file MacAddressRecord.hpp
 * @brief MAC forwarding table records and sweep request/summary types.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/types/SnmpTypes.hpp"

namespace netsweep::core {

/**
 * @brief One learned MAC address on one VLAN.
 *
 * Unique per (macAddress, vlanId) within a single sweep.
 */
struct MacAddressRecord {
    std::string macAddress; ///< Upper-case, colon-separated ("AA:BB:CC:DD:EE:FF")
    int vlanId{0};          ///< VLAN the address was learned on
    std::string deviceType; ///< Label from the OUI classifier
    std::optional<int64_t> bridgePort; ///< Bridge port the address was learned on
    std::optional<std::string> port;   ///< Interface name of the bridge port, or "Port <n>"

    bool operator==(const MacAddressRecord& other) const = default;
};

/**
 * @brief Which VLANs a MAC sweep should visit.
 *
 * An explicit list wins over a single id; when neither is set the VLANs
 * are discovered from the device.
 */
struct VlanSelector {
    std::vector<int> vlanIds;  ///< Explicit VLAN list (deduplicated and sorted before use)
    std::optional<int> vlanId; ///< Single VLAN

    [[nodiscard]] bool empty() const { return vlanIds.empty() && !vlanId.has_value(); }
};

/**
 * @brief Parameters of a MAC address sweep.
 *
 * Either address or sessionId identifies the device. When a session id is
 * given, its peer address and community are used as the base target.
 */
struct MacDiscoveryRequest {
    std::string address;                   ///< Device address
    std::optional<std::string> sessionId;  ///< Registered session to sweep through
    std::string community{"public"};       ///< Base community string
    SnmpVersion version{SnmpVersion::V2c}; ///< Protocol version
    uint16_t port{161};                    ///< Agent UDP port
    VlanSelector vlans;                    ///< VLAN selection
};

/**
 * @brief Terminal summary of a MAC sweep.
 */
struct MacSweepSummary {
    std::vector<int> vlanIds;       ///< VLANs attempted, in sweep order
    std::string status{"success"};  ///< Always "success" once the sweep finished
    int totalMacAddresses{0};       ///< Records emitted over all chunks
    std::vector<int> failedVlans;   ///< VLANs whose walk failed
    std::vector<int> timedOutVlans; ///< VLANs whose walk hit the deadline (records kept)

    bool operator==(const MacSweepSummary& other) const = default;
};

/**
 * @brief Formats six octets as an upper-case, colon-separated MAC address.
 * @param octets Exactly six values in [0, 255].
 * @return Address text, or std::nullopt when the input is malformed.
 */
std::optional<std::string> formatMacAddress(const std::vector<int>& octets);

/**
 * @brief Extracts the MAC address encoded in the last six components of an OID.
 * @param oid Full forwarding table instance OID.
 * @return Address text, or std::nullopt when the suffix is not six octets.
 */
std::optional<std::string> macAddressFromOidSuffix(const std::string& oid);

} // namespace netsweep::core
