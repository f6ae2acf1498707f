/**
 * @file Vlan.hpp
 * @brief VLAN discovery result types.
 *
 * This file defines accepted and rejected VLAN entries and the aggregated
 * result of enumerating the VLAN table of one device.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace netsweep::core {

/** @brief Lowest VLAN identifier accepted. */
constexpr int MIN_VLAN_ID = 1;

/** @brief Highest VLAN identifier accepted and the cap on valid VLANs per device. */
constexpr int MAX_VLAN_ID = 4094;

/** @brief vtpVlanState value meaning operational. */
constexpr int VLAN_STATE_OPERATIONAL = 1;

/** @name Rejection reasons
 *  @{ */
constexpr const char* VLAN_REASON_RANGE = "Invalid VLAN ID range";
constexpr const char* VLAN_REASON_INACTIVE = "Inactive VLAN (status not 1)";
constexpr const char* VLAN_REASON_OVER_CAP = "Exceeded maximum valid VLAN count (4094)";
/** @} */

/**
 * @brief An accepted, operational VLAN.
 */
struct Vlan {
    int vlanId{0};                   ///< VLAN identifier in [1, 4094]
    std::string name;                ///< Configured name or "VLAN<id>" placeholder
    std::string state{"active"};     ///< Always "active" for accepted entries
    std::vector<std::string> usedBy; ///< Addresses of devices carrying the VLAN

    /**
     * @brief Returns the placeholder name used when the agent has none.
     * @param vlanId VLAN identifier.
     * @return "VLAN" followed by the decimal id.
     */
    static std::string placeholderName(int vlanId) { return "VLAN" + std::to_string(vlanId); }

    bool operator==(const Vlan& other) const = default;
};

/**
 * @brief A VLAN entry rejected during validation.
 */
struct InvalidVlan {
    int64_t vlanId{0};  ///< Identifier as reported by the agent, unclamped
    std::string reason; ///< One of the VLAN_REASON_* texts

    bool operator==(const InvalidVlan& other) const = default;
};

/**
 * @brief Raw walk responses kept for diagnostics.
 */
struct VlanRawResponses {
    std::vector<RawResponse> vlanState; ///< Every varbind of the state walk
    std::vector<RawResponse> vlanName;  ///< Every varbind of the name walk
};

/**
 * @brief Result of enumerating the VLANs of one device.
 *
 * Accepted entries are unique by id and ordered by ascending id once the
 * cap has been applied; otherwise they keep walk order.
 */
struct VlanDiscoveryResult {
    std::vector<Vlan> vlans;               ///< Accepted VLANs
    std::vector<InvalidVlan> invalidVlans; ///< Rejected entries with reasons
    int totalDiscovered{0};                ///< vlans + invalidVlans
    int validCount{0};                     ///< Number of accepted VLANs
    int invalidCount{0};                   ///< Number of rejected entries
    int activeCount{0};                    ///< Equal to validCount
    int inactiveCount{0};                  ///< Rejections caused by a non-operational state
    VlanRawResponses rawResponses;         ///< Diagnostics only

    /**
     * @brief Recomputes the count fields from the vlan and invalid lists.
     */
    void updateCounts();

    /**
     * @brief Returns the accepted VLAN ids in list order.
     * @return Vector of VLAN identifiers.
     */
    [[nodiscard]] std::vector<int> vlanIds() const;
};

} // namespace netsweep::core
