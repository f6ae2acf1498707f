/**
 * @file DeviceClassifier.hpp
 * @brief Heuristic rule tables for vendor, model and device type.
 *
 * Every rule table is an ordered list of (predicate, result) pairs evaluated
 * first-match-wins. The functions are pure and never throw.
 */

#pragma once

#include "core/types/DeviceInfo.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Vendor and device-type heuristics over system MIB values.
 */
class DeviceClassifier {
public:
    /** @brief Inventory rows considered when refining a Cisco model. */
    static constexpr size_t INVENTORY_CANDIDATES = 3;

    /** @brief Ethernet-like interfaces above which a device is a switch. */
    static constexpr int SWITCH_ETHERNET_THRESHOLD = 10;

    /** @brief ppp + tunnel interfaces above which a device is a router. */
    static constexpr int ROUTER_WAN_THRESHOLD = 3;

    /**
     * @brief Resolves the vendor from the enterprise subtree of sysObjectID.
     * @param sysObjectID Value of sysObjectID.0.
     * @return Vendor name from the longest matching prefix, or std::nullopt.
     */
    static std::optional<std::string> manufacturerFromObjectId(const std::optional<std::string>& sysObjectID);

    /**
     * @brief Extracts a model string from sysDescr using the vendor's pattern.
     *
     * Cisco, Juniper and HP/Aruba have dedicated patterns; everything else
     * uses a generic "ABC-123" pattern. Juniper models are upper-cased.
     *
     * @param sysDescr Value of sysDescr.0.
     * @param manufacturer Vendor resolved by manufacturerFromObjectId().
     * @return First match, or std::nullopt.
     */
    static std::optional<std::string> modelFromDescription(const std::optional<std::string>& sysDescr,
                                                           const std::optional<std::string>& manufacturer);

    /**
     * @brief Classifies by known sysObjectID values, then by sysDescr keywords.
     * @return The first matching type, or DeviceType::Other.
     */
    static DeviceType typeFromSystemInfo(const std::optional<std::string>& sysDescr,
                                         const std::optional<std::string>& sysObjectID);

    /**
     * @brief Checks whether an entPhysicalModelName value looks like a product model.
     */
    static bool isModelLikeInventoryName(const std::string& name);

    /**
     * @brief Picks the exact model from entity table rows.
     *
     * Rows must already be sorted by index. Among the first
     * INVENTORY_CANDIDATES non-empty names, the first model-like one wins.
     *
     * @param names entPhysicalModelName values in index order.
     * @return The model, or std::nullopt.
     */
    static std::optional<std::string> exactModelFromInventory(const std::vector<std::string>& names);

    /**
     * @brief Classifies by the mix of interface types.
     * @param ifTypes ifType values of all interfaces.
     * @return Switch, Router, or Other when neither threshold is exceeded.
     */
    static DeviceType typeFromInterfaceTypes(const std::vector<int64_t>& ifTypes);
};

} // namespace netsweep::core
