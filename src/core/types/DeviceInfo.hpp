/**
 * @file DeviceInfo.hpp
 * @brief Device identity and subnet scan result types.
 *
 * This file defines the classification outcome produced for a single SNMP
 * agent and the per-host record produced by a subnet sweep.
 */

#pragma once

#include <optional>
#include <string>

namespace netsweep::core {

/**
 * @brief Coarse functional class of a network device.
 */
enum class DeviceType : int {
    Switch = 0,     ///< Layer 2/3 switch
    Router = 1,     ///< Router or WAN edge
    AP = 2,         ///< Wireless access point
    Firewall = 3,   ///< Firewall or security appliance
    Controller = 4, ///< Wireless or SDN controller
    Other = 5       ///< Anything not matched by a rule
};

/**
 * @brief Identity of one SNMP-managed device.
 *
 * Value object built from the system MIB and optionally refined by the
 * entity and interface tables. Absent attributes stay unset.
 */
struct DeviceInfo {
    std::string address;                    ///< Address the device was queried at
    std::optional<std::string> sysDescr;    ///< sysDescr.0
    std::optional<std::string> sysObjectID; ///< sysObjectID.0
    std::optional<std::string> sysName;     ///< sysName.0
    std::optional<std::string> sysLocation; ///< sysLocation.0
    std::optional<std::string> manufacturer; ///< Vendor resolved from the enterprise OID
    std::optional<std::string> model;       ///< Model string extracted from sysDescr or inventory
    std::optional<std::string> exactModel;  ///< Model name confirmed by the entity table
    DeviceType type{DeviceType::Other};     ///< Functional classification

    /**
     * @brief Converts the device type to its display name.
     * @return "Switch", "Router", "AP", "Firewall", "Controller" or "Other".
     */
    [[nodiscard]] std::string typeToString() const;

    /**
     * @brief Parses a device type name.
     * @param str Display name as produced by typeToString().
     * @return The matching DeviceType, or Other when unrecognized.
     */
    static DeviceType typeFromString(const std::string& str);

    bool operator==(const DeviceInfo& other) const = default;
};

/**
 * @brief Outcome of identifying one host during a subnet sweep.
 */
struct ScannedHost {
    std::string address;              ///< Host address that was scanned
    bool reachable{false};            ///< Whether the agent answered the identity query
    std::optional<DeviceInfo> device; ///< Identity when reachable
    std::optional<std::string> error; ///< Failure text when not reachable

    bool operator==(const ScannedHost& other) const = default;
};

} // namespace netsweep::core
