/**
 * @file SnmpTypes.hpp
 * @brief SNMP types, targets, and well-known OIDs used by the discovery engine.
 *
 * This file defines the community-based protocol versions, the decoded
 * variable binding representation, the connection target description and
 * the fixed object identifiers the discovery algorithms consume.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Supported SNMP protocol versions.
 *
 * Only the two community-based variants are supported.
 */
enum class SnmpVersion : int {
    V1 = 1, ///< SNMP version 1 (coded "1")
    V2c = 2 ///< SNMP version 2c (coded "2c")
};

/**
 * @brief SNMP data types as defined in RFC 2578.
 */
enum class SnmpDataType : int {
    Integer = 0,          ///< 32-bit signed integer
    OctetString = 1,      ///< Arbitrary binary or text data
    ObjectIdentifier = 2, ///< Object identifier (OID)
    IpAddress = 3,        ///< 32-bit IPv4 address
    Counter32 = 4,        ///< 32-bit counter (wraps at max)
    Gauge32 = 5,          ///< 32-bit gauge (can increase or decrease)
    TimeTicks = 6,        ///< Hundredths of a second since epoch
    Counter64 = 7,        ///< 64-bit counter
    Null = 8,             ///< Null value
    NoSuchObject = 9,     ///< OID does not exist
    NoSuchInstance = 10,  ///< Instance does not exist
    EndOfMibView = 11,    ///< End of MIB tree reached
    Malformed = 12,       ///< Value octets could not be decoded
    Unknown = 99          ///< Unknown data type
};

/**
 * @brief Connection parameters for one SNMP agent.
 */
struct SnmpTarget {
    std::string address;                  ///< IP address or hostname of the agent
    std::string community{"public"};      ///< Community string (shared secret)
    SnmpVersion version{SnmpVersion::V2c}; ///< Protocol version
    uint16_t port{161};                   ///< UDP port of the agent
    int timeoutMs{5000};                  ///< Per-request timeout in milliseconds
    int retries{1};                       ///< Retransmissions after the first attempt

    bool operator==(const SnmpTarget& other) const = default;
};

/**
 * @brief SNMP variable binding (OID + decoded value pair).
 *
 * The value is decoded according to the declared type tag: printable types
 * (OCTET STRING, OBJECT IDENTIFIER, IpAddress) become text, integer-like
 * types (INTEGER, Counter32, Gauge32, TimeTicks, Counter64) become a signed
 * 64-bit integer, everything else becomes a lowercase hex string.
 */
struct SnmpVarBind {
    std::string oid;                          ///< Object identifier
    SnmpDataType type{SnmpDataType::Unknown}; ///< Declared data type
    std::string value;                        ///< Text, decimal or hex representation
    std::optional<int64_t> intValue;          ///< Integer value (integer-like types only)

    /**
     * @brief Checks whether this binding carries an exception marker instead of a value.
     * @return True for noSuchObject, noSuchInstance, endOfMibView and
     *         values that failed to decode.
     */
    [[nodiscard]] bool isError() const {
        return type == SnmpDataType::NoSuchObject || type == SnmpDataType::NoSuchInstance ||
               type == SnmpDataType::EndOfMibView || type == SnmpDataType::Malformed;
    }

    /**
     * @brief Checks whether the value decoded to text.
     * @return True for OCTET STRING values.
     */
    [[nodiscard]] bool isText() const { return type == SnmpDataType::OctetString; }

    bool operator==(const SnmpVarBind& other) const = default;
};

/**
 * @brief Raw (oid, value) pair retained for diagnostics.
 *
 * Never used for decision logic.
 */
struct RawResponse {
    std::string oid;   ///< Object identifier as returned by the agent
    std::string value; ///< Value rendered as a string

    bool operator==(const RawResponse& other) const = default;
};

/**
 * @brief Well-known OIDs consumed by the discovery engine.
 */
namespace SnmpOids {
    /** @name System MIB (SNMPv2-MIB)
     *  @{ */
    constexpr const char* SYS_DESCR = "1.3.6.1.2.1.1.1.0";     ///< System description
    constexpr const char* SYS_OBJECT_ID = "1.3.6.1.2.1.1.2.0"; ///< System object ID
    constexpr const char* SYS_UPTIME = "1.3.6.1.2.1.1.3.0";    ///< System uptime
    constexpr const char* SYS_CONTACT = "1.3.6.1.2.1.1.4.0";   ///< System contact
    constexpr const char* SYS_NAME = "1.3.6.1.2.1.1.5.0";      ///< System name
    constexpr const char* SYS_LOCATION = "1.3.6.1.2.1.1.6.0";  ///< System location
    constexpr const char* SYS_SERVICES = "1.3.6.1.2.1.1.7.0";  ///< System services
    /** @} */

    /** @name Interface MIB (IF-MIB)
     *  @{ */
    constexpr const char* IF_DESCR = "1.3.6.1.2.1.2.2.1.2";   ///< Interface description column
    constexpr const char* IF_TYPE = "1.3.6.1.2.1.2.2.1.3";    ///< Interface type column
    constexpr const char* IF_NAME = "1.3.6.1.2.1.31.1.1.1.1"; ///< Interface name column (ifXTable)
    /** @} */

    /** @name Entity MIB (ENTITY-MIB)
     *  @{ */
    constexpr const char* ENT_PHYSICAL_MODEL_NAME = "1.3.6.1.2.1.47.1.1.1.1.13"; ///< Physical model name
    /** @} */

    /** @name Cisco VTP MIB (CISCO-VTP-MIB)
     *  @{ */
    constexpr const char* VTP_VLAN_STATE = "1.3.6.1.4.1.9.9.46.1.3.1.1.2"; ///< vtpVlanState
    constexpr const char* VTP_VLAN_NAME = "1.3.6.1.4.1.9.9.46.1.3.1.1.4";  ///< vtpVlanName
    /** @} */

    /** @name Bridge MIB (BRIDGE-MIB)
     *  @{ */
    constexpr const char* DOT1D_BASE_PORT_IF_INDEX = "1.3.6.1.2.1.17.1.4.1.2"; ///< Bridge port to ifIndex
    constexpr const char* DOT1D_TP_FDB_PORT = "1.3.6.1.2.1.17.4.3.1.2";        ///< MAC to bridge port
    /** @} */
}

/**
 * @brief Converts an SNMP version to its wire-level string code.
 * @param version The SNMP version to convert.
 * @return "1" or "2c".
 */
inline std::string snmpVersionToString(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "1";
        case SnmpVersion::V2c: return "2c";
    }
    return "2c";
}

/**
 * @brief Parses a version code.
 * @param str The string to parse ("1", "v1", "2c", "v2c").
 * @return The corresponding SnmpVersion, or std::nullopt if unsupported.
 */
inline std::optional<SnmpVersion> snmpVersionFromString(const std::string& str) {
    if (str == "1" || str == "v1") return SnmpVersion::V1;
    if (str == "2c" || str == "v2c") return SnmpVersion::V2c;
    return std::nullopt;
}

/**
 * @brief Converts an SNMP data type to its string representation.
 * @param type The data type to convert.
 * @return String representation (e.g., "INTEGER", "OCTET STRING").
 */
inline std::string snmpDataTypeToString(SnmpDataType type) {
    switch (type) {
        case SnmpDataType::Integer: return "INTEGER";
        case SnmpDataType::OctetString: return "OCTET STRING";
        case SnmpDataType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case SnmpDataType::IpAddress: return "IpAddress";
        case SnmpDataType::Counter32: return "Counter32";
        case SnmpDataType::Gauge32: return "Gauge32";
        case SnmpDataType::TimeTicks: return "TimeTicks";
        case SnmpDataType::Counter64: return "Counter64";
        case SnmpDataType::Null: return "Null";
        case SnmpDataType::NoSuchObject: return "noSuchObject";
        case SnmpDataType::NoSuchInstance: return "noSuchInstance";
        case SnmpDataType::EndOfMibView: return "endOfMibView";
        case SnmpDataType::Malformed: return "malformed";
        case SnmpDataType::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Returns the symbolic name of a system MIB scalar.
 * @param oid Full instance OID (e.g. "1.3.6.1.2.1.1.5.0").
 * @return "sysName" and friends, or "unknown".
 */
inline std::string systemOidName(const std::string& oid) {
    if (oid == SnmpOids::SYS_DESCR) return "sysDescr";
    if (oid == SnmpOids::SYS_OBJECT_ID) return "sysObjectID";
    if (oid == SnmpOids::SYS_UPTIME) return "sysUpTime";
    if (oid == SnmpOids::SYS_CONTACT) return "sysContact";
    if (oid == SnmpOids::SYS_NAME) return "sysName";
    if (oid == SnmpOids::SYS_LOCATION) return "sysLocation";
    if (oid == SnmpOids::SYS_SERVICES) return "sysServices";
    return "unknown";
}

} // namespace netsweep::core
