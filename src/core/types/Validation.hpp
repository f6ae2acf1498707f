/**
 * @file Validation.hpp
 * @brief Input validation for addresses, communities, versions and VLAN ids.
 *
 * The predicates never throw. The require* helpers throw ValidationError
 * and are used on engine entry and at the command-line surface.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <string>

namespace netsweep::core {

/**
 * @brief Checks for a dotted-quad IPv4 address with octets in [0, 255].
 */
[[nodiscard]] bool isValidIpAddress(const std::string& address);

/**
 * @brief Checks for a non-empty community string.
 */
[[nodiscard]] bool isValidCommunity(const std::string& community);

/**
 * @brief Checks for a supported version code ("1" or "2c").
 *
 * "3" is recognized as a version code but is not supported.
 */
[[nodiscard]] bool isValidSnmpVersion(const std::string& version);

/**
 * @brief Checks that a VLAN id lies in [1, 4094].
 */
[[nodiscard]] bool isValidVlanId(long long vlanId);

/**
 * @brief Validates an address and community pair.
 * @throws ValidationError on the first violation.
 */
void requireValidTarget(const std::string& address, const std::string& community);

/**
 * @brief Parses and validates a version code.
 * @return The parsed version.
 * @throws ValidationError for unknown codes and for the unsupported "3".
 */
SnmpVersion requireSnmpVersion(const std::string& version);

/**
 * @brief Validates a VLAN id.
 * @throws ValidationError if the id is out of range.
 */
void requireValidVlanId(long long vlanId);

} // namespace netsweep::core
