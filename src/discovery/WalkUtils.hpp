#pragma once

#include "core/services/ISnmpTransport.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netsweep::discovery {

/**
 * @brief Parses the final dotted component of an OID as a decimal integer.
 * @return The value, or std::nullopt if the component is not numeric.
 */
std::optional<long long> lastOidComponent(const std::string& oid);

/**
 * @brief Drains a walk, skipping varbinds that carry an exception marker.
 * @param stream Walk to drain.
 * @param maxRows Stop once this many rows were collected (0 means unbounded).
 * @return Collected varbinds in walk order.
 * @throws core::DiscoveryError as raised by the stream.
 */
std::vector<core::SnmpVarBind> collectWalk(core::IWalkStream& stream, size_t maxRows = 0);

/**
 * @brief Strips leading and trailing whitespace.
 */
std::string trim(const std::string& text);

} // namespace netsweep::discovery
