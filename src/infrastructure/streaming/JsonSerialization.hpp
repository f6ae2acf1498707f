#pragma once

#include "core/types/DeviceInfo.hpp"
#include "core/types/MacAddressRecord.hpp"
#include "core/types/Vlan.hpp"

#include <exception>
#include <string>
#include <nlohmann/json.hpp>

namespace netsweep::infra {

/**
 * @name JSON views of discovery results
 * Field names are camelCase. Unset optionals are written as null.
 * @{
 */
nlohmann::json deviceInfoToJson(const core::DeviceInfo& info);
nlohmann::json vlanResultToJson(const core::VlanDiscoveryResult& result);
nlohmann::json macRecordToJson(const core::MacAddressRecord& record);
nlohmann::json macChunkToJson(int vlanId, const std::vector<core::MacAddressRecord>& records);
nlohmann::json macSummaryToJson(const core::MacSweepSummary& summary);
nlohmann::json scannedHostToJson(const core::ScannedHost& host);
/** @} */

/**
 * @brief Error object shown to callers: {"status":"error","errorType":...,"error":...}.
 *
 * errorType is DiscoveryError::kind() for engine errors and "InternalError"
 * for anything else.
 */
nlohmann::json errorToJson(const std::exception& error);

/**
 * @brief Serializes for output.
 *
 * Agent strings are raw octets; invalid UTF-8 sequences are written as
 * U+FFFD instead of failing the whole document.
 *
 * @param indent Pretty-print indent, or -1 for a single line.
 */
std::string toJsonText(const nlohmann::json& j, int indent = -1);

} // namespace netsweep::infra
