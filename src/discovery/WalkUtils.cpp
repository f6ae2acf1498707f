#include "discovery/WalkUtils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>

namespace netsweep::discovery {

std::optional<long long> lastOidComponent(const std::string& oid) {
    auto dot = oid.rfind('.');
    const char* first = oid.data() + (dot == std::string::npos ? 0 : dot + 1);
    const char* last = oid.data() + oid.size();

    long long value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (first == last || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::vector<core::SnmpVarBind> collectWalk(core::IWalkStream& stream, size_t maxRows) {
    std::vector<core::SnmpVarBind> rows;
    while (auto batch = stream.next()) {
        for (auto& vb : *batch) {
            if (vb.isError()) {
                spdlog::debug("[SNMP] Skipping {} ({})", vb.oid, core::snmpDataTypeToString(vb.type));
                continue;
            }
            rows.push_back(std::move(vb));
            if (maxRows > 0 && rows.size() >= maxRows) {
                return rows;
            }
        }
    }
    return rows;
}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

} // namespace netsweep::discovery
