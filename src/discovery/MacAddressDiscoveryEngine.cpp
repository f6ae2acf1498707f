#include "discovery/MacAddressDiscoveryEngine.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Validation.hpp"
#include "discovery/WalkUtils.hpp"
#include "infrastructure/snmp/SessionRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

namespace netsweep::discovery {

namespace {

// Last OID component -> varbind, for one table column
std::map<long long, core::SnmpVarBind> walkColumn(core::ISnmpSession& session, const char* root,
                                                  std::chrono::steady_clock::time_point deadline) {
    auto stream = session.walk(root);
    stream->setDeadline(deadline);

    std::map<long long, core::SnmpVarBind> column;
    for (auto& vb : collectWalk(*stream)) {
        if (auto index = lastOidComponent(vb.oid)) {
            column.emplace(*index, std::move(vb));
        }
    }
    return column;
}

} // anonymous namespace

MacAddressDiscoveryEngine::MacAddressDiscoveryEngine(std::shared_ptr<core::ISnmpTransport> transport,
                                                     std::shared_ptr<VlanDiscoveryEngine> vlanEngine,
                                                     std::shared_ptr<core::IOuiClassifier> classifier,
                                                     infra::SessionRegistry* registry,
                                                     MacDiscoverySettings settings)
    : transport_(std::move(transport)), vlanEngine_(std::move(vlanEngine)),
      classifier_(std::move(classifier)), registry_(registry), settings_(settings) {}

std::string MacAddressDiscoveryEngine::scopedCommunity(const std::string& community, int vlanId) {
    if (vlanId == 1) {
        return community;
    }
    return community + "@" + std::to_string(vlanId);
}

std::vector<int> MacAddressDiscoveryEngine::normalizeVlanIds(std::vector<int> vlanIds) {
    for (int id : vlanIds) {
        core::requireValidVlanId(id);
    }
    std::sort(vlanIds.begin(), vlanIds.end());
    vlanIds.erase(std::unique(vlanIds.begin(), vlanIds.end()), vlanIds.end());
    return vlanIds;
}

core::MacSweepSummary MacAddressDiscoveryEngine::discoverMacAddresses(const core::MacDiscoveryRequest& request,
                                                                      core::IMacResultSink& sink,
                                                                      const ProgressCallback& progress) {
    auto base = resolveBaseTarget(request);
    auto vlanIds = selectVlans(request, base);

    spdlog::info("[SNMP] Discovering MAC addresses on {} across {} VLANs", base.address, vlanIds.size());

    core::MacSweepSummary summary;
    std::set<int> visited;
    size_t index = 0;

    for (int vlanId : vlanIds) {
        ++index;
        if (!visited.insert(vlanId).second) {
            continue;
        }
        if (progress) {
            progress("Scanning VLAN " + std::to_string(vlanId),
                     static_cast<int>((index - 1) * 100 / vlanIds.size()));
        }

        summary.vlanIds.push_back(vlanId);
        std::vector<core::MacAddressRecord> records;
        switch (sweepVlan(base, vlanId, records)) {
            case WalkOutcome::Complete:
                break;
            case WalkOutcome::TimedOut:
                summary.timedOutVlans.push_back(vlanId);
                break;
            case WalkOutcome::Failed:
                summary.failedVlans.push_back(vlanId);
                break;
        }

        summary.totalMacAddresses += static_cast<int>(records.size());
        spdlog::debug("[SNMP] VLAN {}: {} MAC addresses", vlanId, records.size());
        sink.onChunk(vlanId, records);
    }

    spdlog::info("[SNMP] MAC discovery complete for {}: {} addresses on {} VLANs ({} failed, {} timed out)",
                 base.address, summary.totalMacAddresses, summary.vlanIds.size(), summary.failedVlans.size(),
                 summary.timedOutVlans.size());
    if (progress) {
        progress("MAC discovery complete", 100);
    }
    sink.onComplete(summary);
    return summary;
}

core::SnmpTarget MacAddressDiscoveryEngine::resolveBaseTarget(const core::MacDiscoveryRequest& request) {
    core::SnmpTarget base;
    base.version = request.version;
    base.port = request.port;
    base.community = request.community;

    if (request.sessionId) {
        if (!registry_) {
            throw core::SessionNotFound("Session registry not available");
        }
        auto session = registry_->find(*request.sessionId);
        if (!session) {
            throw core::SessionNotFound("Session not found: " + *request.sessionId);
        }
        if (!session->isOpen()) {
            registry_->reportTransportError(*request.sessionId, "transport closed underneath the session");
            throw core::SessionNotFound("Session no longer usable: " + *request.sessionId);
        }
        const auto& peer = session->target();
        base.address = peer.address;
        base.community = peer.community;
        base.version = peer.version;
        base.port = peer.port;
    } else {
        base.address = request.address;
    }

    core::requireValidTarget(base.address, base.community);
    return base;
}

std::vector<int> MacAddressDiscoveryEngine::selectVlans(const core::MacDiscoveryRequest& request,
                                                        const core::SnmpTarget& base) {
    if (!request.vlans.vlanIds.empty()) {
        return normalizeVlanIds(request.vlans.vlanIds);
    }
    if (request.vlans.vlanId) {
        core::requireValidVlanId(*request.vlans.vlanId);
        return {*request.vlans.vlanId};
    }

    core::SnmpTarget vlanTarget = base;
    vlanTarget.timeoutMs = settings_.vlanSessionTimeoutMs;
    vlanTarget.retries = settings_.vlanSessionRetries;

    try {
        auto result = vlanEngine_->discoverVlans(vlanTarget);
        auto ids = result.vlanIds();
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    } catch (const std::exception& e) {
        spdlog::warn("[SNMP] VLAN discovery failed for {}, falling back to VLAN 1: {}", base.address, e.what());
        return {1};
    }
}

MacAddressDiscoveryEngine::WalkOutcome MacAddressDiscoveryEngine::sweepVlan(
    const core::SnmpTarget& base, int vlanId, std::vector<core::MacAddressRecord>& records) {
    core::SnmpTarget target = base;
    target.community = scopedCommunity(base.community, vlanId);
    target.timeoutMs = settings_.sessionTimeoutMs;
    target.retries = 0;

    std::set<std::pair<std::string, int>> seen;
    WalkOutcome outcome = WalkOutcome::Complete;

    try {
        core::ScopedSession session(transport_->open(target));
        try {
            auto stream = session->walk(core::SnmpOids::DOT1D_TP_FDB_PORT);
            stream->setDeadline(std::chrono::steady_clock::now() + settings_.walkTimeout);

            while (auto batch = stream->next()) {
                for (const auto& vb : *batch) {
                    if (vb.isError()) {
                        continue;
                    }
                    auto mac = core::macAddressFromOidSuffix(vb.oid);
                    if (!mac) {
                        spdlog::warn("[SNMP] Skipping malformed forwarding entry {} on VLAN {}", vb.oid, vlanId);
                        continue;
                    }
                    if (!seen.emplace(*mac, vlanId).second) {
                        continue;
                    }

                    core::MacAddressRecord record;
                    record.macAddress = *mac;
                    record.vlanId = vlanId;
                    record.deviceType = classifier_->classify(*mac);
                    record.bridgePort = vb.intValue;
                    records.push_back(std::move(record));
                }
            }
        } catch (const core::RequestTimeout& e) {
            spdlog::warn("[SNMP] MAC walk on VLAN {} of {} timed out, keeping {} addresses: {}", vlanId,
                         base.address, records.size(), e.what());
            outcome = WalkOutcome::TimedOut;
        }

        std::map<int64_t, std::string> names;
        if (outcome == WalkOutcome::Complete && !records.empty()) {
            names = resolvePortNames(*session, vlanId);
        }
        for (auto& record : records) {
            if (!record.bridgePort) {
                continue;
            }
            auto it = names.find(*record.bridgePort);
            record.port = it != names.end() ? it->second : "Port " + std::to_string(*record.bridgePort);
        }
        return outcome;
    } catch (const std::exception& e) {
        spdlog::error("[SNMP] MAC walk on VLAN {} of {} failed, dropping {} partial addresses: {}", vlanId,
                      base.address, records.size(), e.what());
        records.clear();
        return WalkOutcome::Failed;
    }
}

std::map<int64_t, std::string> MacAddressDiscoveryEngine::resolvePortNames(core::ISnmpSession& session,
                                                                           int vlanId) {
    std::map<int64_t, std::string> names;
    auto deadline = std::chrono::steady_clock::now() + settings_.walkTimeout;

    try {
        auto portIfIndex = walkColumn(session, core::SnmpOids::DOT1D_BASE_PORT_IF_INDEX, deadline);
        if (portIfIndex.empty()) {
            return names;
        }

        auto ifNames = walkColumn(session, core::SnmpOids::IF_NAME, deadline);
        if (ifNames.empty()) {
            ifNames = walkColumn(session, core::SnmpOids::IF_DESCR, deadline);
        }

        for (const auto& [bridgePort, vb] : portIfIndex) {
            if (!vb.intValue) {
                continue;
            }
            auto it = ifNames.find(*vb.intValue);
            if (it != ifNames.end() && it->second.isText()) {
                auto name = trim(it->second.value);
                if (!name.empty()) {
                    names.emplace(bridgePort, std::move(name));
                }
            }
        }
    } catch (const core::DiscoveryError& e) {
        spdlog::debug("[SNMP] Port names unavailable on VLAN {}: {}", vlanId, e.what());
    }
    return names;
}

} // namespace netsweep::discovery
