#pragma once

#include "core/services/IMacResultSink.hpp"
#include "core/services/IOuiClassifier.hpp"
#include "core/services/ISnmpTransport.hpp"
#include "discovery/VlanDiscoveryEngine.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netsweep::infra {
class SessionRegistry;
}

namespace netsweep::discovery {

/**
 * @brief Timeouts of a MAC sweep.
 */
struct MacDiscoverySettings {
    std::chrono::milliseconds walkTimeout{3000};  ///< Wall-clock cap of one VLAN's walk
    int sessionTimeoutMs{2000};                   ///< Request timeout of per-VLAN sessions
    int vlanSessionTimeoutMs{5000};               ///< Request timeout while enumerating VLANs
    int vlanSessionRetries{1};
};

/**
 * @brief Callback for sweep progress.
 * @param message Human readable step description.
 * @param percent Completion in [0, 100].
 */
using ProgressCallback = std::function<void(const std::string& message, int percent)>;

/**
 * @brief Reads the bridge forwarding table of a switch, one VLAN at a time.
 *
 * VLANs are visited strictly in sequence, each through its own short-lived
 * session with a VLAN-scoped community ("community@<id>" for every VLAN
 * but 1). A VLAN walk that outlives its wall-clock cap keeps the records
 * read so far. Any other per-VLAN failure discards that VLAN's records and
 * the sweep moves on. Bridge ports of completed VLANs are resolved to
 * interface names.
 */
class MacAddressDiscoveryEngine {
public:
    /**
     * @param transport Opens the per-VLAN sessions.
     * @param vlanEngine Used when the request selects no VLANs.
     * @param classifier Labels addresses by OUI.
     * @param registry Resolves session ids; may be null when ids are never used.
     * @param settings Timeouts.
     */
    MacAddressDiscoveryEngine(std::shared_ptr<core::ISnmpTransport> transport,
                              std::shared_ptr<VlanDiscoveryEngine> vlanEngine,
                              std::shared_ptr<core::IOuiClassifier> classifier,
                              infra::SessionRegistry* registry = nullptr,
                              MacDiscoverySettings settings = {});

    /**
     * @brief Sweeps the forwarding tables of the selected VLANs.
     *
     * Delivers one chunk per attempted VLAN to @p sink as soon as that VLAN
     * is done, then exactly one summary.
     *
     * @param request Device, credentials and VLAN selection.
     * @param sink Receives chunks and the summary.
     * @param progress Optional progress reporting.
     * @return The summary that was delivered to the sink.
     * @throws core::ValidationError if neither address nor session id is usable,
     *         or an explicit VLAN id is out of range.
     * @throws core::SessionNotFound if the session id is unknown.
     */
    core::MacSweepSummary discoverMacAddresses(const core::MacDiscoveryRequest& request,
                                               core::IMacResultSink& sink,
                                               const ProgressCallback& progress = nullptr);

    /**
     * @brief Community string that selects the forwarding table of one VLAN.
     * @return @p community for VLAN 1, "community@<vlanId>" otherwise.
     */
    static std::string scopedCommunity(const std::string& community, int vlanId);

    /**
     * @brief Removes duplicates and sorts ascending.
     * @throws core::ValidationError if an id is outside [1, 4094].
     */
    static std::vector<int> normalizeVlanIds(std::vector<int> vlanIds);

    [[nodiscard]] const MacDiscoverySettings& settings() const { return settings_; }

private:
    enum class WalkOutcome { Complete, TimedOut, Failed };

    core::SnmpTarget resolveBaseTarget(const core::MacDiscoveryRequest& request);
    std::vector<int> selectVlans(const core::MacDiscoveryRequest& request, const core::SnmpTarget& base);
    WalkOutcome sweepVlan(const core::SnmpTarget& base, int vlanId, std::vector<core::MacAddressRecord>& records);

    /**
     * @brief Maps bridge ports to interface names through dot1dBasePortIfIndex
     *        and ifName, falling back to ifDescr.
     *
     * Ports without a name are absent. Walk failures yield what was mapped so far.
     */
    std::map<int64_t, std::string> resolvePortNames(core::ISnmpSession& session, int vlanId);

    std::shared_ptr<core::ISnmpTransport> transport_;
    std::shared_ptr<VlanDiscoveryEngine> vlanEngine_;
    std::shared_ptr<core::IOuiClassifier> classifier_;
    infra::SessionRegistry* registry_;
    MacDiscoverySettings settings_;
};

} // namespace netsweep::discovery
