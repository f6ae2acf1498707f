#pragma once

#include "core/services/IClock.hpp"
#include "core/services/ISnmpTransport.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace netsweep::infra {

/**
 * @brief Idle-eviction policy of the session registry.
 */
struct SessionSettings {
    std::chrono::minutes idleTtl{30};      ///< Sessions idle longer than this are evicted
    std::chrono::minutes sweepInterval{5}; ///< Period of the background reaper
};

/**
 * @brief Bookkeeping data of a registered session.
 */
struct SessionInfo {
    std::string id;
    core::SnmpTarget target;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastActivityAt;
};

/**
 * @brief Process-wide table of long-lived SNMP sessions keyed by opaque id.
 *
 * Sessions leave the table by explicit disconnect, by a reported transport
 * error, or by the idle reaper. All table mutations are serialized by one
 * mutex; transports are closed outside of it.
 */
class SessionRegistry {
public:
    SessionRegistry(std::shared_ptr<core::ISnmpTransport> transport,
                    std::shared_ptr<core::IClock> clock,
                    SessionSettings settings = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Opens a session and registers it.
     * @param target Agent to connect to.
     * @return New session id of the form "snmp_<epochMs>_<8 base36 chars>".
     * @throws core::ValidationError for a bad address or empty community.
     * @throws core::ConnectError if the transport cannot open the session.
     */
    std::string connect(const core::SnmpTarget& target);

    /**
     * @brief Looks up a session and marks it active.
     * @return The session, or nullptr if the id is unknown or expired.
     */
    std::shared_ptr<core::ISnmpSession> find(const std::string& sessionId);

    /**
     * @brief Returns bookkeeping data without touching the session.
     */
    [[nodiscard]] std::optional<SessionInfo> info(const std::string& sessionId) const;

    /**
     * @brief Sets lastActivityAt to now.
     * @return False if the id is unknown.
     */
    bool touch(const std::string& sessionId);

    /**
     * @brief Closes and removes a session.
     * @return False if the id is unknown.
     */
    bool disconnect(const std::string& sessionId);

    /**
     * @brief Closes and removes a session whose transport failed.
     */
    void reportTransportError(const std::string& sessionId, const std::string& message);

    /**
     * @brief Evicts every session idle longer than the TTL.
     * @return Number of sessions evicted.
     */
    size_t sweepIdle();

    /**
     * @brief Starts the periodic reaper on the given io_context.
     */
    void startReaper(asio::io_context& ioContext);

    void stopReaper();

    [[nodiscard]] size_t count() const;

    [[nodiscard]] const SessionSettings& settings() const { return settings_; }

private:
    struct Entry {
        SessionInfo info;
        std::shared_ptr<core::ISnmpSession> session;
    };

    std::string generateId(std::chrono::system_clock::time_point now);
    void scheduleSweep();
    static void closeQuietly(const std::string& sessionId, core::ISnmpSession& session);

    std::shared_ptr<core::ISnmpTransport> transport_;
    std::shared_ptr<core::IClock> clock_;
    SessionSettings settings_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> sessions_;
    std::mt19937_64 rng_;

    std::shared_ptr<asio::steady_timer> timer_;
    std::atomic<bool> reaperActive_{false};
};

} // namespace netsweep::infra
