/**
 * @file ISnmpTransport.hpp
 * @brief Interface for the SNMP v1/v2c request transport.
 *
 * This file defines the abstract session, walk stream and transport factory
 * the discovery algorithms are written against. The concrete implementation
 * talks UDP; tests substitute an in-memory agent.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Lazy, pull-based sequence of varbind batches beneath a root OID.
 *
 * Each call to next() returns the next batch (one GETNEXT or GETBULK
 * response worth of varbinds) or std::nullopt once the subtree is exhausted.
 * Varbinds carrying an exception marker are delivered flagged via
 * SnmpVarBind::isError() and are skipped by callers.
 */
class IWalkStream {
public:
    virtual ~IWalkStream() = default;

    /**
     * @brief Pulls the next batch of varbinds.
     * @return The batch, or std::nullopt when the walk is complete.
     * @throws RequestTimeout if the agent does not answer in time or the deadline passed.
     * @throws ConnectError if the socket fails.
     * @throws DecodeError if the response cannot be decoded.
     */
    virtual std::optional<std::vector<SnmpVarBind>> next() = 0;

    /**
     * @brief Bounds the whole walk by a wall-clock deadline.
     *
     * Once the deadline has passed next() throws RequestTimeout and any
     * response arriving afterwards is discarded.
     *
     * @param deadline Absolute point in time after which no batch is delivered.
     */
    virtual void setDeadline(std::chrono::steady_clock::time_point deadline) = 0;
};

/**
 * @brief An open request channel to one agent.
 *
 * A session is used by one logical worker at a time.
 */
class ISnmpSession {
public:
    virtual ~ISnmpSession() = default;

    /**
     * @brief Performs a GET for the given OIDs.
     * @param oids Instance OIDs to retrieve.
     * @return Varbinds in response order; per-OID failures are flagged, not thrown.
     * @throws RequestTimeout, ConnectError, DecodeError, RequestError
     */
    virtual std::vector<SnmpVarBind> get(const std::vector<std::string>& oids) = 0;

    /**
     * @brief Starts a walk of the subtree beneath @p rootOid.
     *
     * v1 sessions walk with GETNEXT, v2c sessions with GETBULK. The walk
     * stops when a returned OID leaves the subtree or fails to increase.
     *
     * @param rootOid Subtree root.
     * @return Stream of batches. The stream must not outlive the session.
     */
    virtual std::unique_ptr<IWalkStream> walk(const std::string& rootOid) = 0;

    /**
     * @brief Releases the underlying socket. Idempotent.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

    /**
     * @brief The target this session was opened for.
     */
    [[nodiscard]] virtual const SnmpTarget& target() const = 0;
};

/**
 * @brief Factory for sessions.
 */
class ISnmpTransport {
public:
    virtual ~ISnmpTransport() = default;

    /**
     * @brief Opens a session to the given target.
     * @param target Address, community, version, timeout and retries.
     * @return The open session.
     * @throws ConnectError if the address cannot be resolved or the socket cannot be opened.
     */
    virtual std::shared_ptr<ISnmpSession> open(const SnmpTarget& target) = 0;
};

/**
 * @brief Closes a session when leaving scope.
 *
 * Close failures are logged by the session implementation and never
 * propagate out of the destructor.
 */
class ScopedSession {
public:
    explicit ScopedSession(std::shared_ptr<ISnmpSession> session) : session_(std::move(session)) {}

    ~ScopedSession() {
        if (session_) {
            session_->close();
        }
    }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    ISnmpSession* operator->() const { return session_.get(); }
    ISnmpSession& operator*() const { return *session_; }

private:
    std::shared_ptr<ISnmpSession> session_;
};

} // namespace netsweep::core
