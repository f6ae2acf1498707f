#pragma once

#include "core/services/ISnmpTransport.hpp"
#include "infrastructure/snmp/SnmpCodec.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>

namespace netsweep::infra {

/**
 * @brief UDP session to one SNMP agent.
 *
 * Each session owns a private io_context and a connected UDP socket; I/O is
 * blocking with a receive timeout so a session is driven entirely by the
 * calling worker. Responses whose request id does not match the request in
 * flight are discarded.
 */
class UdpSnmpSession : public core::ISnmpSession,
                       public std::enable_shared_from_this<UdpSnmpSession> {
public:
    /** @brief GETBULK max-repetitions used by v2c walks. */
    static constexpr int32_t BULK_MAX_REPETITIONS = 10;

    /**
     * @brief Resolves the agent address and opens the socket.
     * @throws core::ConnectError if resolution or socket setup fails.
     */
    explicit UdpSnmpSession(const core::SnmpTarget& target);
    ~UdpSnmpSession() override;

    UdpSnmpSession(const UdpSnmpSession&) = delete;
    UdpSnmpSession& operator=(const UdpSnmpSession&) = delete;

    std::vector<core::SnmpVarBind> get(const std::vector<std::string>& oids) override;
    std::unique_ptr<core::IWalkStream> walk(const std::string& rootOid) override;
    void close() override;
    [[nodiscard]] bool isOpen() const override;
    [[nodiscard]] const core::SnmpTarget& target() const override { return target_; }

    /**
     * @brief Sends a request and waits for the matching response.
     *
     * Retransmits up to target().retries times. When @p deadline is set, no
     * receive waits beyond it.
     *
     * @throws core::RequestTimeout, core::ConnectError, core::DecodeError
     */
    SnmpMessage exchange(SnmpMessage request,
                         std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    /** @brief Request id following @p current; wraps to 1 instead of overflowing. */
    static int32_t nextRequestId(int32_t current) {
        return current == std::numeric_limits<int32_t>::max() ? 1 : current + 1;
    }

private:
    void setReceiveTimeout(std::chrono::milliseconds timeout);

    core::SnmpTarget target_;
    asio::io_context ioContext_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint endpoint_;
    int32_t requestIdCounter_;
    bool open_{false};
    mutable std::mutex mutex_;
};

/**
 * @brief Walk over a UdpSnmpSession using GETNEXT (v1) or GETBULK (v2c).
 */
class UdpWalkStream : public core::IWalkStream {
public:
    UdpWalkStream(std::shared_ptr<UdpSnmpSession> session, std::string rootOid);

    std::optional<std::vector<core::SnmpVarBind>> next() override;
    void setDeadline(std::chrono::steady_clock::time_point deadline) override { deadline_ = deadline; }

private:
    std::shared_ptr<UdpSnmpSession> session_;
    std::string rootOid_;
    std::string currentOid_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool done_{false};
};

/**
 * @brief ISnmpTransport producing UdpSnmpSession instances.
 */
class SnmpTransport : public core::ISnmpTransport {
public:
    std::shared_ptr<core::ISnmpSession> open(const core::SnmpTarget& target) override;
};

} // namespace netsweep::infra
