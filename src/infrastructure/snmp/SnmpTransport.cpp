#include "infrastructure/snmp/SnmpTransport.hpp"

#include "core/types/DiscoveryError.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/socket.h>
#include <sys/time.h>
#endif

namespace netsweep::infra {

namespace {
constexpr size_t MAX_DATAGRAM_SIZE = 65535;

SnmpMessage makeRequest(const core::SnmpTarget& target, PduType pduType,
                        const std::vector<std::string>& oids) {
    SnmpMessage request;
    request.version = target.version;
    request.community = target.community;
    request.pduType = pduType;
    for (const auto& oid : oids) {
        core::SnmpVarBind vb;
        vb.oid = oid;
        vb.type = core::SnmpDataType::Null;
        request.varbinds.push_back(std::move(vb));
    }
    return request;
}
} // anonymous namespace

UdpSnmpSession::UdpSnmpSession(const core::SnmpTarget& target)
    : target_(target), socket_(ioContext_) {
    // Initialize request ID with random value
    std::random_device rd;
    requestIdCounter_ = static_cast<int32_t>(rd() & 0x3FFFFFFF);

    asio::error_code ec;
    asio::ip::udp::resolver resolver(ioContext_);
    auto endpoints = resolver.resolve(asio::ip::udp::v4(), target_.address,
                                      std::to_string(target_.port), ec);
    if (ec || endpoints.empty()) {
        throw core::ConnectError("Failed to resolve address " + target_.address + ": " +
                                 (ec ? ec.message() : std::string("no endpoints")));
    }
    endpoint_ = endpoints.begin()->endpoint();

    socket_.open(asio::ip::udp::v4(), ec);
    if (!ec) {
        // Connected UDP so ICMP port-unreachable surfaces as connection_refused
        socket_.connect(endpoint_, ec);
    }
    if (ec) {
        throw core::ConnectError("Failed to open socket to " + target_.address + ": " + ec.message());
    }

    open_ = true;
    spdlog::debug("[SNMP] Session opened to {}:{} (v{}, timeout {} ms, retries {})",
                  target_.address, target_.port, core::snmpVersionToString(target_.version),
                  target_.timeoutMs, target_.retries);
}

UdpSnmpSession::~UdpSnmpSession() {
    close();
}

void UdpSnmpSession::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return;
    }
    open_ = false;

    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        spdlog::warn("[SNMP] Error closing session to {}: {}", target_.address, ec.message());
    } else {
        spdlog::debug("[SNMP] Session to {} closed", target_.address);
    }
}

bool UdpSnmpSession::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void UdpSnmpSession::setReceiveTimeout(std::chrono::milliseconds timeout) {
    // Zero would mean "block forever"
    auto ms = std::max<int64_t>(timeout.count(), 1);
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(ms);
    setsockopt(socket_.native_handle(), SOL_SOCKET, SO_RCVTIMEO,
               reinterpret_cast<const char*>(&tv), sizeof(tv));
#else
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    setsockopt(socket_.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

SnmpMessage UdpSnmpSession::exchange(SnmpMessage request,
                                     std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        throw core::ConnectError("Session to " + target_.address + " is closed");
    }

    request.requestId = requestIdCounter_;
    requestIdCounter_ = nextRequestId(requestIdCounter_);
    auto packet = SnmpCodec::encode(request);
    std::vector<uint8_t> recvBuffer(MAX_DATAGRAM_SIZE);

    const int attempts = std::max(target_.retries, 0) + 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            throw core::RequestTimeout("Deadline exceeded for request to " + target_.address);
        }

        asio::error_code ec;
        socket_.send(asio::buffer(packet), 0, ec);
        if (ec) {
            throw core::ConnectError("Send to " + target_.address + " failed: " + ec.message());
        }

        auto attemptEnd = std::chrono::steady_clock::now() + std::chrono::milliseconds(target_.timeoutMs);
        if (deadline) {
            attemptEnd = std::min(attemptEnd, *deadline);
        }

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                attemptEnd - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            setReceiveTimeout(remaining);

            size_t bytesReceived = socket_.receive(asio::buffer(recvBuffer), 0, ec);
            if (ec) {
                if (ec == asio::error::timed_out || ec == asio::error::would_block ||
                    ec == asio::error::try_again) {
                    break;
                }
                if (ec == asio::error::connection_refused) {
                    throw core::ConnectError("Connection refused by " + target_.address);
                }
                throw core::ConnectError("Receive from " + target_.address + " failed: " + ec.message());
            }

            SnmpMessage response = SnmpCodec::decode(recvBuffer.data(), bytesReceived);
            if (response.pduType != PduType::GetResponse || response.requestId != request.requestId) {
                spdlog::debug("[SNMP] Discarding stale response from {} (request id {})",
                              target_.address, response.requestId);
                continue;
            }
            return response;
        }

        if (attempt + 1 < attempts) {
            spdlog::debug("[SNMP] No response from {} (attempt {}/{}), retrying",
                          target_.address, attempt + 1, attempts);
        }
    }

    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
        throw core::RequestTimeout("Deadline exceeded for request to " + target_.address);
    }
    throw core::RequestTimeout("Request to " + target_.address + " timed out after " +
                               std::to_string(attempts) + " attempt(s)");
}

std::vector<core::SnmpVarBind> UdpSnmpSession::get(const std::vector<std::string>& oids) {
    auto response = exchange(makeRequest(target_, PduType::GetRequest, oids));
    if (response.errorStatus != SnmpCodec::ERR_NO_ERROR) {
        throw core::RequestError(SnmpCodec::errorStatusToString(response.errorStatus) + " from " +
                                     target_.address,
                                 response.errorStatus, response.errorIndex);
    }
    return std::move(response.varbinds);
}

std::unique_ptr<core::IWalkStream> UdpSnmpSession::walk(const std::string& rootOid) {
    return std::make_unique<UdpWalkStream>(shared_from_this(), rootOid);
}

UdpWalkStream::UdpWalkStream(std::shared_ptr<UdpSnmpSession> session, std::string rootOid)
    : session_(std::move(session)), rootOid_(std::move(rootOid)), currentOid_(rootOid_) {}

std::optional<std::vector<core::SnmpVarBind>> UdpWalkStream::next() {
    if (done_) {
        return std::nullopt;
    }
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
        done_ = true;
        throw core::RequestTimeout("Walk of " + rootOid_ + " exceeded its deadline");
    }

    const auto& target = session_->target();
    SnmpMessage request;
    if (target.version == core::SnmpVersion::V1) {
        request = makeRequest(target, PduType::GetNextRequest, {currentOid_});
    } else {
        request = makeRequest(target, PduType::GetBulkRequest, {currentOid_});
        request.errorStatus = 0; // non-repeaters
        request.errorIndex = UdpSnmpSession::BULK_MAX_REPETITIONS;
    }

    SnmpMessage response;
    try {
        response = session_->exchange(std::move(request), deadline_);
    } catch (const core::DiscoveryError&) {
        done_ = true;
        throw;
    }

    if (response.errorStatus != SnmpCodec::ERR_NO_ERROR) {
        done_ = true;
        if (target.version == core::SnmpVersion::V1 &&
            response.errorStatus == SnmpCodec::ERR_NO_SUCH_NAME) {
            // v1 agents signal the end of the MIB view this way
            return std::nullopt;
        }
        throw core::RequestError(SnmpCodec::errorStatusToString(response.errorStatus) +
                                     " during walk of " + rootOid_,
                                 response.errorStatus, response.errorIndex);
    }

    std::vector<core::SnmpVarBind> batch;
    for (auto& vb : response.varbinds) {
        if (vb.type == core::SnmpDataType::EndOfMibView || !SnmpCodec::isOidPrefix(rootOid_, vb.oid)) {
            done_ = true;
            break;
        }
        if (SnmpCodec::compareOids(vb.oid, currentOid_) <= 0) {
            spdlog::warn("[SNMP] Agent {} returned non-increasing OID {} after {}, stopping walk",
                         target.address, vb.oid, currentOid_);
            done_ = true;
            break;
        }
        currentOid_ = vb.oid;
        batch.push_back(std::move(vb));
    }

    if (response.varbinds.empty()) {
        done_ = true;
    }
    if (batch.empty()) {
        return std::nullopt;
    }
    return batch;
}

std::shared_ptr<core::ISnmpSession> SnmpTransport::open(const core::SnmpTarget& target) {
    return std::make_shared<UdpSnmpSession>(target);
}

} // namespace netsweep::infra
