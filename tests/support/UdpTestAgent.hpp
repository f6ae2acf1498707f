#pragma once

#include "infrastructure/snmp/SnmpCodec.hpp"
#include "support/FakeSnmpTransport.hpp"

#include <asio.hpp>

#include <array>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace netsweep::testing {

/**
 * @brief Minimal SNMP agent on a loopback UDP port.
 *
 * Answers GET, GETNEXT and GETBULK from a scripted OID table. Requests with
 * a foreign community are dropped like a real agent would.
 */
class UdpTestAgent {
public:
    explicit UdpTestAgent(std::string community = "public")
        : community_(std::move(community)),
          socket_(ioContext_, asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    ~UdpTestAgent() { stop(); }

    UdpTestAgent(const UdpTestAgent&) = delete;
    UdpTestAgent& operator=(const UdpTestAgent&) = delete;

    FakeAgent& table() { return table_; }

    /** @brief Ignore the next @p count requests. */
    void dropNext(int count) { dropRemaining_ = count; }

    /** @brief Precede every answer with one carrying a wrong request id. */
    void sendStaleFirst(bool enabled) { staleFirst_ = enabled; }

    /** @brief Answer @p oid with a zero-length INTEGER instead of its value. */
    void corruptValue(const std::string& oid) {
        std::lock_guard<std::mutex> lock(mutex_);
        corrupted_.insert(oid);
    }

    void start() {
        receive();
        thread_ = std::thread([this]() { ioContext_.run(); });
    }

    void stop() {
        ioContext_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return socket_.local_endpoint().port(); }

    int requestsSeen() const { return requestsSeen_.load(); }

    std::vector<infra::PduType> pduTypes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pduTypes_;
    }

private:
    void receive() {
        socket_.async_receive_from(asio::buffer(buffer_), sender_, [this](const asio::error_code& ec, size_t n) {
            if (ec) {
                return;
            }
            handle(n);
            receive();
        });
    }

    void handle(size_t size) {
        ++requestsSeen_;
        infra::SnmpMessage request;
        try {
            request = infra::SnmpCodec::decode(buffer_.data(), size);
        } catch (const core::DecodeError&) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pduTypes_.push_back(request.pduType);
        }
        if (request.community != community_) {
            return;
        }
        if (dropRemaining_ > 0) {
            --dropRemaining_;
            return;
        }

        auto response = answer(request);
        if (staleFirst_) {
            auto stale = response;
            stale.requestId = request.requestId + 1000;
            send(stale);
        }
        send(response);
    }

    void send(const infra::SnmpMessage& message) {
        asio::error_code ec;
        socket_.send_to(asio::buffer(encode(message)), sender_, 0, ec);
    }

    std::vector<uint8_t> encode(const infra::SnmpMessage& message) const {
        std::set<std::string> corrupted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            corrupted = corrupted_;
        }
        if (corrupted.empty()) {
            return infra::SnmpCodec::encode(message);
        }

        // Same layout as SnmpCodec::encode, with chosen values replaced
        using infra::SnmpCodec;
        std::vector<uint8_t> list;
        for (const auto& vb : message.varbinds) {
            auto varbind = SnmpCodec::encodeOid(vb.oid);
            std::vector<uint8_t> value;
            if (corrupted.count(vb.oid) > 0) {
                value = {SnmpCodec::TAG_INTEGER, 0x00};
            } else {
                value = valueBytes(vb);
            }
            varbind.insert(varbind.end(), value.begin(), value.end());
            auto sequence = SnmpCodec::encodeSequence(varbind);
            list.insert(list.end(), sequence.begin(), sequence.end());
        }

        std::vector<uint8_t> pdu;
        for (const auto& part : {SnmpCodec::encodeInteger(message.requestId),
                                 SnmpCodec::encodeInteger(message.errorStatus),
                                 SnmpCodec::encodeInteger(message.errorIndex), SnmpCodec::encodeSequence(list)}) {
            pdu.insert(pdu.end(), part.begin(), part.end());
        }

        std::vector<uint8_t> body;
        for (const auto& part : {SnmpCodec::encodeInteger(message.version == core::SnmpVersion::V1 ? 0 : 1),
                                 SnmpCodec::encodeOctetString(message.community),
                                 SnmpCodec::encodeSequence(pdu, static_cast<uint8_t>(message.pduType))}) {
            body.insert(body.end(), part.begin(), part.end());
        }
        return SnmpCodec::encodeSequence(body);
    }

    static std::vector<uint8_t> valueBytes(const core::SnmpVarBind& vb) {
        using infra::SnmpCodec;
        switch (vb.type) {
            case core::SnmpDataType::Integer:
                return SnmpCodec::encodeInteger(vb.intValue.value_or(0));
            case core::SnmpDataType::OctetString:
                return SnmpCodec::encodeOctetString(vb.value);
            case core::SnmpDataType::ObjectIdentifier:
                return SnmpCodec::encodeOid(vb.value);
            case core::SnmpDataType::NoSuchObject:
            case core::SnmpDataType::NoSuchInstance:
            case core::SnmpDataType::EndOfMibView:
                return SnmpCodec::encodeNull(SnmpCodec::dataTypeToTag(vb.type));
            default:
                return SnmpCodec::encodeNull();
        }
    }

    infra::SnmpMessage answer(const infra::SnmpMessage& request) {
        infra::SnmpMessage response;
        response.version = request.version;
        response.community = request.community;
        response.pduType = infra::PduType::GetResponse;
        response.requestId = request.requestId;

        const bool v1 = request.version == core::SnmpVersion::V1;
        const auto& values = table_.values;

        auto fail = [&](size_t index) {
            response.errorStatus = infra::SnmpCodec::ERR_NO_SUCH_NAME;
            response.errorIndex = static_cast<int32_t>(index + 1);
            response.varbinds = request.varbinds;
            return response;
        };

        switch (request.pduType) {
            case infra::PduType::GetRequest:
                for (size_t i = 0; i < request.varbinds.size(); ++i) {
                    auto it = values.find(request.varbinds[i].oid);
                    if (it != values.end()) {
                        response.varbinds.push_back(it->second);
                    } else if (v1) {
                        return fail(i);
                    } else {
                        response.varbinds.push_back(
                            {request.varbinds[i].oid, core::SnmpDataType::NoSuchObject, "", std::nullopt});
                    }
                }
                break;
            case infra::PduType::GetNextRequest:
                for (size_t i = 0; i < request.varbinds.size(); ++i) {
                    auto it = values.upper_bound(request.varbinds[i].oid);
                    if (it != values.end()) {
                        response.varbinds.push_back(it->second);
                    } else if (v1) {
                        return fail(i);
                    } else {
                        response.varbinds.push_back(
                            {request.varbinds[i].oid, core::SnmpDataType::EndOfMibView, "", std::nullopt});
                    }
                }
                break;
            case infra::PduType::GetBulkRequest: {
                auto it = values.upper_bound(request.varbinds.at(0).oid);
                for (int32_t n = 0; n < request.errorIndex; ++n, ++it) {
                    if (it == values.end()) {
                        response.varbinds.push_back({request.varbinds[0].oid, core::SnmpDataType::EndOfMibView, "",
                                                     std::nullopt});
                        break;
                    }
                    response.varbinds.push_back(it->second);
                }
                break;
            }
            case infra::PduType::GetResponse:
                break;
        }
        return response;
    }

    std::string community_;
    FakeAgent table_;
    asio::io_context ioContext_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint sender_;
    std::array<uint8_t, 65535> buffer_{};
    std::thread thread_;
    std::atomic<int> dropRemaining_{0};
    std::atomic<bool> staleFirst_{false};
    std::atomic<int> requestsSeen_{0};
    mutable std::mutex mutex_;
    std::vector<infra::PduType> pduTypes_;
    std::set<std::string> corrupted_;
};

} // namespace netsweep::testing
