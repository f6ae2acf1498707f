#include <catch2/catch_test_macros.hpp>

#include "core/types/DiscoveryError.hpp"
#include "infrastructure/snmp/SnmpTransport.hpp"
#include "support/UdpTestAgent.hpp"

#include <limits>

using namespace netsweep::core;
using namespace netsweep::infra;
using netsweep::testing::UdpTestAgent;

namespace {
SnmpTarget loopback(uint16_t port, SnmpVersion version = SnmpVersion::V2c) {
    SnmpTarget target;
    target.address = "127.0.0.1";
    target.port = port;
    target.community = "public";
    target.version = version;
    target.timeoutMs = 300;
    target.retries = 0;
    return target;
}

std::vector<SnmpVarBind> drain(IWalkStream& stream) {
    std::vector<SnmpVarBind> rows;
    while (auto batch = stream.next()) {
        rows.insert(rows.end(), batch->begin(), batch->end());
    }
    return rows;
}

std::string ifRow(int index) {
    return std::string(SnmpOids::IF_TYPE) + "." + std::to_string(index);
}
} // namespace

TEST_CASE("UDP GET", "[SnmpTransport]") {
    UdpTestAgent agent;
    agent.table().setText(SnmpOids::SYS_NAME, "lab-sw").setOid(SnmpOids::SYS_OBJECT_ID, "1.3.6.1.4.1.9.1.516");
    agent.start();

    SnmpTransport transport;

    SECTION("v2c answers missing OIDs with a marker") {
        auto session = transport.open(loopback(agent.port()));
        auto values = session->get({SnmpOids::SYS_NAME, SnmpOids::SYS_OBJECT_ID, SnmpOids::SYS_LOCATION});

        REQUIRE(values.size() == 3);
        REQUIRE(values[0].value == "lab-sw");
        REQUIRE(values[1].type == SnmpDataType::ObjectIdentifier);
        REQUIRE(values[1].value == "1.3.6.1.4.1.9.1.516");
        REQUIRE(values[2].isError());
        session->close();
        REQUIRE_FALSE(session->isOpen());
    }

    SECTION("v1 rejects the whole request") {
        auto session = transport.open(loopback(agent.port(), SnmpVersion::V1));
        try {
            session->get({SnmpOids::SYS_NAME, SnmpOids::SYS_LOCATION});
            FAIL("expected RequestError");
        } catch (const RequestError& e) {
            REQUIRE(e.errorStatus() == SnmpCodec::ERR_NO_SUCH_NAME);
            REQUIRE(e.errorIndex() == 2);
        }
    }

    SECTION("Closed sessions refuse requests") {
        auto session = transport.open(loopback(agent.port()));
        session->close();
        REQUIRE_THROWS_AS(session->get({SnmpOids::SYS_NAME}), ConnectError);
    }

    agent.stop();
}

TEST_CASE("UDP timeouts and retries", "[SnmpTransport]") {
    UdpTestAgent agent;
    agent.table().setText(SnmpOids::SYS_NAME, "lab-sw");
    agent.start();

    SnmpTransport transport;

    SECTION("Wrong community is never answered") {
        auto target = loopback(agent.port());
        target.community = "wrong";
        auto session = transport.open(target);
        REQUIRE_THROWS_AS(session->get({SnmpOids::SYS_NAME}), RequestTimeout);
    }

    SECTION("A retry recovers a dropped request") {
        agent.dropNext(1);
        auto target = loopback(agent.port());
        target.retries = 1;
        auto session = transport.open(target);
        REQUIRE(session->get({SnmpOids::SYS_NAME}).at(0).value == "lab-sw");
        REQUIRE(agent.requestsSeen() == 2);
    }

    SECTION("Responses with a foreign request id are ignored") {
        agent.sendStaleFirst(true);
        auto session = transport.open(loopback(agent.port()));
        REQUIRE(session->get({SnmpOids::SYS_NAME}).at(0).value == "lab-sw");
    }

    agent.stop();
}

TEST_CASE("UDP walks", "[SnmpTransport]") {
    UdpTestAgent agent;
    for (int i = 1; i <= 25; ++i) {
        agent.table().setInt(ifRow(i), 6);
    }
    agent.table().setText(SnmpOids::ENT_PHYSICAL_MODEL_NAME + std::string(".1"), "beyond the root");
    agent.start();

    SnmpTransport transport;

    SECTION("v2c walks in GETBULK batches and stops at the subtree end") {
        auto session = transport.open(loopback(agent.port()));
        auto stream = session->walk(SnmpOids::IF_TYPE);

        auto first = stream->next();
        REQUIRE(first);
        REQUIRE(first->size() == static_cast<size_t>(UdpSnmpSession::BULK_MAX_REPETITIONS));

        auto rest = drain(*stream);
        REQUIRE(rest.size() == 15);
        REQUIRE(rest.back().oid == ifRow(25));
        REQUIRE(agent.pduTypes().front() == PduType::GetBulkRequest);
    }

    SECTION("v1 walks with GETNEXT") {
        auto session = transport.open(loopback(agent.port(), SnmpVersion::V1));
        auto stream = session->walk(SnmpOids::IF_TYPE);
        auto rows = drain(*stream);
        REQUIRE(rows.size() == 25);
        REQUIRE(agent.pduTypes().front() == PduType::GetNextRequest);
    }

    SECTION("v1 end of MIB view ends the walk") {
        auto session = transport.open(loopback(agent.port(), SnmpVersion::V1));
        auto stream = session->walk(SnmpOids::ENT_PHYSICAL_MODEL_NAME);
        auto rows = drain(*stream);
        REQUIRE(rows.size() == 1);
    }

    SECTION("An expired deadline times the walk out") {
        auto session = transport.open(loopback(agent.port()));
        auto stream = session->walk(SnmpOids::IF_TYPE);
        stream->setDeadline(std::chrono::steady_clock::now());
        REQUIRE_THROWS_AS(stream->next(), RequestTimeout);
        REQUIRE_FALSE(stream->next().has_value());
    }

    agent.stop();
}

TEST_CASE("Unresolvable addresses fail to connect", "[SnmpTransport]") {
    SnmpTransport transport;
    auto target = loopback(161);
    target.address = "no-such-host.invalid";
    REQUIRE_THROWS_AS(transport.open(target), ConnectError);
}

TEST_CASE("Request ids wrap without overflowing", "[SnmpTransport]") {
    REQUIRE(UdpSnmpSession::nextRequestId(1) == 2);
    REQUIRE(UdpSnmpSession::nextRequestId(0x3FFFFFFF) == 0x40000000);
    REQUIRE(UdpSnmpSession::nextRequestId(std::numeric_limits<int32_t>::max() - 1) ==
            std::numeric_limits<int32_t>::max());
    REQUIRE(UdpSnmpSession::nextRequestId(std::numeric_limits<int32_t>::max()) == 1);
}
