#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief SNMP PDU types (context-specific constructed tags).
 */
enum class PduType : uint8_t {
    GetRequest = 0xA0,
    GetNextRequest = 0xA1,
    GetResponse = 0xA2,
    GetBulkRequest = 0xA5
};

/**
 * @brief A community-based SNMP message (v1 or v2c).
 *
 * For GetBulkRequest the errorStatus and errorIndex fields carry
 * non-repeaters and max-repetitions, as on the wire.
 */
struct SnmpMessage {
    core::SnmpVersion version{core::SnmpVersion::V2c};
    std::string community;
    PduType pduType{PduType::GetRequest};
    int32_t requestId{0};
    int32_t errorStatus{0};
    int32_t errorIndex{0};
    std::vector<core::SnmpVarBind> varbinds;
};

/**
 * @brief BER/ASN.1 encoder and decoder for SNMP v1/v2c messages.
 *
 * Decoding is bounds-checked throughout: a truncated or malformed packet
 * raises core::DecodeError and never reads past the end of the buffer.
 */
class SnmpCodec {
public:
    /** @name ASN.1 / SNMP tags
     *  @{ */
    static constexpr uint8_t TAG_INTEGER = 0x02;
    static constexpr uint8_t TAG_OCTET_STRING = 0x04;
    static constexpr uint8_t TAG_NULL = 0x05;
    static constexpr uint8_t TAG_OID = 0x06;
    static constexpr uint8_t TAG_SEQUENCE = 0x30;
    static constexpr uint8_t TAG_IP_ADDRESS = 0x40;
    static constexpr uint8_t TAG_COUNTER32 = 0x41;
    static constexpr uint8_t TAG_GAUGE32 = 0x42;
    static constexpr uint8_t TAG_TIMETICKS = 0x43;
    static constexpr uint8_t TAG_COUNTER64 = 0x46;
    static constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
    static constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
    static constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;
    /** @} */

    /** @name Error-status values
     *  @{ */
    static constexpr int32_t ERR_NO_ERROR = 0;
    static constexpr int32_t ERR_TOO_BIG = 1;
    static constexpr int32_t ERR_NO_SUCH_NAME = 2;
    static constexpr int32_t ERR_BAD_VALUE = 3;
    static constexpr int32_t ERR_READ_ONLY = 4;
    static constexpr int32_t ERR_GEN_ERR = 5;
    /** @} */

    /**
     * @brief Encodes a complete message.
     *
     * Request varbinds are normally Null-valued. Response varbinds are
     * encoded according to their declared type.
     *
     * @throws core::ValidationError if an OID string is malformed.
     */
    static std::vector<uint8_t> encode(const SnmpMessage& message);

    /**
     * @brief Decodes a complete message.
     * @throws core::DecodeError on any structural or bounds violation.
     */
    static SnmpMessage decode(const uint8_t* data, size_t size);
    static SnmpMessage decode(const std::vector<uint8_t>& packet) {
        return decode(packet.data(), packet.size());
    }

    // BER primitives

    static std::vector<uint8_t> encodeLength(size_t length);
    static std::vector<uint8_t> encodeInteger(int64_t value, uint8_t tag = TAG_INTEGER);
    static std::vector<uint8_t> encodeUnsigned(uint64_t value, uint8_t tag);
    static std::vector<uint8_t> encodeOctetString(const std::string& str);
    static std::vector<uint8_t> encodeOid(const std::string& oid);
    static std::vector<uint8_t> encodeNull(uint8_t tag = TAG_NULL);
    static std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content,
                                               uint8_t tag = TAG_SEQUENCE);

    /**
     * @brief Decodes the content octets of a BER object identifier.
     * @throws core::DecodeError if a sub-identifier is truncated or overflows.
     */
    static std::string decodeOid(const uint8_t* data, size_t length);

    // OID helpers

    /**
     * @brief Splits dotted OID text into numeric components.
     * @throws core::ValidationError on empty or non-numeric components.
     */
    static std::vector<uint32_t> parseOid(const std::string& oid);

    static std::string oidToString(const std::vector<uint32_t>& oid);

    /**
     * @brief Checks whether @p oid lies at or beneath @p prefix.
     */
    static bool isOidPrefix(const std::string& prefix, const std::string& oid);

    /**
     * @brief Compares two OIDs component-wise.
     * @return Negative, zero or positive like strcmp. Unparseable text sorts first.
     */
    static int compareOids(const std::string& a, const std::string& b);

    static core::SnmpDataType tagToDataType(uint8_t tag);
    static uint8_t dataTypeToTag(core::SnmpDataType type);

    /**
     * @brief Human-readable text for an error-status value.
     */
    static std::string errorStatusToString(int32_t errorStatus);
};

} // namespace netsweep::infra
