#include "infrastructure/snmp/SnmpCodec.hpp"

#include "core/types/DiscoveryError.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>

namespace netsweep::infra {

namespace {
// SNMP versions as carried in the message header
constexpr int64_t SNMP_VERSION_1 = 0;
constexpr int64_t SNMP_VERSION_2C = 1;

struct Tlv {
    uint8_t tag{0};
    const uint8_t* value{nullptr};
    size_t length{0};
};

class BerReader {
public:
    BerReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    [[nodiscard]] bool atEnd() const { return offset_ >= size_; }

    Tlv read(const char* what) {
        if (offset_ >= size_) {
            throw core::DecodeError(std::string("Unexpected end of data reading ") + what);
        }
        Tlv tlv;
        tlv.tag = data_[offset_++];
        tlv.length = readLength(what);
        if (tlv.length > size_ - offset_) {
            throw core::DecodeError(std::string("Length of ") + what + " exceeds buffer");
        }
        tlv.value = data_ + offset_;
        offset_ += tlv.length;
        return tlv;
    }

    Tlv expect(uint8_t tag, const char* what) {
        Tlv tlv = read(what);
        if (tlv.tag != tag) {
            std::ostringstream oss;
            oss << "Expected tag 0x" << std::hex << static_cast<int>(tag) << " for " << what
                << ", got 0x" << static_cast<int>(tlv.tag);
            throw core::DecodeError(oss.str());
        }
        return tlv;
    }

private:
    size_t readLength(const char* what) {
        if (offset_ >= size_) {
            throw core::DecodeError(std::string("Missing length for ") + what);
        }
        uint8_t first = data_[offset_++];
        if ((first & 0x80) == 0) {
            return first;
        }

        size_t numBytes = first & 0x7F;
        if (numBytes == 0) {
            throw core::DecodeError(std::string("Indefinite length not supported for ") + what);
        }
        if (numBytes > 4 || numBytes > size_ - offset_) {
            throw core::DecodeError(std::string("Invalid long-form length for ") + what);
        }

        size_t length = 0;
        for (size_t i = 0; i < numBytes; ++i) {
            length = (length << 8) | data_[offset_++];
        }
        return length;
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

int64_t decodeSigned(const Tlv& tlv, const char* what) {
    if (tlv.length == 0 || tlv.length > 8) {
        throw core::DecodeError(std::string("Invalid integer length for ") + what);
    }
    uint64_t value = (tlv.value[0] & 0x80) ? std::numeric_limits<uint64_t>::max() : 0;
    for (size_t i = 0; i < tlv.length; ++i) {
        value = (value << 8) | tlv.value[i];
    }
    return static_cast<int64_t>(value);
}

uint64_t decodeUnsigned(const Tlv& tlv, const char* what) {
    // A leading zero octet is allowed so that 2^64-1 fits in nine octets
    size_t start = 0;
    if (tlv.length == 9 && tlv.value[0] == 0) {
        start = 1;
    }
    if (tlv.length == 0 || tlv.length - start > 8) {
        throw core::DecodeError(std::string("Invalid unsigned length for ") + what);
    }
    uint64_t value = 0;
    for (size_t i = start; i < tlv.length; ++i) {
        value = (value << 8) | tlv.value[i];
    }
    return value;
}

std::string toHex(const uint8_t* data, size_t length) {
    std::ostringstream oss;
    oss << std::hex;
    for (size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

void decodeValue(const Tlv& valueTlv, core::SnmpVarBind& varbind) {
    varbind.type = SnmpCodec::tagToDataType(valueTlv.tag);

    switch (valueTlv.tag) {
        case SnmpCodec::TAG_INTEGER:
            varbind.intValue = decodeSigned(valueTlv, "INTEGER value");
            varbind.value = std::to_string(*varbind.intValue);
            break;
        case SnmpCodec::TAG_OCTET_STRING:
            varbind.value.assign(reinterpret_cast<const char*>(valueTlv.value), valueTlv.length);
            break;
        case SnmpCodec::TAG_OID:
            varbind.value = SnmpCodec::decodeOid(valueTlv.value, valueTlv.length);
            break;
        case SnmpCodec::TAG_IP_ADDRESS:
            if (valueTlv.length == 4) {
                varbind.value = std::to_string(valueTlv.value[0]) + "." +
                                std::to_string(valueTlv.value[1]) + "." +
                                std::to_string(valueTlv.value[2]) + "." +
                                std::to_string(valueTlv.value[3]);
            } else {
                varbind.value = toHex(valueTlv.value, valueTlv.length);
            }
            break;
        case SnmpCodec::TAG_COUNTER32:
        case SnmpCodec::TAG_GAUGE32:
        case SnmpCodec::TAG_TIMETICKS:
        case SnmpCodec::TAG_COUNTER64: {
            uint64_t val = decodeUnsigned(valueTlv, "counter value");
            varbind.intValue = static_cast<int64_t>(val);
            varbind.value = std::to_string(val);
            break;
        }
        case SnmpCodec::TAG_NULL:
        case SnmpCodec::TAG_NO_SUCH_OBJECT:
        case SnmpCodec::TAG_NO_SUCH_INSTANCE:
        case SnmpCodec::TAG_END_OF_MIB_VIEW:
            varbind.value = "";
            break;
        default:
            varbind.value = toHex(valueTlv.value, valueTlv.length);
            break;
    }
}

core::SnmpVarBind decodeVarBind(const Tlv& sequence) {
    BerReader reader(sequence.value, sequence.length);
    Tlv oidTlv = reader.expect(SnmpCodec::TAG_OID, "varbind name");
    Tlv valueTlv = reader.read("varbind value");

    core::SnmpVarBind varbind;
    varbind.oid = SnmpCodec::decodeOid(oidTlv.value, oidTlv.length);

    // A bad value only invalidates its own binding
    try {
        decodeValue(valueTlv, varbind);
    } catch (const core::DecodeError& e) {
        spdlog::warn("[SNMP] Undecodable value for {} (tag 0x{:02x}): {}", varbind.oid, valueTlv.tag, e.what());
        varbind.type = core::SnmpDataType::Malformed;
        varbind.value = toHex(valueTlv.value, valueTlv.length);
        varbind.intValue.reset();
    }

    return varbind;
}

std::vector<uint8_t> encodeVarBindValue(const core::SnmpVarBind& varbind) {
    using core::SnmpDataType;
    switch (varbind.type) {
        case SnmpDataType::Integer:
            return SnmpCodec::encodeInteger(varbind.intValue.value_or(0));
        case SnmpDataType::OctetString:
            return SnmpCodec::encodeOctetString(varbind.value);
        case SnmpDataType::ObjectIdentifier:
            return SnmpCodec::encodeOid(varbind.value);
        case SnmpDataType::IpAddress: {
            auto parts = SnmpCodec::parseOid(varbind.value);
            if (parts.size() != 4 ||
                std::any_of(parts.begin(), parts.end(), [](uint32_t p) { return p > 255; })) {
                throw core::ValidationError("Invalid IpAddress value: " + varbind.value);
            }
            std::string raw;
            for (auto part : parts) {
                raw.push_back(static_cast<char>(part & 0xFF));
            }
            auto encoded = SnmpCodec::encodeOctetString(raw);
            encoded[0] = SnmpCodec::TAG_IP_ADDRESS;
            return encoded;
        }
        case SnmpDataType::Counter32:
        case SnmpDataType::Gauge32:
        case SnmpDataType::TimeTicks:
        case SnmpDataType::Counter64:
            return SnmpCodec::encodeUnsigned(static_cast<uint64_t>(varbind.intValue.value_or(0)),
                                             SnmpCodec::dataTypeToTag(varbind.type));
        case SnmpDataType::NoSuchObject:
        case SnmpDataType::NoSuchInstance:
        case SnmpDataType::EndOfMibView:
            return SnmpCodec::encodeNull(SnmpCodec::dataTypeToTag(varbind.type));
        case SnmpDataType::Null:
        case SnmpDataType::Malformed:
        case SnmpDataType::Unknown:
            break;
    }
    return SnmpCodec::encodeNull();
}

void append(std::vector<uint8_t>& target, const std::vector<uint8_t>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

} // anonymous namespace

std::vector<uint8_t> SnmpCodec::encode(const SnmpMessage& message) {
    std::vector<uint8_t> varbindList;
    for (const auto& vb : message.varbinds) {
        std::vector<uint8_t> varbind = encodeOid(vb.oid);
        append(varbind, encodeVarBindValue(vb));
        append(varbindList, encodeSequence(varbind));
    }

    std::vector<uint8_t> pduContent;
    append(pduContent, encodeInteger(message.requestId));
    append(pduContent, encodeInteger(message.errorStatus));
    append(pduContent, encodeInteger(message.errorIndex));
    append(pduContent, encodeSequence(varbindList));

    std::vector<uint8_t> msgContent;
    int64_t version = message.version == core::SnmpVersion::V1 ? SNMP_VERSION_1 : SNMP_VERSION_2C;
    append(msgContent, encodeInteger(version));
    append(msgContent, encodeOctetString(message.community));
    append(msgContent, encodeSequence(pduContent, static_cast<uint8_t>(message.pduType)));

    return encodeSequence(msgContent);
}

SnmpMessage SnmpCodec::decode(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw core::DecodeError("Empty packet");
    }

    BerReader outer(data, size);
    Tlv message = outer.expect(TAG_SEQUENCE, "message");

    BerReader reader(message.value, message.length);
    SnmpMessage result;

    int64_t version = decodeSigned(reader.expect(TAG_INTEGER, "version"), "version");
    if (version == SNMP_VERSION_1) {
        result.version = core::SnmpVersion::V1;
    } else if (version == SNMP_VERSION_2C) {
        result.version = core::SnmpVersion::V2c;
    } else {
        throw core::DecodeError("Unsupported SNMP version code " + std::to_string(version));
    }

    Tlv community = reader.expect(TAG_OCTET_STRING, "community");
    result.community.assign(reinterpret_cast<const char*>(community.value), community.length);

    Tlv pdu = reader.read("PDU");
    switch (pdu.tag) {
        case static_cast<uint8_t>(PduType::GetRequest):
        case static_cast<uint8_t>(PduType::GetNextRequest):
        case static_cast<uint8_t>(PduType::GetResponse):
        case static_cast<uint8_t>(PduType::GetBulkRequest):
            result.pduType = static_cast<PduType>(pdu.tag);
            break;
        default: {
            std::ostringstream oss;
            oss << "Unsupported PDU type 0x" << std::hex << static_cast<int>(pdu.tag);
            throw core::DecodeError(oss.str());
        }
    }

    BerReader pduReader(pdu.value, pdu.length);
    result.requestId = static_cast<int32_t>(decodeSigned(pduReader.expect(TAG_INTEGER, "request-id"), "request-id"));
    result.errorStatus = static_cast<int32_t>(decodeSigned(pduReader.expect(TAG_INTEGER, "error-status"), "error-status"));
    result.errorIndex = static_cast<int32_t>(decodeSigned(pduReader.expect(TAG_INTEGER, "error-index"), "error-index"));

    Tlv list = pduReader.expect(TAG_SEQUENCE, "varbind-list");
    BerReader listReader(list.value, list.length);
    while (!listReader.atEnd()) {
        result.varbinds.push_back(decodeVarBind(listReader.expect(TAG_SEQUENCE, "varbind")));
    }

    return result;
}

// BER encoding helpers

std::vector<uint8_t> SnmpCodec::encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 256) {
        encoded.push_back(0x81);
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 65536) {
        encoded.push_back(0x82);
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        encoded.push_back(0x83);
        encoded.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    }

    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeInteger(int64_t value, uint8_t tag) {
    // Minimal two's complement, most significant octet first
    std::vector<uint8_t> bytes;
    while (true) {
        auto byte = static_cast<uint8_t>(value & 0xFF);
        bytes.insert(bytes.begin(), byte);
        value >>= 8;
        if ((value == 0 && !(byte & 0x80)) || (value == -1 && (byte & 0x80))) {
            break;
        }
    }

    std::vector<uint8_t> encoded{tag};
    append(encoded, encodeLength(bytes.size()));
    append(encoded, bytes);
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeUnsigned(uint64_t value, uint8_t tag) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);

    // Add leading zero if high bit is set
    if (bytes[0] & 0x80) {
        bytes.insert(bytes.begin(), 0);
    }

    std::vector<uint8_t> encoded{tag};
    append(encoded, encodeLength(bytes.size()));
    append(encoded, bytes);
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeOctetString(const std::string& str) {
    std::vector<uint8_t> encoded{TAG_OCTET_STRING};
    append(encoded, encodeLength(str.size()));
    encoded.insert(encoded.end(), str.begin(), str.end());
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeOid(const std::string& oid) {
    auto components = parseOid(oid);
    if (components.size() < 2 || components[0] > 2 || (components[0] < 2 && components[1] >= 40)) {
        throw core::ValidationError("Invalid OID: " + oid);
    }

    std::vector<uint8_t> oidBytes;
    auto appendSubId = [&oidBytes](uint64_t val) {
        std::vector<uint8_t> subId;
        do {
            subId.insert(subId.begin(), static_cast<uint8_t>(val & 0x7F));
            val >>= 7;
        } while (val > 0);
        // Set high bit on all but last byte
        for (size_t j = 0; j + 1 < subId.size(); ++j) {
            subId[j] |= 0x80;
        }
        oidBytes.insert(oidBytes.end(), subId.begin(), subId.end());
    };

    // First two components are encoded as (first * 40 + second)
    appendSubId(static_cast<uint64_t>(components[0]) * 40 + components[1]);
    for (size_t i = 2; i < components.size(); ++i) {
        appendSubId(components[i]);
    }

    std::vector<uint8_t> encoded{TAG_OID};
    append(encoded, encodeLength(oidBytes.size()));
    append(encoded, oidBytes);
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeNull(uint8_t tag) {
    return {tag, 0x00};
}

std::vector<uint8_t> SnmpCodec::encodeSequence(const std::vector<uint8_t>& content, uint8_t tag) {
    std::vector<uint8_t> encoded{tag};
    append(encoded, encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

// BER decoding helpers

std::string SnmpCodec::decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) {
        throw core::DecodeError("Empty OID");
    }

    std::vector<uint32_t> components;
    uint64_t value = 0;
    bool first = true;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 7) | (data[i] & 0x7F);
        if (value > std::numeric_limits<uint32_t>::max() + static_cast<uint64_t>(80)) {
            throw core::DecodeError("OID sub-identifier overflow");
        }
        if ((data[i] & 0x80) != 0) {
            continue;
        }
        if (first) {
            // First sub-identifier encodes the first two components
            if (value < 40) {
                components.push_back(0);
                components.push_back(static_cast<uint32_t>(value));
            } else if (value < 80) {
                components.push_back(1);
                components.push_back(static_cast<uint32_t>(value - 40));
            } else {
                components.push_back(2);
                components.push_back(static_cast<uint32_t>(value - 80));
            }
            first = false;
        } else {
            if (value > std::numeric_limits<uint32_t>::max()) {
                throw core::DecodeError("OID sub-identifier overflow");
            }
            components.push_back(static_cast<uint32_t>(value));
        }
        value = 0;
    }

    if (data[length - 1] & 0x80) {
        throw core::DecodeError("Truncated OID sub-identifier");
    }

    return oidToString(components);
}

std::vector<uint32_t> SnmpCodec::parseOid(const std::string& oid) {
    std::vector<uint32_t> components;
    size_t start = 0;
    // Tolerate a single leading dot (".1.3.6...")
    if (!oid.empty() && oid[0] == '.') {
        start = 1;
    }
    if (start >= oid.size()) {
        throw core::ValidationError("Empty OID");
    }

    while (start <= oid.size()) {
        size_t end = oid.find('.', start);
        if (end == std::string::npos) {
            end = oid.size();
        }
        uint32_t value = 0;
        const char* first = oid.data() + start;
        const char* last = oid.data() + end;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (first == last || ec != std::errc{} || ptr != last) {
            throw core::ValidationError("Invalid OID component in: " + oid);
        }
        components.push_back(value);
        start = end + 1;
    }

    return components;
}

std::string SnmpCodec::oidToString(const std::vector<uint32_t>& oid) {
    std::string result;
    for (size_t i = 0; i < oid.size(); ++i) {
        if (i > 0) result += '.';
        result += std::to_string(oid[i]);
    }
    return result;
}

bool SnmpCodec::isOidPrefix(const std::string& prefix, const std::string& oid) {
    if (oid.size() < prefix.size()) return false;
    if (oid.compare(0, prefix.size(), prefix) != 0) return false;

    // Ensure we're at a boundary
    if (oid.size() > prefix.size() && oid[prefix.size()] != '.') {
        return false;
    }

    return true;
}

int SnmpCodec::compareOids(const std::string& a, const std::string& b) {
    std::vector<uint32_t> left;
    std::vector<uint32_t> right;
    try {
        left = parseOid(a);
    } catch (const core::ValidationError&) {
        left.clear();
    }
    try {
        right = parseOid(b);
    } catch (const core::ValidationError&) {
        right.clear();
    }

    size_t common = std::min(left.size(), right.size());
    for (size_t i = 0; i < common; ++i) {
        if (left[i] != right[i]) {
            return left[i] < right[i] ? -1 : 1;
        }
    }
    if (left.size() == right.size()) return 0;
    return left.size() < right.size() ? -1 : 1;
}

core::SnmpDataType SnmpCodec::tagToDataType(uint8_t tag) {
    switch (tag) {
        case TAG_INTEGER: return core::SnmpDataType::Integer;
        case TAG_OCTET_STRING: return core::SnmpDataType::OctetString;
        case TAG_OID: return core::SnmpDataType::ObjectIdentifier;
        case TAG_IP_ADDRESS: return core::SnmpDataType::IpAddress;
        case TAG_COUNTER32: return core::SnmpDataType::Counter32;
        case TAG_GAUGE32: return core::SnmpDataType::Gauge32;
        case TAG_TIMETICKS: return core::SnmpDataType::TimeTicks;
        case TAG_COUNTER64: return core::SnmpDataType::Counter64;
        case TAG_NULL: return core::SnmpDataType::Null;
        case TAG_NO_SUCH_OBJECT: return core::SnmpDataType::NoSuchObject;
        case TAG_NO_SUCH_INSTANCE: return core::SnmpDataType::NoSuchInstance;
        case TAG_END_OF_MIB_VIEW: return core::SnmpDataType::EndOfMibView;
        default: return core::SnmpDataType::Unknown;
    }
}

uint8_t SnmpCodec::dataTypeToTag(core::SnmpDataType type) {
    switch (type) {
        case core::SnmpDataType::Integer: return TAG_INTEGER;
        case core::SnmpDataType::OctetString: return TAG_OCTET_STRING;
        case core::SnmpDataType::ObjectIdentifier: return TAG_OID;
        case core::SnmpDataType::IpAddress: return TAG_IP_ADDRESS;
        case core::SnmpDataType::Counter32: return TAG_COUNTER32;
        case core::SnmpDataType::Gauge32: return TAG_GAUGE32;
        case core::SnmpDataType::TimeTicks: return TAG_TIMETICKS;
        case core::SnmpDataType::Counter64: return TAG_COUNTER64;
        case core::SnmpDataType::NoSuchObject: return TAG_NO_SUCH_OBJECT;
        case core::SnmpDataType::NoSuchInstance: return TAG_NO_SUCH_INSTANCE;
        case core::SnmpDataType::EndOfMibView: return TAG_END_OF_MIB_VIEW;
        case core::SnmpDataType::Null:
        case core::SnmpDataType::Malformed:
        case core::SnmpDataType::Unknown: return TAG_NULL;
    }
    return TAG_NULL;
}

std::string SnmpCodec::errorStatusToString(int32_t errorStatus) {
    switch (errorStatus) {
        case ERR_NO_ERROR: return "No error";
        case ERR_TOO_BIG: return "Response too big";
        case ERR_NO_SUCH_NAME: return "No such name";
        case ERR_BAD_VALUE: return "Bad value";
        case ERR_READ_ONLY: return "Read only";
        case ERR_GEN_ERR: return "General error";
        default: return "Error status " + std::to_string(errorStatus);
    }
}

} // namespace netsweep::infra
