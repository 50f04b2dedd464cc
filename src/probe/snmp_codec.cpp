/**
 * @file snmp_codec.cpp
 * @brief SNMP BER codec implementation.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#include "netmap/probe/snmp_codec.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace netmap {
namespace probe {

namespace {

constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_GAUGE32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_OPAQUE = 0x44;
constexpr uint8_t TAG_COUNTER64 = 0x46;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

using Bytes = std::vector<uint8_t>;

// =============================================================================
// Encoding
// =============================================================================

void appendLength(Bytes& out, size_t length) {
    if (length < 0x80) {
        out.push_back(static_cast<uint8_t>(length));
        return;
    }
    Bytes digits;
    while (length > 0) {
        digits.insert(digits.begin(), static_cast<uint8_t>(length & 0xFF));
        length >>= 8;
    }
    out.push_back(static_cast<uint8_t>(0x80 | digits.size()));
    out.insert(out.end(), digits.begin(), digits.end());
}

void appendTlv(Bytes& out, uint8_t tag, const Bytes& value) {
    out.push_back(tag);
    appendLength(out, value.size());
    out.insert(out.end(), value.begin(), value.end());
}

Bytes encodeInteger(int64_t value) {
    Bytes bytes;
    // Two's complement, minimal length
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (!((value == 0 && !(bytes.front() & 0x80)) ||
               (value == -1 && (bytes.front() & 0x80))));
    return bytes;
}

Bytes encodeOidValue(const std::vector<uint32_t>& arcs) {
    Bytes bytes;
    auto appendArc = [&bytes](uint32_t arc) {
        uint8_t chunk[5];
        int n = 0;
        do {
            chunk[n++] = static_cast<uint8_t>(arc & 0x7F);
            arc >>= 7;
        } while (arc > 0);
        for (int i = n - 1; i >= 0; --i) {
            bytes.push_back(static_cast<uint8_t>(chunk[i] | (i > 0 ? 0x80 : 0x00)));
        }
    };
    appendArc(arcs[0] * 40 + arcs[1]);
    for (size_t i = 2; i < arcs.size(); ++i) {
        appendArc(arcs[i]);
    }
    return bytes;
}

// =============================================================================
// Decoding
// =============================================================================

/**
 * Bounds-checked cursor over one BER buffer.
 */
class BerReader {
public:
    BerReader(const uint8_t* data, size_t length) : data_(data), end_(data + length) {}

    bool atEnd() const { return data_ >= end_; }

    bool readTlv(uint8_t& tag, const uint8_t*& value, size_t& length) {
        if (end_ - data_ < 2) {
            return false;
        }
        tag = *data_++;
        uint8_t first = *data_++;
        if (first < 0x80) {
            length = first;
        } else {
            size_t count = first & 0x7F;
            if (count == 0 || count > sizeof(size_t) ||
                static_cast<size_t>(end_ - data_) < count) {
                return false;
            }
            length = 0;
            for (size_t i = 0; i < count; ++i) {
                length = (length << 8) | *data_++;
            }
        }
        if (static_cast<size_t>(end_ - data_) < length) {
            return false;
        }
        value = data_;
        data_ += length;
        return true;
    }

    bool expect(uint8_t expectedTag, BerReader& inner) {
        uint8_t tag;
        const uint8_t* value;
        size_t length;
        if (!readTlv(tag, value, length) || tag != expectedTag) {
            return false;
        }
        inner = BerReader(value, length);
        return true;
    }

    bool readInteger(int64_t& out) {
        uint8_t tag;
        const uint8_t* value;
        size_t length;
        if (!readTlv(tag, value, length) || tag != TAG_INTEGER) {
            return false;
        }
        return decodeSigned(value, length, out);
    }

    static bool decodeSigned(const uint8_t* value, size_t length, int64_t& out) {
        if (length == 0 || length > 8) {
            return false;
        }
        int64_t result = (value[0] & 0x80) ? -1 : 0;
        for (size_t i = 0; i < length; ++i) {
            result = static_cast<int64_t>((static_cast<uint64_t>(result) << 8) | value[i]);
        }
        out = result;
        return true;
    }

    static bool decodeUnsigned(const uint8_t* value, size_t length, uint64_t& out) {
        if (length == 0 || length > 9 || (length == 9 && value[0] != 0)) {
            return false;
        }
        uint64_t result = 0;
        for (size_t i = 0; i < length; ++i) {
            result = (result << 8) | value[i];
        }
        out = result;
        return true;
    }

    static bool decodeOid(const uint8_t* value, size_t length, std::string& out) {
        if (length == 0) {
            return false;
        }
        std::vector<uint32_t> arcs;
        uint64_t arc = 0;
        bool first = true;
        for (size_t i = 0; i < length; ++i) {
            arc = (arc << 7) | (value[i] & 0x7F);
            if (arc > 0xFFFFFFFFull) {
                return false;
            }
            if (!(value[i] & 0x80)) {
                if (first) {
                    uint32_t head = arc < 40 ? 0 : (arc < 80 ? 1 : 2);
                    arcs.push_back(head);
                    arcs.push_back(static_cast<uint32_t>(arc - head * 40));
                    first = false;
                } else {
                    arcs.push_back(static_cast<uint32_t>(arc));
                }
                arc = 0;
            }
        }
        if (value[length - 1] & 0x80) {
            return false;
        }
        out = oidToString(arcs);
        return true;
    }

private:
    const uint8_t* data_;
    const uint8_t* end_;
};

bool decodeValue(uint8_t tag, const uint8_t* value, size_t length, SnmpValue& out) {
    switch (tag) {
        case TAG_INTEGER:
            out.type = SnmpValueType::INTEGER;
            return BerReader::decodeSigned(value, length, out.integer);
        case TAG_OCTET_STRING:
            out.type = SnmpValueType::OCTET_STRING;
            out.bytes.assign(reinterpret_cast<const char*>(value), length);
            return true;
        case TAG_NULL:
            out.type = SnmpValueType::NULL_VALUE;
            return true;
        case TAG_OID:
            out.type = SnmpValueType::OBJECT_ID;
            return BerReader::decodeOid(value, length, out.oid);
        case TAG_IP_ADDRESS:
            out.type = SnmpValueType::IP_ADDRESS;
            out.bytes.assign(reinterpret_cast<const char*>(value), length);
            return length == 4;
        case TAG_COUNTER32:
            out.type = SnmpValueType::COUNTER32;
            return BerReader::decodeUnsigned(value, length, out.unsignedValue);
        case TAG_GAUGE32:
            out.type = SnmpValueType::GAUGE32;
            return BerReader::decodeUnsigned(value, length, out.unsignedValue);
        case TAG_TIMETICKS:
            out.type = SnmpValueType::TIMETICKS;
            return BerReader::decodeUnsigned(value, length, out.unsignedValue);
        case TAG_COUNTER64:
            out.type = SnmpValueType::COUNTER64;
            return BerReader::decodeUnsigned(value, length, out.unsignedValue);
        case TAG_OPAQUE:
            out.type = SnmpValueType::OPAQUE;
            out.bytes.assign(reinterpret_cast<const char*>(value), length);
            return true;
        case TAG_NO_SUCH_OBJECT:
            out.type = SnmpValueType::NO_SUCH_OBJECT;
            return true;
        case TAG_NO_SUCH_INSTANCE:
            out.type = SnmpValueType::NO_SUCH_INSTANCE;
            return true;
        case TAG_END_OF_MIB_VIEW:
            out.type = SnmpValueType::END_OF_MIB_VIEW;
            return true;
        default:
            out.type = SnmpValueType::UNKNOWN;
            out.bytes.assign(reinterpret_cast<const char*>(value), length);
            return true;
    }
}

}  // namespace

// =============================================================================
// SnmpValue
// =============================================================================

bool SnmpValue::isException() const {
    return type == SnmpValueType::NO_SUCH_OBJECT ||
           type == SnmpValueType::NO_SUCH_INSTANCE ||
           type == SnmpValueType::END_OF_MIB_VIEW;
}

int64_t SnmpValue::asInteger() const {
    switch (type) {
        case SnmpValueType::INTEGER:
            return integer;
        case SnmpValueType::COUNTER32:
        case SnmpValueType::GAUGE32:
        case SnmpValueType::TIMETICKS:
        case SnmpValueType::COUNTER64:
            return static_cast<int64_t>(unsignedValue);
        default:
            return 0;
    }
}

std::string SnmpValue::asString() const {
    switch (type) {
        case SnmpValueType::OCTET_STRING:
        case SnmpValueType::OPAQUE: {
            // DisplayStrings are often NUL padded
            std::string text = bytes;
            while (!text.empty() && text.back() == '\0') {
                text.pop_back();
            }
            return text;
        }
        case SnmpValueType::IP_ADDRESS: {
            if (bytes.size() != 4) {
                return "";
            }
            std::ostringstream oss;
            for (size_t i = 0; i < 4; ++i) {
                if (i > 0) oss << '.';
                oss << static_cast<int>(static_cast<unsigned char>(bytes[i]));
            }
            return oss.str();
        }
        case SnmpValueType::OBJECT_ID:
            return oid;
        case SnmpValueType::INTEGER:
            return std::to_string(integer);
        case SnmpValueType::COUNTER32:
        case SnmpValueType::GAUGE32:
        case SnmpValueType::TIMETICKS:
        case SnmpValueType::COUNTER64:
            return std::to_string(unsignedValue);
        default:
            return "";
    }
}

// =============================================================================
// OID helpers
// =============================================================================

bool parseIndexArcs(const std::string& text, std::vector<uint32_t>& arcs) {
    arcs.clear();
    size_t pos = (!text.empty() && text[0] == '.') ? 1 : 0;
    if (pos >= text.size()) {
        return false;
    }
    while (pos <= text.size()) {
        size_t dot = text.find('.', pos);
        std::string part = text.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 10) {
            arcs.clear();
            return false;
        }
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                arcs.clear();
                return false;
            }
        }
        unsigned long long value = std::stoull(part);
        if (value > 0xFFFFFFFFull) {
            arcs.clear();
            return false;
        }
        arcs.push_back(static_cast<uint32_t>(value));
        if (dot == std::string::npos) {
            break;
        }
        pos = dot + 1;
    }
    return true;
}

bool parseOid(const std::string& text, std::vector<uint32_t>& arcs) {
    if (!parseIndexArcs(text, arcs)) {
        return false;
    }
    // X.690 root arcs: 0..2, and below 40 under roots 0 and 1
    if (arcs.size() < 2 || arcs[0] > 2 || (arcs[0] < 2 && arcs[1] >= 40)) {
        arcs.clear();
        return false;
    }
    return true;
}

std::string oidToString(const std::vector<uint32_t>& arcs) {
    std::string out;
    for (size_t i = 0; i < arcs.size(); ++i) {
        if (i > 0) out += '.';
        out += std::to_string(arcs[i]);
    }
    return out;
}

int compareOids(const std::string& a, const std::string& b) {
    std::vector<uint32_t> arcsA;
    std::vector<uint32_t> arcsB;
    if (!parseOid(a, arcsA) || !parseOid(b, arcsB)) {
        return a.compare(b);
    }
    size_t n = std::min(arcsA.size(), arcsB.size());
    for (size_t i = 0; i < n; ++i) {
        if (arcsA[i] != arcsB[i]) {
            return arcsA[i] < arcsB[i] ? -1 : 1;
        }
    }
    if (arcsA.size() == arcsB.size()) {
        return 0;
    }
    return arcsA.size() < arcsB.size() ? -1 : 1;
}

bool oidIsUnder(const std::string& oid, const std::string& prefix) {
    std::string p = (!prefix.empty() && prefix[0] == '.') ? prefix.substr(1) : prefix;
    std::string o = (!oid.empty() && oid[0] == '.') ? oid.substr(1) : oid;
    return o.size() > p.size() + 1 && o.compare(0, p.size(), p) == 0 && o[p.size()] == '.';
}

std::string oidSuffix(const std::string& oid, const std::string& prefix) {
    if (!oidIsUnder(oid, prefix)) {
        return "";
    }
    std::string p = (!prefix.empty() && prefix[0] == '.') ? prefix.substr(1) : prefix;
    std::string o = (!oid.empty() && oid[0] == '.') ? oid.substr(1) : oid;
    return o.substr(p.size() + 1);
}

// =============================================================================
// Messages
// =============================================================================

core::Result<std::vector<uint8_t>> encodeRequest(const SnmpRequest& request) {
    Bytes varbindList;
    for (const auto& oid : request.oids) {
        std::vector<uint32_t> arcs;
        if (!parseOid(oid, arcs)) {
            return core::Result<Bytes>::failure("malformed OID '" + oid + "'");
        }
        Bytes varbind;
        appendTlv(varbind, TAG_OID, encodeOidValue(arcs));
        appendTlv(varbind, TAG_NULL, {});
        appendTlv(varbindList, TAG_SEQUENCE, varbind);
    }

    bool bulk = request.pduType == SnmpPduType::GET_BULK;
    if (bulk && request.version == SNMP_VERSION_1) {
        return core::Result<Bytes>::failure("GETBULK requires SNMPv2c");
    }

    Bytes pdu;
    appendTlv(pdu, TAG_INTEGER, encodeInteger(request.requestId));
    // GETBULK reuses error-status/error-index for non-repeaters/max-repetitions
    appendTlv(pdu, TAG_INTEGER, encodeInteger(bulk ? request.nonRepeaters : 0));
    appendTlv(pdu, TAG_INTEGER, encodeInteger(bulk ? request.maxRepetitions : 0));
    appendTlv(pdu, TAG_SEQUENCE, varbindList);

    Bytes message;
    appendTlv(message, TAG_INTEGER, encodeInteger(request.version));
    appendTlv(message, TAG_OCTET_STRING, Bytes(request.community.begin(), request.community.end()));
    appendTlv(message, static_cast<uint8_t>(request.pduType), pdu);

    Bytes packet;
    appendTlv(packet, TAG_SEQUENCE, message);
    return core::Result<Bytes>::success(std::move(packet));
}

core::Result<SnmpResponse> decodeResponse(const uint8_t* data, size_t length) {
    using R = core::Result<SnmpResponse>;
    SnmpResponse response;

    BerReader top(data, length);
    BerReader message(nullptr, 0);
    if (!top.expect(TAG_SEQUENCE, message)) {
        return R::failure("not a BER sequence");
    }

    int64_t version = 0;
    if (!message.readInteger(version)) {
        return R::failure("missing version");
    }
    response.version = static_cast<int32_t>(version);

    uint8_t tag;
    const uint8_t* value;
    size_t valueLength;
    if (!message.readTlv(tag, value, valueLength) || tag != TAG_OCTET_STRING) {
        return R::failure("missing community");
    }
    response.community.assign(reinterpret_cast<const char*>(value), valueLength);

    BerReader pdu(nullptr, 0);
    if (!message.expect(static_cast<uint8_t>(SnmpPduType::RESPONSE), pdu)) {
        return R::failure("not a GetResponse PDU");
    }

    int64_t requestId = 0;
    int64_t errorStatus = 0;
    int64_t errorIndex = 0;
    if (!pdu.readInteger(requestId) || !pdu.readInteger(errorStatus) ||
        !pdu.readInteger(errorIndex)) {
        return R::failure("truncated PDU header");
    }
    response.requestId = static_cast<int32_t>(requestId);
    response.errorStatus = static_cast<int32_t>(errorStatus);
    response.errorIndex = static_cast<int32_t>(errorIndex);

    BerReader list(nullptr, 0);
    if (!pdu.expect(TAG_SEQUENCE, list)) {
        return R::failure("missing varbind list");
    }

    while (!list.atEnd()) {
        BerReader entry(nullptr, 0);
        if (!list.expect(TAG_SEQUENCE, entry)) {
            return R::failure("malformed varbind");
        }
        VarBind vb;
        if (!entry.readTlv(tag, value, valueLength) || tag != TAG_OID ||
            !BerReader::decodeOid(value, valueLength, vb.oid)) {
            return R::failure("malformed varbind OID");
        }
        if (!entry.readTlv(tag, value, valueLength) || !decodeValue(tag, value, valueLength, vb.value)) {
            return R::failure("malformed value for " + vb.oid);
        }
        response.varbinds.push_back(std::move(vb));
    }

    return R::success(std::move(response));
}

const char* snmpErrorName(int32_t errorStatus) {
    switch (errorStatus) {
        case 0: return "noError";
        case 1: return "tooBig";
        case 2: return "noSuchName";
        case 3: return "badValue";
        case 4: return "readOnly";
        case 5: return "genErr";
        case 6: return "noAccess";
        case 16: return "authorizationError";
        default: return "error";
    }
}

}  // namespace probe
}  // namespace netmap
