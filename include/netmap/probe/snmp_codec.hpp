/**
 * @file snmp_codec.hpp
 * @brief BER encoding of SNMPv1/v2c requests and decoding of responses.
 *
 * Covers the PDUs needed for read-only discovery: GetRequest,
 * GetNextRequest, GetBulkRequest (v2c) and GetResponse.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#include "netmap/probe/export.hpp"
#include "netmap/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netmap {
namespace probe {

enum class SnmpPduType : uint8_t {
    GET = 0xA0,
    GET_NEXT = 0xA1,
    RESPONSE = 0xA2,
    GET_BULK = 0xA5
};

enum class SnmpValueType {
    INTEGER,
    OCTET_STRING,
    NULL_VALUE,
    OBJECT_ID,
    IP_ADDRESS,
    COUNTER32,
    GAUGE32,
    TIMETICKS,
    OPAQUE,
    COUNTER64,
    NO_SUCH_OBJECT,
    NO_SUCH_INSTANCE,
    END_OF_MIB_VIEW,
    UNKNOWN
};

/// Wire value of the version field.
constexpr int32_t SNMP_VERSION_1 = 0;
constexpr int32_t SNMP_VERSION_2C = 1;

/**
 * @struct SnmpValue
 * @brief Decoded varbind value.
 */
struct NETMAP_PROBE_API SnmpValue {
    SnmpValueType type = SnmpValueType::NULL_VALUE;
    int64_t integer = 0;        ///< INTEGER
    uint64_t unsignedValue = 0; ///< Counter32/64, Gauge32, TimeTicks
    std::string bytes;          ///< OCTET STRING, Opaque, IpAddress (raw)
    std::string oid;            ///< OBJECT IDENTIFIER

    /// noSuchObject, noSuchInstance or endOfMibView.
    bool isException() const;

    /// Numeric view of INTEGER and the unsigned types; 0 otherwise.
    int64_t asInteger() const;

    /**
     * @brief Text view: strings verbatim, IpAddress dotted, OIDs dotted,
     *        numbers in decimal.
     */
    std::string asString() const;
};

struct NETMAP_PROBE_API VarBind {
    std::string oid;
    SnmpValue value;
};

struct NETMAP_PROBE_API SnmpRequest {
    int32_t version = SNMP_VERSION_2C;
    std::string community = "public";
    SnmpPduType pduType = SnmpPduType::GET;
    int32_t requestId = 0;
    std::vector<std::string> oids;
    int32_t nonRepeaters = 0;       ///< GETBULK only
    int32_t maxRepetitions = 0;     ///< GETBULK only
};

struct NETMAP_PROBE_API SnmpResponse {
    int32_t version = 0;
    std::string community;
    int32_t requestId = 0;
    int32_t errorStatus = 0;
    int32_t errorIndex = 0;
    std::vector<VarBind> varbinds;
};

/**
 * @brief Parse a dotted OID ("1.3.6.1.2.1.1.1.0", leading dot allowed).
 * @return False if the text is not a valid OID with at least two arcs.
 */
NETMAP_PROBE_API bool parseOid(const std::string& text, std::vector<uint32_t>& arcs);

/**
 * @brief Parse a table-row index suffix ("5", "100.0.17.34.51.68.85").
 *
 * Unlike parseOid() there are no root-arc rules; each arc only has to fit
 * in 32 bits.
 * @return False for empty text or a non-numeric or oversized arc.
 */
NETMAP_PROBE_API bool parseIndexArcs(const std::string& text, std::vector<uint32_t>& arcs);

NETMAP_PROBE_API std::string oidToString(const std::vector<uint32_t>& arcs);

/**
 * @brief True when oid lies strictly below prefix in the OID tree.
 */
NETMAP_PROBE_API bool oidIsUnder(const std::string& oid, const std::string& prefix);

/**
 * @brief Lexicographic comparison by arc value.
 * @return Negative, zero or positive like strcmp.
 */
NETMAP_PROBE_API int compareOids(const std::string& a, const std::string& b);

/**
 * @brief Arcs of oid after prefix, dotted ("" when not under prefix).
 */
NETMAP_PROBE_API std::string oidSuffix(const std::string& oid, const std::string& prefix);

/**
 * @brief BER-encode a request message.
 * @return The packet, or an error for malformed OIDs.
 */
NETMAP_PROBE_API core::Result<std::vector<uint8_t>> encodeRequest(const SnmpRequest& request);

/**
 * @brief Decode a GetResponse message.
 */
NETMAP_PROBE_API core::Result<SnmpResponse> decodeResponse(const uint8_t* data, size_t length);

/**
 * @brief Human-readable name for an SNMP error-status code.
 */
NETMAP_PROBE_API const char* snmpErrorName(int32_t errorStatus);

}  // namespace probe
}  // namespace netmap
