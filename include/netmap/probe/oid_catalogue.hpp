/**
 * @file oid_catalogue.hpp
 * @brief Object identifiers read by the SNMP fact battery.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

namespace netmap {
namespace probe {
namespace oid {

// SNMPv2-MIB system group (scalars)
constexpr const char* SYS_DESCR = "1.3.6.1.2.1.1.1.0";
constexpr const char* SYS_OBJECT_ID = "1.3.6.1.2.1.1.2.0";
constexpr const char* SYS_UPTIME = "1.3.6.1.2.1.1.3.0";
constexpr const char* SYS_CONTACT = "1.3.6.1.2.1.1.4.0";
constexpr const char* SYS_NAME = "1.3.6.1.2.1.1.5.0";
constexpr const char* SYS_LOCATION = "1.3.6.1.2.1.1.6.0";
constexpr const char* SYS_SERVICES = "1.3.6.1.2.1.1.7.0";

// IF-MIB ifTable / ifXTable
constexpr const char* IF_ENTRY = "1.3.6.1.2.1.2.2.1";
constexpr int IF_INDEX = 1;
constexpr int IF_DESCR = 2;
constexpr int IF_TYPE = 3;
constexpr int IF_MTU = 4;
constexpr int IF_SPEED = 5;
constexpr int IF_PHYS_ADDRESS = 6;
constexpr int IF_ADMIN_STATUS = 7;
constexpr int IF_OPER_STATUS = 8;
constexpr int IF_IN_OCTETS = 10;
constexpr int IF_IN_ERRORS = 14;
constexpr int IF_OUT_OCTETS = 16;
constexpr int IF_OUT_ERRORS = 20;
constexpr const char* IF_NAME = "1.3.6.1.2.1.31.1.1.1.1";

// IP-MIB ipAddrTable
constexpr const char* IP_AD_ENT_ADDR = "1.3.6.1.2.1.4.20.1.1";
constexpr const char* IP_AD_ENT_IF_INDEX = "1.3.6.1.2.1.4.20.1.2";
constexpr const char* IP_AD_ENT_NETMASK = "1.3.6.1.2.1.4.20.1.3";

// IP-MIB ipNetToMediaTable
constexpr const char* IP_NET_TO_MEDIA_IF_INDEX = "1.3.6.1.2.1.4.22.1.1";
constexpr const char* IP_NET_TO_MEDIA_PHYS = "1.3.6.1.2.1.4.22.1.2";
constexpr const char* IP_NET_TO_MEDIA_NET_ADDR = "1.3.6.1.2.1.4.22.1.3";
constexpr const char* IP_NET_TO_MEDIA_TYPE = "1.3.6.1.2.1.4.22.1.4";

// BRIDGE-MIB
constexpr const char* DOT1D_BASE_PORT_IF_INDEX = "1.3.6.1.2.1.17.1.4.1.2";
constexpr const char* DOT1D_TP_FDB_ADDRESS = "1.3.6.1.2.1.17.4.3.1.1";
constexpr const char* DOT1D_TP_FDB_PORT = "1.3.6.1.2.1.17.4.3.1.2";
constexpr const char* DOT1D_TP_FDB_STATUS = "1.3.6.1.2.1.17.4.3.1.3";

// Q-BRIDGE-MIB, indexed by fdbId.mac
constexpr const char* DOT1Q_TP_FDB_PORT = "1.3.6.1.2.1.17.7.1.2.2.1.2";
constexpr const char* DOT1Q_TP_FDB_STATUS = "1.3.6.1.2.1.17.7.1.2.2.1.3";

// CISCO-VTP-MIB, indexed by managementDomain.vlanId
constexpr const char* VTP_VLAN_STATE = "1.3.6.1.4.1.9.9.46.1.3.1.1.2";
constexpr const char* VTP_VLAN_NAME = "1.3.6.1.4.1.9.9.46.1.3.1.1.4";

// CISCO-CDP-MIB cdpCacheTable, indexed by ifIndex.deviceIndex
constexpr const char* CDP_CACHE_ADDRESS = "1.3.6.1.4.1.9.9.23.1.2.1.1.4";
constexpr const char* CDP_CACHE_DEVICE_ID = "1.3.6.1.4.1.9.9.23.1.2.1.1.6";
constexpr const char* CDP_CACHE_DEVICE_PORT = "1.3.6.1.4.1.9.9.23.1.2.1.1.7";
constexpr const char* CDP_CACHE_PLATFORM = "1.3.6.1.4.1.9.9.23.1.2.1.1.8";

// LLDP-MIB, remote table indexed by timeMark.localPortNum.remIndex
constexpr const char* LLDP_REM_CHASSIS_ID_SUBTYPE = "1.0.8802.1.1.2.1.4.1.1.4";
constexpr const char* LLDP_REM_CHASSIS_ID = "1.0.8802.1.1.2.1.4.1.1.5";
constexpr const char* LLDP_REM_PORT_ID_SUBTYPE = "1.0.8802.1.1.2.1.4.1.1.6";
constexpr const char* LLDP_REM_PORT_ID = "1.0.8802.1.1.2.1.4.1.1.7";
constexpr const char* LLDP_REM_PORT_DESC = "1.0.8802.1.1.2.1.4.1.1.8";
constexpr const char* LLDP_REM_SYS_NAME = "1.0.8802.1.1.2.1.4.1.1.9";
constexpr const char* LLDP_REM_SYS_DESC = "1.0.8802.1.1.2.1.4.1.1.10";
constexpr const char* LLDP_REM_MAN_ADDR_IF_SUBTYPE = "1.0.8802.1.1.2.1.4.2.1.3";
constexpr const char* LLDP_LOC_PORT_ID = "1.0.8802.1.1.2.1.3.7.1.3";
constexpr const char* LLDP_LOC_PORT_DESC = "1.0.8802.1.1.2.1.3.7.1.4";

}  // namespace oid
}  // namespace probe
}  // namespace netmap
