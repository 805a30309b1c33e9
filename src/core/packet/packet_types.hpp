// src/core/packet/packet_types.hpp
#ifndef NETSIM_PACKET_TYPES_HPP
#define NETSIM_PACKET_TYPES_HPP

#include "../../common/address.hpp"
#include <cstdint>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            // ==================== Constants ====================

            namespace EtherType
            {
                constexpr uint16_t IPV4 = 0x0800;
                constexpr uint16_t ARP = 0x0806;
                constexpr uint16_t VLAN = 0x8100;
                constexpr uint16_t IPV6 = 0x86DD;
            }

            namespace IpProtocol
            {
                constexpr uint8_t ICMP = 1;
                constexpr uint8_t TCP = 6;
                constexpr uint8_t UDP = 17;
                constexpr uint8_t OSPF = 89;
            }

            constexpr size_t ETHERNET_HEADER_SIZE = 14;
            constexpr size_t VLAN_TAG_SIZE = 4;
            constexpr size_t IPV4_HEADER_SIZE = 20;
            constexpr size_t ICMP_HEADER_SIZE = 8;
            constexpr size_t TCP_HEADER_SIZE = 20;
            constexpr size_t UDP_HEADER_SIZE = 8;

            // ==================== ICMP ====================

            enum class IcmpType : uint8_t
            {
                ECHO_REPLY = 0,
                DEST_UNREACHABLE = 3,
                REDIRECT = 5,
                ECHO_REQUEST = 8,
                TIME_EXCEEDED = 11
            };

            namespace IcmpCode
            {
                constexpr uint8_t NET_UNREACHABLE = 0;
                constexpr uint8_t HOST_UNREACHABLE = 1;
                constexpr uint8_t PROTOCOL_UNREACHABLE = 2;
                constexpr uint8_t PORT_UNREACHABLE = 3;
                constexpr uint8_t ADMIN_PROHIBITED = 13;
                constexpr uint8_t TTL_EXCEEDED_IN_TRANSIT = 0;
            }

            /**
             * @brief ICMP message. Không có địa chỉ/TTL: chúng thuộc IPv4 header bao ngoài.
             */
            struct IcmpMessage
            {
                IcmpType type = IcmpType::ECHO_REQUEST;
                uint8_t code = 0;
                uint16_t checksum = 0;
                uint16_t identifier = 0;    // echo only
                uint16_t sequence = 0;      // echo only
                std::vector<uint8_t> data;  // echo payload hoặc header gốc + 8 byte (error)

                bool isError() const
                {
                    return type == IcmpType::DEST_UNREACHABLE || type == IcmpType::TIME_EXCEEDED ||
                           type == IcmpType::REDIRECT;
                }

                std::vector<uint8_t> serialize() const;
            };

            // ==================== TCP / UDP ====================

            namespace TcpFlags
            {
                constexpr uint8_t FIN = 0x01;
                constexpr uint8_t SYN = 0x02;
                constexpr uint8_t RST = 0x04;
                constexpr uint8_t PSH = 0x08;
                constexpr uint8_t ACK = 0x10;
                constexpr uint8_t URG = 0x20;
            }

            struct TcpSegment
            {
                uint16_t source_port = 0;
                uint16_t destination_port = 0;
                uint32_t sequence_number = 0;
                uint32_t ack_number = 0;
                uint8_t flags = 0;
                uint16_t window = 65535;
                uint16_t checksum = 0;
                std::vector<uint8_t> data;

                bool hasFlag(uint8_t flag) const { return (flags & flag) != 0; }
                std::vector<uint8_t> serialize() const;
            };

            struct UdpDatagram
            {
                uint16_t source_port = 0;
                uint16_t destination_port = 0;
                uint16_t checksum = 0;
                std::vector<uint8_t> data;

                std::vector<uint8_t> serialize() const;
            };

            struct RawPayload
            {
                std::vector<uint8_t> data;
            };

            // ==================== ARP ====================

            enum class ArpOperation : uint16_t
            {
                REQUEST = 1,
                REPLY = 2
            };

            struct ArpPacket
            {
                ArpOperation operation = ArpOperation::REQUEST;
                Common::MacAddress sender_mac;
                Common::IPv4Address sender_ip;
                Common::MacAddress target_mac;
                Common::IPv4Address target_ip;

                std::vector<uint8_t> serialize() const;
            };

            // ==================== 802.1Q ====================

            struct VlanTag
            {
                uint16_t tpid = EtherType::VLAN;
                uint8_t pcp = 0;
                bool dei = false;
                uint16_t vid = 1;

                bool operator==(const VlanTag &other) const
                {
                    return tpid == other.tpid && pcp == other.pcp && dei == other.dei && vid == other.vid;
                }
            };

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_PACKET_TYPES_HPP
