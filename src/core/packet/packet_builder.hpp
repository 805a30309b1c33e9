// src/core/packet/packet_builder.hpp
#ifndef NETSIM_PACKET_BUILDER_HPP
#define NETSIM_PACKET_BUILDER_HPP

#include "ethernet_frame.hpp"
#include <optional>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            /**
             * @brief Tạo packet/frame đầy đủ: Ethernet chứa IPv4 chứa {ICMP | TCP | UDP}
             */
            class PacketBuilder
            {
            public:
                static constexpr size_t MAX_IPV4_PAYLOAD = 0xFFFF - IPV4_HEADER_SIZE;

                /**
                 * @brief Tạo IPv4 packet với total length và header checksum tự tính
                 * @param payload_size Kích thước payload; 0 = suy ra từ payload
                 * @return std::nullopt nếu payload vượt quá MAX_IPV4_PAYLOAD
                 */
                static std::optional<IPv4Packet> buildIPv4Packet(const Common::IPv4Address &source,
                                                                 const Common::IPv4Address &destination,
                                                                 uint8_t protocol,
                                                                 uint8_t ttl,
                                                                 IPv4Payload payload,
                                                                 size_t payload_size = 0,
                                                                 uint16_t identification = 0);

                /**
                 * @brief Như buildIPv4Packet nhưng throw std::invalid_argument khi payload quá lớn
                 */
                static IPv4Packet createIPv4Packet(const Common::IPv4Address &source,
                                                   const Common::IPv4Address &destination,
                                                   uint8_t protocol,
                                                   uint8_t ttl,
                                                   IPv4Payload payload,
                                                   size_t payload_size = 0,
                                                   uint16_t identification = 0);

                // ==================== ICMP ====================
                static IcmpMessage createEchoRequest(uint16_t identifier, uint16_t sequence, size_t data_size = 32);
                static IcmpMessage createEchoReply(const IcmpMessage &request);

                /**
                 * @brief ICMP error mang IPv4 header gốc + 8 byte đầu của payload
                 */
                static IcmpMessage createIcmpError(IcmpType type, uint8_t code, const IPv4Packet &original);

                /**
                 * @brief Địa chỉ đích của packet gốc trong ICMP error (nếu đọc được)
                 */
                static std::optional<Common::IPv4Address> icmpErrorOriginalDestination(const IcmpMessage &error);

                // ==================== TCP / UDP ====================
                static TcpSegment createTcpSegment(uint16_t source_port, uint16_t destination_port,
                                                   uint8_t flags, size_t data_size = 0);
                static UdpDatagram createUdpDatagram(uint16_t source_port, uint16_t destination_port,
                                                     size_t data_size = 0);

                // ==================== Ethernet / ARP ====================
                static EthernetFrame createFrame(const Common::MacAddress &source,
                                                 const Common::MacAddress &destination,
                                                 const IPv4Packet &packet,
                                                 std::optional<VlanTag> vlan_tag = std::nullopt);

                static EthernetFrame createArpRequest(const Common::MacAddress &sender_mac,
                                                      const Common::IPv4Address &sender_ip,
                                                      const Common::IPv4Address &target_ip);

                static EthernetFrame createArpReply(const Common::MacAddress &sender_mac,
                                                    const Common::IPv4Address &sender_ip,
                                                    const Common::MacAddress &target_mac,
                                                    const Common::IPv4Address &target_ip);

                /**
                 * @brief ICMP checksum (RFC 792) trên message đã serialize
                 */
                static uint16_t computeIcmpChecksum(const IcmpMessage &message);

            private:
                PacketBuilder() = default;
            };

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_PACKET_BUILDER_HPP
