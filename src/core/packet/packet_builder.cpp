// src/core/packet/packet_builder.cpp
#include "packet_builder.hpp"
#include "../../common/network_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            std::optional<IPv4Packet> PacketBuilder::buildIPv4Packet(const Common::IPv4Address &source,
                                                                     const Common::IPv4Address &destination,
                                                                     uint8_t protocol,
                                                                     uint8_t ttl,
                                                                     IPv4Payload payload,
                                                                     size_t payload_size,
                                                                     uint16_t identification)
            {
                if (payload_size == 0)
                {
                    payload_size = payloadWireSize(payload);
                }
                // Total length là 16 bit
                if (payload_size > MAX_IPV4_PAYLOAD)
                {
                    return std::nullopt;
                }

                IPv4Header header;
                header.total_length = static_cast<uint16_t>(IPV4_HEADER_SIZE + payload_size);
                header.identification = identification;
                header.ttl = ttl;
                header.protocol = protocol;
                header.source = source;
                header.destination = destination;

                return IPv4Packet(header, std::move(payload)).withChecksum();
            }

            IPv4Packet PacketBuilder::createIPv4Packet(const Common::IPv4Address &source,
                                                       const Common::IPv4Address &destination,
                                                       uint8_t protocol,
                                                       uint8_t ttl,
                                                       IPv4Payload payload,
                                                       size_t payload_size,
                                                       uint16_t identification)
            {
                auto packet = buildIPv4Packet(source, destination, protocol, ttl, std::move(payload), payload_size,
                                              identification);
                if (!packet)
                {
                    throw std::invalid_argument("IPv4 payload exceeds " + std::to_string(MAX_IPV4_PAYLOAD) + " bytes");
                }
                return *packet;
            }

            // ==================== ICMP ====================

            uint16_t PacketBuilder::computeIcmpChecksum(const IcmpMessage &message)
            {
                IcmpMessage copy = message;
                copy.checksum = 0;
                std::vector<uint8_t> bytes = copy.serialize();
                return Common::NetworkUtils::internetChecksum(bytes.data(), bytes.size());
            }

            IcmpMessage PacketBuilder::createEchoRequest(uint16_t identifier, uint16_t sequence, size_t data_size)
            {
                IcmpMessage message;
                message.type = IcmpType::ECHO_REQUEST;
                message.code = 0;
                message.identifier = identifier;
                message.sequence = sequence;
                message.data.resize(data_size);
                for (size_t i = 0; i < data_size; ++i)
                {
                    message.data[i] = static_cast<uint8_t>('a' + (i % 23));
                }
                message.checksum = computeIcmpChecksum(message);
                return message;
            }

            IcmpMessage PacketBuilder::createEchoReply(const IcmpMessage &request)
            {
                IcmpMessage reply = request;
                reply.type = IcmpType::ECHO_REPLY;
                reply.code = 0;
                reply.checksum = computeIcmpChecksum(reply);
                return reply;
            }

            IcmpMessage PacketBuilder::createIcmpError(IcmpType type, uint8_t code, const IPv4Packet &original)
            {
                IcmpMessage message;
                message.type = type;
                message.code = code;

                auto header = original.headerBytes();
                message.data.assign(header.begin(), header.end());

                std::vector<uint8_t> body = serializePayload(original.payload());
                size_t copy = std::min<size_t>(8, body.size());
                message.data.insert(message.data.end(), body.begin(), body.begin() + static_cast<std::ptrdiff_t>(copy));

                message.checksum = computeIcmpChecksum(message);
                return message;
            }

            std::optional<Common::IPv4Address> PacketBuilder::icmpErrorOriginalDestination(const IcmpMessage &error)
            {
                if (!error.isError() || error.data.size() < IPV4_HEADER_SIZE)
                {
                    return std::nullopt;
                }
                uint32_t value = (static_cast<uint32_t>(error.data[16]) << 24) |
                                 (static_cast<uint32_t>(error.data[17]) << 16) |
                                 (static_cast<uint32_t>(error.data[18]) << 8) |
                                 static_cast<uint32_t>(error.data[19]);
                return Common::IPv4Address(value);
            }

            // ==================== TCP / UDP ====================

            TcpSegment PacketBuilder::createTcpSegment(uint16_t source_port, uint16_t destination_port,
                                                       uint8_t flags, size_t data_size)
            {
                TcpSegment segment;
                segment.source_port = source_port;
                segment.destination_port = destination_port;
                segment.flags = flags;
                segment.data.assign(data_size, 0);
                return segment;
            }

            UdpDatagram PacketBuilder::createUdpDatagram(uint16_t source_port, uint16_t destination_port,
                                                         size_t data_size)
            {
                UdpDatagram datagram;
                datagram.source_port = source_port;
                datagram.destination_port = destination_port;
                datagram.data.assign(data_size, 0);
                return datagram;
            }

            // ==================== Ethernet / ARP ====================

            EthernetFrame PacketBuilder::createFrame(const Common::MacAddress &source,
                                                     const Common::MacAddress &destination,
                                                     const IPv4Packet &packet,
                                                     std::optional<VlanTag> vlan_tag)
            {
                return EthernetFrame(destination, source, EtherType::IPV4, packet, vlan_tag);
            }

            EthernetFrame PacketBuilder::createArpRequest(const Common::MacAddress &sender_mac,
                                                          const Common::IPv4Address &sender_ip,
                                                          const Common::IPv4Address &target_ip)
            {
                ArpPacket arp;
                arp.operation = ArpOperation::REQUEST;
                arp.sender_mac = sender_mac;
                arp.sender_ip = sender_ip;
                arp.target_ip = target_ip;
                return EthernetFrame(Common::MacAddress::broadcast(), sender_mac, EtherType::ARP, arp);
            }

            EthernetFrame PacketBuilder::createArpReply(const Common::MacAddress &sender_mac,
                                                        const Common::IPv4Address &sender_ip,
                                                        const Common::MacAddress &target_mac,
                                                        const Common::IPv4Address &target_ip)
            {
                ArpPacket arp;
                arp.operation = ArpOperation::REPLY;
                arp.sender_mac = sender_mac;
                arp.sender_ip = sender_ip;
                arp.target_mac = target_mac;
                arp.target_ip = target_ip;
                return EthernetFrame(target_mac, sender_mac, EtherType::ARP, arp);
            }

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim
