// src/core/packet/ipv4_packet.cpp
#include "ipv4_packet.hpp"
#include "byte_writer.hpp"
#include "../../common/network_utils.hpp"
#include <algorithm>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            // ==================== L4 serialization ====================

            std::vector<uint8_t> IcmpMessage::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);
                writer.u8(static_cast<uint8_t>(type));
                writer.u8(code);
                writer.u16(checksum);
                writer.u16(identifier);
                writer.u16(sequence);
                writer.bytes(data);
                return buffer;
            }

            std::vector<uint8_t> TcpSegment::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);
                writer.u16(source_port);
                writer.u16(destination_port);
                writer.u32(sequence_number);
                writer.u32(ack_number);
                writer.u8(0x50); // data offset = 5 words
                writer.u8(flags);
                writer.u16(window);
                writer.u16(checksum);
                writer.u16(0); // urgent pointer
                writer.bytes(data);
                return buffer;
            }

            std::vector<uint8_t> UdpDatagram::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);
                writer.u16(source_port);
                writer.u16(destination_port);
                writer.u16(static_cast<uint16_t>(UDP_HEADER_SIZE + data.size()));
                writer.u16(checksum);
                writer.bytes(data);
                return buffer;
            }

            std::vector<uint8_t> ArpPacket::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);
                writer.u16(1);                  // hardware type: Ethernet
                writer.u16(EtherType::IPV4);    // protocol type
                writer.u8(6);
                writer.u8(4);
                writer.u16(static_cast<uint16_t>(operation));
                writer.mac(sender_mac);
                writer.ip(sender_ip);
                writer.mac(target_mac);
                writer.ip(target_ip);
                return buffer;
            }

            size_t payloadWireSize(const IPv4Payload &payload)
            {
                if (const auto *icmp = std::get_if<IcmpMessage>(&payload))
                    return ICMP_HEADER_SIZE + icmp->data.size();
                if (const auto *tcp = std::get_if<TcpSegment>(&payload))
                    return TCP_HEADER_SIZE + tcp->data.size();
                if (const auto *udp = std::get_if<UdpDatagram>(&payload))
                    return UDP_HEADER_SIZE + udp->data.size();
                if (const auto *ospf = std::get_if<OspfPacket>(&payload))
                    return ospf->serialize().size();
                if (const auto *raw = std::get_if<RawPayload>(&payload))
                    return raw->data.size();
                return 0;
            }

            std::vector<uint8_t> serializePayload(const IPv4Payload &payload)
            {
                if (const auto *icmp = std::get_if<IcmpMessage>(&payload))
                    return icmp->serialize();
                if (const auto *tcp = std::get_if<TcpSegment>(&payload))
                    return tcp->serialize();
                if (const auto *udp = std::get_if<UdpDatagram>(&payload))
                    return udp->serialize();
                if (const auto *ospf = std::get_if<OspfPacket>(&payload))
                    return ospf->serialize();
                if (const auto *raw = std::get_if<RawPayload>(&payload))
                    return raw->data;
                return {};
            }

            // ==================== IPv4Packet ====================

            IPv4Packet::IPv4Packet(const IPv4Header &header, IPv4Payload payload)
                : header_(header), payload_(std::make_shared<const IPv4Payload>(std::move(payload)))
            {
            }

            IPv4Packet::IPv4Packet(const IPv4Header &header, std::shared_ptr<const IPv4Payload> payload)
                : header_(header), payload_(std::move(payload))
            {
            }

            std::optional<uint16_t> IPv4Packet::sourcePort() const
            {
                if (const auto *tcp = payloadAs<TcpSegment>())
                    return tcp->source_port;
                if (const auto *udp = payloadAs<UdpDatagram>())
                    return udp->source_port;
                if (const auto *icmp = payloadAs<IcmpMessage>())
                {
                    if (icmp->type == IcmpType::ECHO_REQUEST || icmp->type == IcmpType::ECHO_REPLY)
                        return icmp->identifier;
                }
                return std::nullopt;
            }

            std::optional<uint16_t> IPv4Packet::destinationPort() const
            {
                if (const auto *tcp = payloadAs<TcpSegment>())
                    return tcp->destination_port;
                if (const auto *udp = payloadAs<UdpDatagram>())
                    return udp->destination_port;
                if (const auto *icmp = payloadAs<IcmpMessage>())
                {
                    if (icmp->type == IcmpType::ECHO_REQUEST || icmp->type == IcmpType::ECHO_REPLY)
                        return icmp->identifier;
                }
                return std::nullopt;
            }

            IPv4Packet IPv4Packet::withTTL(uint8_t ttl) const
            {
                IPv4Header header = header_;
                header.ttl = ttl;
                return IPv4Packet(header, payload_);
            }

            IPv4Packet IPv4Packet::withSourceAddress(const Common::IPv4Address &address) const
            {
                IPv4Header header = header_;
                header.source = address;
                return IPv4Packet(header, payload_);
            }

            IPv4Packet IPv4Packet::withDestinationAddress(const Common::IPv4Address &address) const
            {
                IPv4Header header = header_;
                header.destination = address;
                return IPv4Packet(header, payload_);
            }

            IPv4Packet IPv4Packet::withPayload(IPv4Payload payload) const
            {
                return IPv4Packet(header_, std::move(payload));
            }

            IPv4Packet IPv4Packet::withHeader(const IPv4Header &header) const
            {
                return IPv4Packet(header, payload_);
            }

            IPv4Packet IPv4Packet::withChecksum() const
            {
                return withChecksum(computeChecksum(*this));
            }

            IPv4Packet IPv4Packet::withChecksum(uint16_t checksum) const
            {
                IPv4Header header = header_;
                header.checksum = checksum;
                return IPv4Packet(header, payload_);
            }

            std::array<uint8_t, IPV4_HEADER_SIZE> IPv4Packet::headerBytes() const
            {
                std::vector<uint8_t> buffer;
                buffer.reserve(IPV4_HEADER_SIZE);
                ByteWriter writer(buffer);

                writer.u8(static_cast<uint8_t>((header_.version << 4) | (header_.ihl & 0x0F)));
                writer.u8(header_.tos);
                writer.u16(header_.total_length);
                writer.u16(header_.identification);
                writer.u16(static_cast<uint16_t>(((header_.flags & 0x07) << 13) | (header_.fragment_offset & 0x1FFF)));
                writer.u8(header_.ttl);
                writer.u8(header_.protocol);
                writer.u16(header_.checksum);
                writer.ip(header_.source);
                writer.ip(header_.destination);

                std::array<uint8_t, IPV4_HEADER_SIZE> bytes{};
                std::copy(buffer.begin(), buffer.end(), bytes.begin());
                return bytes;
            }

            std::vector<uint8_t> IPv4Packet::serialize() const
            {
                auto header = headerBytes();
                std::vector<uint8_t> buffer(header.begin(), header.end());
                std::vector<uint8_t> body = serializePayload(*payload_);
                buffer.insert(buffer.end(), body.begin(), body.end());
                return buffer;
            }

            // ==================== Checksum ====================

            uint16_t computeChecksum(const IPv4Packet &packet)
            {
                auto bytes = packet.withChecksum(0).headerBytes();
                return Common::NetworkUtils::internetChecksum(bytes.data(), bytes.size());
            }

            bool verifyChecksum(const IPv4Packet &packet)
            {
                return computeChecksum(packet) == packet.checksum();
            }

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim
