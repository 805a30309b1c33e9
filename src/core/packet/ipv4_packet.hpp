// src/core/packet/ipv4_packet.hpp
#ifndef NETSIM_IPV4_PACKET_HPP
#define NETSIM_IPV4_PACKET_HPP

#include "packet_types.hpp"
#include "ospf_packet.hpp"
#include <array>
#include <memory>
#include <optional>
#include <variant>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            using IPv4Payload = std::variant<std::monostate, IcmpMessage, TcpSegment, UdpDatagram, OspfPacket, RawPayload>;

            /**
             * @brief IPv4 header 20 byte (không có options)
             */
            struct IPv4Header
            {
                uint8_t version = 4;
                uint8_t ihl = 5;                // đơn vị 32-bit word
                uint8_t tos = 0;                // DSCP(6) + ECN(2)
                uint16_t total_length = IPV4_HEADER_SIZE;
                uint16_t identification = 0;
                uint8_t flags = 0;              // 3 bit: reserved, DF, MF
                uint16_t fragment_offset = 0;   // 13 bit
                uint8_t ttl = 64;
                uint8_t protocol = 0;
                uint16_t checksum = 0;
                Common::IPv4Address source;
                Common::IPv4Address destination;
            };

            /**
             * @brief IPv4 packet bất biến
             *
             * Mọi thay đổi header (TTL, NAT) tạo một giá trị mới qua các hàm with*().
             * Các hàm with*() KHÔNG tính lại checksum, trừ withChecksum() không tham số.
             * Payload được chia sẻ giữa các bản sao.
             */
            class IPv4Packet
            {
            public:
                IPv4Packet(const IPv4Header &header, IPv4Payload payload);

                const IPv4Header &header() const { return header_; }
                const IPv4Payload &payload() const { return *payload_; }

                uint8_t ttl() const { return header_.ttl; }
                uint8_t protocol() const { return header_.protocol; }
                uint16_t checksum() const { return header_.checksum; }
                uint16_t totalLength() const { return header_.total_length; }
                const Common::IPv4Address &source() const { return header_.source; }
                const Common::IPv4Address &destination() const { return header_.destination; }

                template <typename T>
                const T *payloadAs() const { return std::get_if<T>(payload_.get()); }

                /**
                 * @brief Port nguồn/đích của TCP/UDP, hoặc echo identifier của ICMP echo
                 */
                std::optional<uint16_t> sourcePort() const;
                std::optional<uint16_t> destinationPort() const;

                // ==================== Transforms ====================
                IPv4Packet withTTL(uint8_t ttl) const;
                IPv4Packet withSourceAddress(const Common::IPv4Address &address) const;
                IPv4Packet withDestinationAddress(const Common::IPv4Address &address) const;
                IPv4Packet withPayload(IPv4Payload payload) const;
                IPv4Packet withHeader(const IPv4Header &header) const;

                /**
                 * @brief Bản sao với checksum được tính lại trên header hiện tại
                 */
                IPv4Packet withChecksum() const;

                /**
                 * @brief Bản sao với checksum cho trước
                 */
                IPv4Packet withChecksum(uint16_t checksum) const;

                // ==================== Wire format ====================
                /**
                 * @brief 20 byte header big-endian (checksum hiện tại)
                 */
                std::array<uint8_t, IPV4_HEADER_SIZE> headerBytes() const;

                std::vector<uint8_t> serialize() const;

            private:
                IPv4Header header_;
                std::shared_ptr<const IPv4Payload> payload_;

                IPv4Packet(const IPv4Header &header, std::shared_ptr<const IPv4Payload> payload);
            };

            /**
             * @brief One's-complement của tổng one's-complement các word 16-bit trên header,
             *        với trường checksum coi như 0
             */
            uint16_t computeChecksum(const IPv4Packet &packet);

            /**
             * @brief true khi checksum trong header khớp với giá trị tính lại
             */
            bool verifyChecksum(const IPv4Packet &packet);

            /**
             * @brief Kích thước payload trên dây (ICMP 8+data, TCP 20+data, UDP 8+data, ...)
             */
            size_t payloadWireSize(const IPv4Payload &payload);

            std::vector<uint8_t> serializePayload(const IPv4Payload &payload);

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_IPV4_PACKET_HPP
