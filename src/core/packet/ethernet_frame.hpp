// src/core/packet/ethernet_frame.hpp
#ifndef NETSIM_ETHERNET_FRAME_HPP
#define NETSIM_ETHERNET_FRAME_HPP

#include "ipv4_packet.hpp"
#include <optional>
#include <variant>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            using FramePayload = std::variant<IPv4Packet, ArpPacket, RawPayload>;

            /**
             * @brief Ethernet II frame, bất biến
             *
             * Được tạo tại interface phát và tiêu thụ tại interface nhận.
             */
            class EthernetFrame
            {
            public:
                EthernetFrame(const Common::MacAddress &destination,
                              const Common::MacAddress &source,
                              uint16_t ether_type,
                              FramePayload payload,
                              std::optional<VlanTag> vlan_tag = std::nullopt);

                const Common::MacAddress &destination() const { return destination_; }
                const Common::MacAddress &source() const { return source_; }
                uint16_t etherType() const { return ether_type_; }
                const std::optional<VlanTag> &vlanTag() const { return vlan_tag_; }
                const FramePayload &payload() const { return payload_; }

                const IPv4Packet *ipv4() const { return std::get_if<IPv4Packet>(&payload_); }
                const ArpPacket *arp() const { return std::get_if<ArpPacket>(&payload_); }

                EthernetFrame withVlanTag(const VlanTag &tag) const;
                EthernetFrame withoutVlanTag() const;

                /**
                 * @brief Bytes trên dây (không có FCS), tag 802.1Q nếu có
                 */
                std::vector<uint8_t> serialize() const;

                size_t wireSize() const;

            private:
                Common::MacAddress destination_;
                Common::MacAddress source_;
                uint16_t ether_type_;
                FramePayload payload_;
                std::optional<VlanTag> vlan_tag_;
            };

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ETHERNET_FRAME_HPP
