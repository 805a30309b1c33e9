// src/core/packet/ethernet_frame.cpp
#include "ethernet_frame.hpp"
#include "byte_writer.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            EthernetFrame::EthernetFrame(const Common::MacAddress &destination,
                                         const Common::MacAddress &source,
                                         uint16_t ether_type,
                                         FramePayload payload,
                                         std::optional<VlanTag> vlan_tag)
                : destination_(destination),
                  source_(source),
                  ether_type_(ether_type),
                  payload_(std::move(payload)),
                  vlan_tag_(vlan_tag)
            {
            }

            EthernetFrame EthernetFrame::withVlanTag(const VlanTag &tag) const
            {
                return EthernetFrame(destination_, source_, ether_type_, payload_, tag);
            }

            EthernetFrame EthernetFrame::withoutVlanTag() const
            {
                return EthernetFrame(destination_, source_, ether_type_, payload_, std::nullopt);
            }

            std::vector<uint8_t> EthernetFrame::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);

                writer.mac(destination_);
                writer.mac(source_);

                if (vlan_tag_)
                {
                    writer.u16(vlan_tag_->tpid);
                    uint16_t tci = static_cast<uint16_t>(((vlan_tag_->pcp & 0x07) << 13) |
                                                         ((vlan_tag_->dei ? 1 : 0) << 12) |
                                                         (vlan_tag_->vid & 0x0FFF));
                    writer.u16(tci);
                }
                writer.u16(ether_type_);

                if (const auto *ip = ipv4())
                {
                    writer.bytes(ip->serialize());
                }
                else if (const auto *arp_packet = arp())
                {
                    writer.bytes(arp_packet->serialize());
                }
                else if (const auto *raw = std::get_if<RawPayload>(&payload_))
                {
                    writer.bytes(raw->data);
                }

                return buffer;
            }

            size_t EthernetFrame::wireSize() const
            {
                return serialize().size();
            }

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim
