// src/core/packet/ospf_packet.cpp
#include "ospf_packet.hpp"
#include "byte_writer.hpp"
#include "../../common/network_utils.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            namespace
            {
                constexpr size_t LSA_CHECKSUM_OFFSET = 16;

                void writeLsaHeader(ByteWriter &writer, const LsaHeader &header)
                {
                    writer.u16(header.ls_age);
                    writer.u8(header.options);
                    writer.u8(static_cast<uint8_t>(header.ls_type));
                    writer.ip(header.link_state_id);
                    writer.ip(header.advertising_router);
                    writer.u32(header.sequence_number);
                    writer.u16(header.checksum);
                    writer.u16(header.length);
                }

                /**
                 * @brief Fletcher (ISO 8473) trên buffer, trường checksum tại checksum_offset
                 */
                uint16_t fletcherChecksum(std::vector<uint8_t> buffer, size_t checksum_offset)
                {
                    buffer[checksum_offset] = 0;
                    buffer[checksum_offset + 1] = 0;

                    int64_t c0 = 0;
                    int64_t c1 = 0;
                    for (uint8_t byte : buffer)
                    {
                        c0 = (c0 + byte) % 255;
                        c1 = (c1 + c0) % 255;
                    }

                    int64_t length = static_cast<int64_t>(buffer.size());
                    int64_t x = ((length - static_cast<int64_t>(checksum_offset) - 1) * c0 - c1) % 255;
                    if (x <= 0)
                        x += 255;
                    int64_t y = 510 - c0 - x;
                    if (y > 255)
                        y -= 255;

                    return static_cast<uint16_t>((x << 8) | (y & 0xFF));
                }
            }

            std::string LsaKey::toString() const
            {
                return "type" + std::to_string(static_cast<int>(type)) + " " + link_state_id.toString() +
                       " adv " + advertising_router.toString();
            }

            // ==================== LSA ====================

            std::vector<uint8_t> Lsa::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);
                writeLsaHeader(writer, header);

                if (const auto *router = std::get_if<RouterLsaBody>(&body))
                {
                    writer.u8(router->flags);
                    writer.u8(0);
                    writer.u16(static_cast<uint16_t>(router->links.size()));
                    for (const auto &link : router->links)
                    {
                        writer.ip(link.link_id);
                        writer.ip(link.link_data);
                        writer.u8(static_cast<uint8_t>(link.type));
                        writer.u8(0); // # TOS
                        writer.u16(link.metric);
                    }
                }
                else if (const auto *network = std::get_if<NetworkLsaBody>(&body))
                {
                    writer.u32(network->network_mask.toUint32());
                    for (const auto &router_id : network->attached_routers)
                    {
                        writer.ip(router_id);
                    }
                }

                // Length thực tế thay cho giá trị trong header
                writer.patch16(18, static_cast<uint16_t>(buffer.size()));
                return buffer;
            }

            uint16_t computeLsaChecksum(const Lsa &lsa)
            {
                std::vector<uint8_t> bytes = lsa.serialize();
                // Bỏ 2 byte LS age
                std::vector<uint8_t> covered(bytes.begin() + 2, bytes.end());
                return fletcherChecksum(covered, LSA_CHECKSUM_OFFSET - 2);
            }

            bool verifyLsaChecksum(const Lsa &lsa)
            {
                std::vector<uint8_t> bytes = lsa.serialize();
                int64_t c0 = 0;
                int64_t c1 = 0;
                for (size_t i = 2; i < bytes.size(); ++i)
                {
                    c0 = (c0 + bytes[i]) % 255;
                    c1 = (c1 + c0) % 255;
                }
                return lsa.header.checksum != 0 && c0 == 0 && c1 == 0;
            }

            Lsa finalizeLsa(const Lsa &lsa)
            {
                Lsa result = lsa;
                result.header.length = static_cast<uint16_t>(result.serialize().size());
                result.header.checksum = computeLsaChecksum(result);
                return result;
            }

            // ==================== OspfPacket ====================

            OspfPacketType OspfPacket::type() const
            {
                return static_cast<OspfPacketType>(body.index() + 1);
            }

            std::vector<uint8_t> OspfPacket::serialize() const
            {
                std::vector<uint8_t> buffer;
                ByteWriter writer(buffer);

                writer.u8(version);
                writer.u8(static_cast<uint8_t>(type()));
                writer.u16(0); // length, patch sau
                writer.ip(router_id);
                writer.ip(area_id);
                writer.u16(0); // checksum
                writer.u16(0); // AuType: null authentication
                writer.u32(0);
                writer.u32(0);

                if (const auto *hello = as<OspfHello>())
                {
                    writer.u32(hello->network_mask.toUint32());
                    writer.u16(hello->hello_interval);
                    writer.u8(hello->options);
                    writer.u8(hello->router_priority);
                    writer.u32(hello->router_dead_interval);
                    writer.ip(hello->designated_router);
                    writer.ip(hello->backup_designated_router);
                    for (const auto &neighbor : hello->neighbors)
                    {
                        writer.ip(neighbor);
                    }
                }
                else if (const auto *dd = as<OspfDatabaseDescription>())
                {
                    writer.u16(dd->interface_mtu);
                    writer.u8(dd->options);
                    writer.u8(dd->flags);
                    writer.u32(dd->sequence_number);
                    for (const auto &header : dd->lsa_headers)
                    {
                        writeLsaHeader(writer, header);
                    }
                }
                else if (const auto *lsr = as<OspfLinkStateRequest>())
                {
                    for (const auto &request : lsr->requests)
                    {
                        writer.u32(static_cast<uint32_t>(request.type));
                        writer.ip(request.link_state_id);
                        writer.ip(request.advertising_router);
                    }
                }
                else if (const auto *lsu = as<OspfLinkStateUpdate>())
                {
                    writer.u32(static_cast<uint32_t>(lsu->lsas.size()));
                    for (const auto &lsa : lsu->lsas)
                    {
                        writer.bytes(lsa.serialize());
                    }
                }
                else if (const auto *ack = as<OspfLinkStateAck>())
                {
                    for (const auto &header : ack->lsa_headers)
                    {
                        writeLsaHeader(writer, header);
                    }
                }

                writer.patch16(2, static_cast<uint16_t>(buffer.size()));
                writer.patch16(12, Common::NetworkUtils::internetChecksum(buffer.data(), buffer.size()));
                return buffer;
            }

            std::string ospfPacketTypeToString(OspfPacketType type)
            {
                switch (type)
                {
                case OspfPacketType::HELLO:
                    return "Hello";
                case OspfPacketType::DATABASE_DESCRIPTION:
                    return "DD";
                case OspfPacketType::LINK_STATE_REQUEST:
                    return "LSR";
                case OspfPacketType::LINK_STATE_UPDATE:
                    return "LSU";
                case OspfPacketType::LINK_STATE_ACK:
                    return "LSAck";
                }
                return "Unknown";
            }

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim
