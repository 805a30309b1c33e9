// src/core/packet/ospf_packet.hpp
#ifndef NETSIM_OSPF_PACKET_HPP
#define NETSIM_OSPF_PACKET_HPP

#include "../../common/address.hpp"
#include <cstdint>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            // ==================== OSPFv2 wire format (RFC 2328 Appendix A) ====================

            constexpr size_t OSPF_HEADER_SIZE = 24;
            constexpr size_t LSA_HEADER_SIZE = 20;

            enum class OspfPacketType : uint8_t
            {
                HELLO = 1,
                DATABASE_DESCRIPTION = 2,
                LINK_STATE_REQUEST = 3,
                LINK_STATE_UPDATE = 4,
                LINK_STATE_ACK = 5
            };

            enum class LsaType : uint8_t
            {
                ROUTER = 1,
                NETWORK = 2,
                SUMMARY_NETWORK = 3,
                SUMMARY_ASBR = 4,
                AS_EXTERNAL = 5
            };

            namespace DDFlags
            {
                constexpr uint8_t INIT = 0x04;
                constexpr uint8_t MORE = 0x02;
                constexpr uint8_t MASTER = 0x01;
            }

            namespace OspfOptions
            {
                constexpr uint8_t E_BIT = 0x02;
            }

            /**
             * @brief Khóa định danh một LSA (type, link-state ID, advertising router)
             */
            struct LsaKey
            {
                LsaType type = LsaType::ROUTER;
                Common::IPv4Address link_state_id;
                Common::IPv4Address advertising_router;

                bool operator==(const LsaKey &other) const
                {
                    return type == other.type && link_state_id == other.link_state_id &&
                           advertising_router == other.advertising_router;
                }

                bool operator<(const LsaKey &other) const
                {
                    return std::make_tuple(static_cast<uint8_t>(type), link_state_id.toUint32(), advertising_router.toUint32()) <
                           std::make_tuple(static_cast<uint8_t>(other.type), other.link_state_id.toUint32(), other.advertising_router.toUint32());
                }

                std::string toString() const;
            };

            struct LsaHeader
            {
                uint16_t ls_age = 0;
                uint8_t options = OspfOptions::E_BIT;
                LsaType ls_type = LsaType::ROUTER;
                Common::IPv4Address link_state_id;
                Common::IPv4Address advertising_router;
                uint32_t sequence_number = 0;
                uint16_t checksum = 0;
                uint16_t length = LSA_HEADER_SIZE;

                LsaKey key() const { return LsaKey{ls_type, link_state_id, advertising_router}; }
            };

            enum class RouterLinkType : uint8_t
            {
                POINT_TO_POINT = 1,
                TRANSIT = 2,
                STUB = 3,
                VIRTUAL = 4
            };

            /**
             * @brief Một link trong Router-LSA
             *
             * link_id / link_data theo loại link:
             *  - POINT_TO_POINT: router ID láng giềng / IP interface của mình
             *  - TRANSIT: IP interface của DR / IP interface của mình
             *  - STUB: địa chỉ mạng / subnet mask
             */
            struct RouterLink
            {
                Common::IPv4Address link_id;
                Common::IPv4Address link_data;
                RouterLinkType type = RouterLinkType::STUB;
                uint16_t metric = 0;

                bool operator==(const RouterLink &other) const
                {
                    return link_id == other.link_id && link_data == other.link_data &&
                           type == other.type && metric == other.metric;
                }
            };

            struct RouterLsaBody
            {
                uint8_t flags = 0;
                std::vector<RouterLink> links;
            };

            struct NetworkLsaBody
            {
                Common::SubnetMask network_mask;
                std::vector<Common::IPv4Address> attached_routers;
            };

            struct Lsa
            {
                LsaHeader header;
                std::variant<RouterLsaBody, NetworkLsaBody> body;

                std::vector<uint8_t> serialize() const;
            };

            /**
             * @brief Tính length và Fletcher checksum (RFC 2328 §12.1.7) cho LSA
             * @return LSA mới với header.length và header.checksum đã cập nhật
             */
            Lsa finalizeLsa(const Lsa &lsa);

            /**
             * @brief Fletcher checksum trên LSA đã serialize, bỏ qua trường LS age
             */
            uint16_t computeLsaChecksum(const Lsa &lsa);

            /**
             * @brief Kiểm tra checksum Fletcher của LSA
             */
            bool verifyLsaChecksum(const Lsa &lsa);

            // ==================== Packet bodies ====================

            struct OspfHello
            {
                Common::SubnetMask network_mask;
                uint16_t hello_interval = 10;
                uint8_t options = OspfOptions::E_BIT;
                uint8_t router_priority = 1;
                uint32_t router_dead_interval = 40;
                Common::IPv4Address designated_router;
                Common::IPv4Address backup_designated_router;
                std::vector<Common::IPv4Address> neighbors;
            };

            struct OspfDatabaseDescription
            {
                uint16_t interface_mtu = 1500;
                uint8_t options = OspfOptions::E_BIT;
                uint8_t flags = 0;
                uint32_t sequence_number = 0;
                std::vector<LsaHeader> lsa_headers;

                bool hasFlag(uint8_t flag) const { return (flags & flag) != 0; }
            };

            struct OspfLinkStateRequest
            {
                std::vector<LsaKey> requests;
            };

            struct OspfLinkStateUpdate
            {
                std::vector<Lsa> lsas;
            };

            struct OspfLinkStateAck
            {
                std::vector<LsaHeader> lsa_headers;
            };

            using OspfBody = std::variant<OspfHello, OspfDatabaseDescription, OspfLinkStateRequest,
                                          OspfLinkStateUpdate, OspfLinkStateAck>;

            /**
             * @brief OSPFv2 packet (header chung + body)
             */
            struct OspfPacket
            {
                uint8_t version = 2;
                Common::IPv4Address router_id;
                Common::IPv4Address area_id;
                OspfBody body;

                OspfPacketType type() const;

                template <typename T>
                const T *as() const { return std::get_if<T>(&body); }

                /**
                 * @brief Serialize với header 24 byte, checksum RFC 1071, AuType 0
                 */
                std::vector<uint8_t> serialize() const;
            };

            std::string ospfPacketTypeToString(OspfPacketType type);

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_OSPF_PACKET_HPP
