// src/core/nat/nat_types.hpp
#ifndef NETSIM_NAT_TYPES_HPP
#define NETSIM_NAT_TYPES_HPP

#include "../packet/ipv4_packet.hpp"
#include <optional>
#include <string>
#include <tuple>

namespace NetSim
{
    namespace Core
    {
        namespace Nat
        {
            enum class NatType
            {
                STATIC,
                DYNAMIC,
                PAT
            };

            inline std::string natTypeToString(NatType type)
            {
                switch (type)
                {
                case NatType::STATIC:
                    return "static";
                case NatType::DYNAMIC:
                    return "dynamic";
                case NatType::PAT:
                    return "pat";
                }
                return "unknown";
            }

            struct NatPool
            {
                std::string name;
                Common::IPv4Address start;
                Common::IPv4Address end;
                Common::SubnetMask netmask;

                uint32_t size() const { return end.toUint32() - start.toUint32() + 1; }
                bool contains(const Common::IPv4Address &ip) const
                {
                    return ip.toUint32() >= start.toUint32() && ip.toUint32() <= end.toUint32();
                }
            };

            /**
             * @brief "ip nat inside source list <acl> {pool <name> | interface <if>} [overload]"
             */
            struct NatBinding
            {
                std::string acl_id;
                std::optional<std::string> pool;
                std::optional<std::string> interface_name;
                bool overload = false;
            };

            struct NatTranslation
            {
                NatType type = NatType::STATIC;
                uint8_t protocol = 0;                           // 0 cho static/dynamic
                Common::IPv4Address inside_local;
                Common::IPv4Address inside_global;
                std::optional<uint16_t> inside_local_port;      // PAT only
                std::optional<uint16_t> inside_global_port;     // PAT only
                std::optional<Common::IPv4Address> outside_address;
                uint64_t created_ms = 0;
                uint64_t last_used_ms = 0;
                uint64_t hits = 0;
                uint64_t timeout_ms = 0;                        // 0 = không hết hạn

                bool isExpired(uint64_t now_ms) const
                {
                    return type != NatType::STATIC && timeout_ms > 0 && now_ms >= last_used_ms &&
                           now_ms - last_used_ms >= timeout_ms;
                }
            };

            /**
             * @brief Khóa PAT: (inside local, inside local port, protocol)
             */
            struct PatKey
            {
                Common::IPv4Address inside_local;
                uint16_t port = 0;
                uint8_t protocol = 0;

                bool operator<(const PatKey &other) const
                {
                    return std::make_tuple(inside_local.toUint32(), port, protocol) <
                           std::make_tuple(other.inside_local.toUint32(), other.port, other.protocol);
                }
            };

            enum class NatResult
            {
                TRANSLATED,
                NOT_APPLICABLE,   // forward nguyên bản
                MISS              // hết tài nguyên, drop
            };

            struct NatOutcome
            {
                NatResult result = NatResult::NOT_APPLICABLE;
                std::optional<Packet::IPv4Packet> packet;   // có khi TRANSLATED

                bool translated() const { return result == NatResult::TRANSLATED; }
            };

            struct NatStatistics
            {
                uint64_t hits = 0;
                uint64_t misses = 0;
                uint64_t expired = 0;
                size_t static_translations = 0;
                size_t dynamic_translations = 0;
                size_t pat_translations = 0;
                size_t inside_interfaces = 0;
                size_t outside_interfaces = 0;
            };

        } // namespace Nat
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_NAT_TYPES_HPP
