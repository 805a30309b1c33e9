// src/core/acl/acl_types.hpp
#ifndef NETSIM_ACL_TYPES_HPP
#define NETSIM_ACL_TYPES_HPP

#include "../../common/address.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Acl
        {
            enum class AclAction
            {
                PERMIT,
                DENY
            };

            enum class AclType
            {
                STANDARD,
                EXTENDED
            };

            enum class Direction
            {
                IN,
                OUT
            };

            enum class PortOperator
            {
                EQ,
                NEQ,
                LT,
                GT,
                RANGE
            };

            /**
             * @brief Điều kiện port: eq/neq/lt/gt một giá trị, hoặc range [start, end]
             */
            struct PortMatch
            {
                PortOperator op = PortOperator::EQ;
                uint16_t start = 0;
                uint16_t end = 0;   // chỉ dùng cho RANGE

                bool matches(uint16_t port) const
                {
                    switch (op)
                    {
                    case PortOperator::EQ:
                        return port == start;
                    case PortOperator::NEQ:
                        return port != start;
                    case PortOperator::LT:
                        return port < start;
                    case PortOperator::GT:
                        return port > start;
                    case PortOperator::RANGE:
                        return port >= start && port <= end;
                    }
                    return false;
                }
            };

            /**
             * @brief Một dòng ACL
             *
             * Standard chỉ dùng source/source_wildcard. protocol = 0 nghĩa là "ip" (mọi protocol).
             */
            struct AclEntry
            {
                uint32_t sequence = 0;   // 0 = tự cấp khi thêm
                AclAction action = AclAction::PERMIT;

                Common::IPv4Address source;
                Common::WildcardMask source_wildcard = Common::WildcardMask::any();

                uint8_t protocol = 0;
                Common::IPv4Address destination;
                Common::WildcardMask destination_wildcard = Common::WildcardMask::any();
                std::optional<PortMatch> source_port;
                std::optional<PortMatch> destination_port;

                bool established = false;
                bool log = false;
                std::string remark;

                uint64_t hit_count = 0;
            };

            struct AccessList
            {
                std::string id;          // số ("10", "101") hoặc tên
                AclType type = AclType::STANDARD;
                bool named = false;
                std::vector<AclEntry> entries;   // luôn tăng dần theo sequence
            };

            /**
             * @brief Các trường của packet mà ACL so khớp. Trường vắng mặt không được so.
             */
            struct AclQuery
            {
                Common::IPv4Address source;
                std::optional<Common::IPv4Address> destination;
                std::optional<uint8_t> protocol;
                std::optional<uint16_t> source_port;
                std::optional<uint16_t> destination_port;
                std::optional<uint8_t> tcp_flags;
            };

            struct AclStatistics
            {
                size_t acl_count = 0;
                size_t entry_count = 0;
                size_t binding_count = 0;
                uint64_t total_hits = 0;
                uint64_t permits = 0;
                uint64_t denies = 0;
                uint64_t implicit_denies = 0;
            };

            inline std::string aclActionToString(AclAction action)
            {
                return action == AclAction::PERMIT ? "permit" : "deny";
            }

            inline std::string directionToString(Direction direction)
            {
                return direction == Direction::IN ? "in" : "out";
            }

        } // namespace Acl
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ACL_TYPES_HPP
