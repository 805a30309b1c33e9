// src/core/ospf/ospf_types.hpp
#ifndef NETSIM_OSPF_TYPES_HPP
#define NETSIM_OSPF_TYPES_HPP

#include "../packet/ospf_packet.hpp"
#include "../sim/timer_scheduler.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            // ==================== Architectural constants (RFC 2328 Appendix B) ====================
            namespace OspfConstants
            {
                constexpr uint16_t HELLO_INTERVAL = 10;
                constexpr uint32_t ROUTER_DEAD_INTERVAL = 40;
                constexpr uint16_t RXMT_INTERVAL = 5;
                constexpr uint16_t INF_TRANS_DELAY = 1;
                constexpr uint16_t MAX_AGE = 3600;
                constexpr uint16_t MAX_AGE_DIFF = 900;
                constexpr uint16_t LS_REFRESH_TIME = 1800;
                constexpr uint32_t INITIAL_SEQUENCE_NUMBER = 0x80000001;
                constexpr uint32_t MAX_SEQUENCE_NUMBER = 0x7FFFFFFF;
                constexpr uint16_t DEFAULT_COST = 10;
                constexpr uint8_t DEFAULT_PRIORITY = 1;
                constexpr int ADMINISTRATIVE_DISTANCE = 110;
                constexpr size_t DD_MAX_HEADERS = 50;   // header mỗi DD packet
                constexpr uint32_t ALL_SPF_ROUTERS = 0xE0000005;   // 224.0.0.5
                constexpr uint32_t ALL_D_ROUTERS = 0xE0000006;     // 224.0.0.6
            }

            enum class NeighborState
            {
                DOWN,
                ATTEMPT,
                INIT,
                TWO_WAY,
                EX_START,
                EXCHANGE,
                LOADING,
                FULL
            };

            enum class NeighborEvent
            {
                HELLO_RECEIVED,
                START,
                TWO_WAY_RECEIVED,
                NEGOTIATION_DONE,
                EXCHANGE_DONE,
                BAD_LS_REQ,
                LOADING_DONE,
                ADJ_OK,
                SEQ_NUMBER_MISMATCH,
                ONE_WAY,
                KILL_NBR,
                INACTIVITY_TIMER,
                LL_DOWN
            };

            enum class InterfaceState
            {
                DOWN,
                LOOPBACK,
                WAITING,
                POINT_TO_POINT,
                DR_OTHER,
                BACKUP,
                DR
            };

            enum class NetworkType
            {
                BROADCAST,
                POINT_TO_POINT,
                NBMA,
                POINT_TO_MULTIPOINT
            };

            std::string neighborStateToString(NeighborState state);
            std::string neighborEventToString(NeighborEvent event);
            std::string interfaceStateToString(InterfaceState state);
            std::string networkTypeToString(NetworkType type);

            /**
             * @brief Tham số "ip ospf ..." của một interface
             */
            struct InterfaceOptions
            {
                NetworkType network_type = NetworkType::BROADCAST;
                uint8_t priority = OspfConstants::DEFAULT_PRIORITY;
                uint16_t cost = OspfConstants::DEFAULT_COST;
                uint16_t hello_interval = OspfConstants::HELLO_INTERVAL;
                uint32_t dead_interval = OspfConstants::ROUTER_DEAD_INTERVAL;
                uint16_t retransmit_interval = OspfConstants::RXMT_INTERVAL;
                uint16_t transmit_delay = OspfConstants::INF_TRANS_DELAY;
                bool passive = false;
                bool loopback = false;
            };

            /**
             * @brief Neighbor data structure (RFC 2328 §10)
             */
            struct OspfNeighbor
            {
                Common::IPv4Address router_id;
                Common::IPv4Address ip_address;
                std::string interface_name;
                NeighborState state = NeighborState::DOWN;
                uint8_t priority = OspfConstants::DEFAULT_PRIORITY;
                Common::IPv4Address designated_router;          // DR do neighbor khai báo (IP)
                Common::IPv4Address backup_designated_router;

                bool is_master = false;                          // true khi router này là master
                uint32_t dd_sequence = 0;
                bool more_to_send = false;                       // M bit trong DD gần nhất đã gửi
                std::optional<Packet::OspfDatabaseDescription> last_sent_dd;
                std::optional<Packet::OspfDatabaseDescription> last_received_dd;

                std::map<Packet::LsaKey, Packet::LsaHeader> request_list;
                std::map<Packet::LsaKey, Packet::Lsa> retransmission_list;
                std::deque<Packet::LsaHeader> summary_list;

                bool configured = false;                         // NBMA neighbor cấu hình tĩnh
                uint64_t last_hello_ms = 0;

                Sim::TimerId inactivity_timer = Sim::INVALID_TIMER;
                Sim::TimerId dd_retransmit_timer = Sim::INVALID_TIMER;
                Sim::TimerId lsu_retransmit_timer = Sim::INVALID_TIMER;
            };

            /**
             * @brief Interface data structure (RFC 2328 §9)
             */
            struct OspfInterface
            {
                std::string name;
                Common::IPv4Address ip_address;
                Common::SubnetMask mask;
                Common::IPv4Address area_id;
                InterfaceOptions options;
                InterfaceState state = InterfaceState::DOWN;
                Common::IPv4Address designated_router;           // IP interface của DR
                Common::IPv4Address backup_designated_router;

                std::map<Common::IPv4Address, OspfNeighbor> neighbors;   // key: router ID

                Sim::TimerId hello_timer = Sim::INVALID_TIMER;
                Sim::TimerId wait_timer = Sim::INVALID_TIMER;

                bool isMultiAccess() const
                {
                    return options.network_type == NetworkType::BROADCAST || options.network_type == NetworkType::NBMA;
                }
            };

            /**
             * @brief "network A.B.C.D wildcard area X"
             */
            struct NetworkStatement
            {
                Common::IPv4Address network;
                Common::WildcardMask wildcard;
                Common::IPv4Address area_id;
            };

            struct OspfStatistics
            {
                uint64_t hellos_sent = 0;
                uint64_t hellos_received = 0;
                uint64_t hello_mismatches = 0;
                uint64_t dd_sent = 0;
                uint64_t dd_received = 0;
                uint64_t lsr_sent = 0;
                uint64_t lsr_received = 0;
                uint64_t lsu_sent = 0;
                uint64_t lsu_received = 0;
                uint64_t acks_sent = 0;
                uint64_t acks_received = 0;
                uint64_t retransmissions = 0;
                uint64_t bad_lsa_checksums = 0;
                uint64_t spf_runs = 0;
            };

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_OSPF_TYPES_HPP
