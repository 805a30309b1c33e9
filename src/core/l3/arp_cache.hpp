// src/core/l3/arp_cache.hpp
#ifndef NETSIM_ARP_CACHE_HPP
#define NETSIM_ARP_CACHE_HPP

#include "../packet/ipv4_packet.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            struct ArpEntry
            {
                Common::IPv4Address ip;
                Common::MacAddress mac;
                std::string interface_name;
                uint64_t updated_ms = 0;
            };

            /**
             * @brief Packet chờ phân giải ARP cho next hop
             */
            struct PendingPacket
            {
                std::string interface_name;
                Packet::IPv4Packet packet;
            };

            /**
             * @brief ARP cache + hàng đợi packet chờ theo next hop
             */
            class ArpCache
            {
            public:
                static constexpr size_t MAX_PENDING_PER_HOP = 16;

                explicit ArpCache(uint64_t timeout_ms);

                void insert(const Common::IPv4Address &ip, const Common::MacAddress &mac,
                            const std::string &interface_name, uint64_t now_ms);

                std::optional<Common::MacAddress> lookup(const Common::IPv4Address &ip, uint64_t now_ms) const;

                /**
                 * @brief Xếp packet chờ next hop
                 * @return true nếu đây là packet đầu tiên (cần gửi ARP request)
                 */
                bool enqueue(const Common::IPv4Address &next_hop, const std::string &interface_name,
                             const Packet::IPv4Packet &packet);

                /**
                 * @brief Lấy ra và xóa các packet chờ next hop
                 */
                std::vector<PendingPacket> takePending(const Common::IPv4Address &next_hop);

                size_t removeInterface(const std::string &interface_name);
                void clear();

                std::vector<ArpEntry> getEntries() const;
                size_t pendingCount() const;
                size_t size() const { return entries_.size(); }

            private:
                uint64_t timeout_ms_;
                std::map<Common::IPv4Address, ArpEntry> entries_;
                std::map<Common::IPv4Address, std::deque<PendingPacket>> pending_;
            };

        } // namespace L3
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ARP_CACHE_HPP
