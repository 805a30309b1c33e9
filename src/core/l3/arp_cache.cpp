// src/core/l3/arp_cache.cpp
#include "arp_cache.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            ArpCache::ArpCache(uint64_t timeout_ms)
                : timeout_ms_(timeout_ms)
            {
            }

            void ArpCache::insert(const Common::IPv4Address &ip, const Common::MacAddress &mac,
                                  const std::string &interface_name, uint64_t now_ms)
            {
                entries_[ip] = ArpEntry{ip, mac, interface_name, now_ms};
            }

            std::optional<Common::MacAddress> ArpCache::lookup(const Common::IPv4Address &ip, uint64_t now_ms) const
            {
                auto it = entries_.find(ip);
                if (it == entries_.end())
                {
                    return std::nullopt;
                }
                if (timeout_ms_ > 0 && now_ms >= it->second.updated_ms && now_ms - it->second.updated_ms >= timeout_ms_)
                {
                    return std::nullopt;
                }
                return it->second.mac;
            }

            bool ArpCache::enqueue(const Common::IPv4Address &next_hop, const std::string &interface_name,
                                   const Packet::IPv4Packet &packet)
            {
                auto &queue = pending_[next_hop];
                bool first = queue.empty();

                if (queue.size() >= MAX_PENDING_PER_HOP)
                {
                    queue.pop_front();
                }
                queue.push_back(PendingPacket{interface_name, packet});
                return first;
            }

            std::vector<PendingPacket> ArpCache::takePending(const Common::IPv4Address &next_hop)
            {
                std::vector<PendingPacket> result;
                auto it = pending_.find(next_hop);
                if (it == pending_.end())
                {
                    return result;
                }

                result.assign(it->second.begin(), it->second.end());
                pending_.erase(it);
                return result;
            }

            size_t ArpCache::removeInterface(const std::string &interface_name)
            {
                size_t removed = 0;
                for (auto it = entries_.begin(); it != entries_.end();)
                {
                    if (it->second.interface_name == interface_name)
                    {
                        it = entries_.erase(it);
                        ++removed;
                    }
                    else
                    {
                        ++it;
                    }
                }

                for (auto it = pending_.begin(); it != pending_.end();)
                {
                    auto &queue = it->second;
                    for (auto packet = queue.begin(); packet != queue.end();)
                    {
                        packet = packet->interface_name == interface_name ? queue.erase(packet) : std::next(packet);
                    }
                    it = queue.empty() ? pending_.erase(it) : std::next(it);
                }
                return removed;
            }

            void ArpCache::clear()
            {
                entries_.clear();
                pending_.clear();
            }

            std::vector<ArpEntry> ArpCache::getEntries() const
            {
                std::vector<ArpEntry> result;
                result.reserve(entries_.size());
                for (const auto &pair : entries_)
                {
                    result.push_back(pair.second);
                }
                return result;
            }

            size_t ArpCache::pendingCount() const
            {
                size_t count = 0;
                for (const auto &pair : pending_)
                {
                    count += pair.second.size();
                }
                return count;
            }

        } // namespace L3
    }     // namespace Core
} // namespace NetSim
