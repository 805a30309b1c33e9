// src/core/l2/mac_table.cpp
#include "mac_table.hpp"
#include <algorithm>

namespace NetSim
{
    namespace Core
    {
        namespace L2
        {
            MacTable::MacTable(uint64_t aging_time_ms, size_t max_entries)
                : aging_time_ms_(aging_time_ms), max_entries_(max_entries)
            {
            }

            bool MacTable::learn(const Common::MacAddress &mac, const std::string &port, uint16_t vlan, uint64_t now_ms)
            {
                if (!mac.isUnicast() || mac.isZero())
                {
                    return false;
                }

                auto it = entries_.find(Key(mac, vlan));
                if (it != entries_.end())
                {
                    if (it->second.port != port)
                    {
                        stats_.moved++;
                        it->second.port = port;
                    }
                    it->second.last_seen_ms = now_ms;
                    return true;
                }

                if (max_entries_ > 0 && entries_.size() >= max_entries_)
                {
                    ageOut(now_ms);
                    if (entries_.size() >= max_entries_)
                    {
                        evictOldest();
                    }
                }

                entries_.emplace(Key(mac, vlan), MacTableEntry{mac, port, vlan, now_ms});
                stats_.learned++;
                return true;
            }

            std::optional<MacTableEntry> MacTable::lookup(const Common::MacAddress &mac, uint16_t vlan, uint64_t now_ms)
            {
                stats_.lookups++;

                auto it = entries_.find(Key(mac, vlan));
                if (it == entries_.end())
                {
                    stats_.misses++;
                    return std::nullopt;
                }

                if (isExpired(it->second, now_ms))
                {
                    entries_.erase(it);
                    stats_.aged++;
                    stats_.misses++;
                    return std::nullopt;
                }

                stats_.hits++;
                return it->second;
            }

            size_t MacTable::ageOut(uint64_t now_ms)
            {
                size_t removed = 0;
                for (auto it = entries_.begin(); it != entries_.end();)
                {
                    if (isExpired(it->second, now_ms))
                    {
                        it = entries_.erase(it);
                        ++removed;
                    }
                    else
                    {
                        ++it;
                    }
                }
                stats_.aged += removed;
                return removed;
            }

            size_t MacTable::removePort(const std::string &port)
            {
                size_t removed = 0;
                for (auto it = entries_.begin(); it != entries_.end();)
                {
                    if (it->second.port == port)
                    {
                        it = entries_.erase(it);
                        ++removed;
                    }
                    else
                    {
                        ++it;
                    }
                }
                return removed;
            }

            std::vector<MacTableEntry> MacTable::getEntries() const
            {
                std::vector<MacTableEntry> result;
                result.reserve(entries_.size());
                for (const auto &pair : entries_)
                {
                    result.push_back(pair.second);
                }
                return result;
            }

            bool MacTable::isExpired(const MacTableEntry &entry, uint64_t now_ms) const
            {
                return aging_time_ms_ > 0 && now_ms > entry.last_seen_ms &&
                       now_ms - entry.last_seen_ms >= aging_time_ms_;
            }

            void MacTable::evictOldest()
            {
                auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                               [](const auto &a, const auto &b) {
                                                   return a.second.last_seen_ms < b.second.last_seen_ms;
                                               });
                if (oldest != entries_.end())
                {
                    entries_.erase(oldest);
                    stats_.evicted++;
                }
            }

        } // namespace L2
    }     // namespace Core
} // namespace NetSim
