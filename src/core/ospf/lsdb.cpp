// src/core/ospf/lsdb.cpp
#include "lsdb.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            namespace
            {
                bool sameBody(const Packet::Lsa &a, const Packet::Lsa &b)
                {
                    if (a.body.index() != b.body.index())
                    {
                        return false;
                    }
                    if (const auto *router_a = std::get_if<Packet::RouterLsaBody>(&a.body))
                    {
                        const auto &router_b = std::get<Packet::RouterLsaBody>(b.body);
                        return router_a->flags == router_b.flags && router_a->links == router_b.links;
                    }
                    const auto &network_a = std::get<Packet::NetworkLsaBody>(a.body);
                    const auto &network_b = std::get<Packet::NetworkLsaBody>(b.body);
                    return network_a.network_mask == network_b.network_mask &&
                           network_a.attached_routers == network_b.attached_routers;
                }
            }

            int compareLsaInstances(const Packet::LsaHeader &a, const Packet::LsaHeader &b)
            {
                // Sequence number là số có dấu (0x80000001 nhỏ nhất)
                int32_t seq_a = static_cast<int32_t>(a.sequence_number);
                int32_t seq_b = static_cast<int32_t>(b.sequence_number);
                if (seq_a != seq_b)
                {
                    return seq_a > seq_b ? 1 : -1;
                }

                if (a.checksum != b.checksum)
                {
                    return a.checksum > b.checksum ? 1 : -1;
                }

                bool a_max = a.ls_age >= OspfConstants::MAX_AGE;
                bool b_max = b.ls_age >= OspfConstants::MAX_AGE;
                if (a_max != b_max)
                {
                    return a_max ? 1 : -1;
                }

                int age_diff = static_cast<int>(a.ls_age) - static_cast<int>(b.ls_age);
                if (age_diff > OspfConstants::MAX_AGE_DIFF || -age_diff > OspfConstants::MAX_AGE_DIFF)
                {
                    return age_diff < 0 ? 1 : -1;
                }
                return 0;
            }

            bool isNewerLSA(const Packet::LsaHeader &a, const Packet::LsaHeader &b)
            {
                return compareLsaInstances(a, b) > 0;
            }

            // ==================== LinkStateDatabase ====================

            uint16_t LinkStateDatabase::ageAt(const Entry &entry, uint64_t now_ms)
            {
                uint64_t elapsed = now_ms > entry.installed_ms ? (now_ms - entry.installed_ms) / 1000 : 0;
                uint64_t age = entry.lsa.header.ls_age + elapsed;
                return static_cast<uint16_t>(age > OspfConstants::MAX_AGE ? OspfConstants::MAX_AGE : age);
            }

            bool LinkStateDatabase::install(const Packet::Lsa &lsa, uint64_t now_ms)
            {
                Packet::LsaKey key = lsa.header.key();
                auto it = entries_.find(key);

                bool changed = true;
                if (it != entries_.end())
                {
                    bool was_max = ageAt(it->second, now_ms) >= OspfConstants::MAX_AGE;
                    bool is_max = lsa.header.ls_age >= OspfConstants::MAX_AGE;
                    changed = was_max != is_max || it->second.lsa.header.options != lsa.header.options ||
                              !sameBody(it->second.lsa, lsa);
                }

                entries_[key] = Entry{lsa, now_ms};
                return changed;
            }

            bool LinkStateDatabase::remove(const Packet::LsaKey &key)
            {
                return entries_.erase(key) > 0;
            }

            std::optional<Packet::Lsa> LinkStateDatabase::lookup(const Packet::LsaKey &key, uint64_t now_ms) const
            {
                auto it = entries_.find(key);
                if (it == entries_.end())
                {
                    return std::nullopt;
                }
                Packet::Lsa lsa = it->second.lsa;
                lsa.header.ls_age = ageAt(it->second, now_ms);
                return lsa;
            }

            std::optional<Packet::LsaHeader> LinkStateDatabase::lookupHeader(const Packet::LsaKey &key, uint64_t now_ms) const
            {
                auto it = entries_.find(key);
                if (it == entries_.end())
                {
                    return std::nullopt;
                }
                Packet::LsaHeader header = it->second.lsa.header;
                header.ls_age = ageAt(it->second, now_ms);
                return header;
            }

            std::vector<Packet::LsaHeader> LinkStateDatabase::getHeaders(uint64_t now_ms) const
            {
                std::vector<Packet::LsaHeader> result;
                result.reserve(entries_.size());
                for (const auto &pair : entries_)
                {
                    Packet::LsaHeader header = pair.second.lsa.header;
                    header.ls_age = ageAt(pair.second, now_ms);
                    result.push_back(header);
                }
                return result;
            }

            std::vector<Packet::Lsa> LinkStateDatabase::getAll(uint64_t now_ms) const
            {
                std::vector<Packet::Lsa> result;
                result.reserve(entries_.size());
                for (const auto &pair : entries_)
                {
                    Packet::Lsa lsa = pair.second.lsa;
                    lsa.header.ls_age = ageAt(pair.second, now_ms);
                    result.push_back(lsa);
                }
                return result;
            }

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim
