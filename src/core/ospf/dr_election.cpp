// src/core/ospf/dr_election.cpp
#include "dr_election.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            bool DrElection::better(const ElectionCandidate &a, const ElectionCandidate &b)
            {
                if (a.priority != b.priority)
                {
                    return a.priority > b.priority;
                }
                return b.router_id < a.router_id;
            }

            ElectionResult DrElection::electOnce(const std::vector<ElectionCandidate> &candidates)
            {
                ElectionResult result;

                // Bước 2: BDR, ưu tiên router tự khai là BDR, loại router tự khai là DR
                const ElectionCandidate *bdr = nullptr;
                bool bdr_declared = false;
                for (const auto &c : candidates)
                {
                    if (c.priority == 0 || c.declared_dr == c.ip_address)
                    {
                        continue;
                    }
                    bool declares_bdr = c.declared_bdr == c.ip_address;
                    if (bdr == nullptr || (declares_bdr && !bdr_declared) ||
                        (declares_bdr == bdr_declared && better(c, *bdr)))
                    {
                        bdr = &c;
                        bdr_declared = declares_bdr;
                    }
                }

                // Bước 3: DR trong số router tự khai là DR, nếu không có thì lấy BDR
                const ElectionCandidate *dr = nullptr;
                for (const auto &c : candidates)
                {
                    if (c.priority == 0 || c.declared_dr != c.ip_address)
                    {
                        continue;
                    }
                    if (dr == nullptr || better(c, *dr))
                    {
                        dr = &c;
                    }
                }

                if (dr != nullptr)
                {
                    result.designated_router = dr->ip_address;
                }
                else if (bdr != nullptr)
                {
                    result.designated_router = bdr->ip_address;
                }

                if (bdr != nullptr)
                {
                    result.backup_designated_router = bdr->ip_address;
                }
                return result;
            }

            ElectionResult DrElection::elect(const ElectionCandidate &self,
                                             const std::vector<ElectionCandidate> &neighbors)
            {
                std::vector<ElectionCandidate> candidates = neighbors;
                candidates.push_back(self);

                ElectionResult first = electOnce(candidates);

                bool was_dr = self.declared_dr == self.ip_address;
                bool was_bdr = self.declared_bdr == self.ip_address;
                bool is_dr = first.designated_router == self.ip_address;
                bool is_bdr = first.backup_designated_router == self.ip_address;

                ElectionResult result = first;
                if (was_dr != is_dr || was_bdr != is_bdr)
                {
                    // Bước 4: lặp lại bước 2 và 3 với DR/BDR mới do chính router này khai báo
                    candidates.back().declared_dr = first.designated_router;
                    candidates.back().declared_bdr = first.backup_designated_router;
                    result = electOnce(candidates);
                }

                // Router được chọn làm DR không thể đồng thời là BDR
                if (result.designated_router == result.backup_designated_router &&
                    result.designated_router != Common::IPv4Address::any())
                {
                    result.backup_designated_router = Common::IPv4Address::any();
                }
                return result;
            }

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim
