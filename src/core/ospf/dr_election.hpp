// src/core/ospf/dr_election.hpp
#ifndef NETSIM_OSPF_DR_ELECTION_HPP
#define NETSIM_OSPF_DR_ELECTION_HPP

#include "../../common/address.hpp"
#include <cstdint>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            /**
             * @brief Một router tham gia bầu chọn (chính router này hoặc neighbor >= 2-Way)
             *
             * DR/BDR được khai báo bằng địa chỉ IP interface, 0.0.0.0 nếu không có.
             */
            struct ElectionCandidate
            {
                Common::IPv4Address router_id;
                Common::IPv4Address ip_address;
                uint8_t priority = 0;
                Common::IPv4Address declared_dr;
                Common::IPv4Address declared_bdr;
            };

            struct ElectionResult
            {
                Common::IPv4Address designated_router;
                Common::IPv4Address backup_designated_router;
            };

            /**
             * @brief Bầu chọn DR/BDR theo RFC 2328 §9.4
             */
            class DrElection
            {
            public:
                /**
                 * @param self Router tính toán, với DR/BDR hiện tại của interface
                 * @param neighbors Các neighbor ở trạng thái >= 2-Way
                 */
                static ElectionResult elect(const ElectionCandidate &self,
                                            const std::vector<ElectionCandidate> &neighbors);

            private:
                DrElection() = default;

                static ElectionResult electOnce(const std::vector<ElectionCandidate> &candidates);
                static bool better(const ElectionCandidate &a, const ElectionCandidate &b);
            };

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_OSPF_DR_ELECTION_HPP
