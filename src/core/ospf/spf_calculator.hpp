// src/core/ospf/spf_calculator.hpp
#ifndef NETSIM_OSPF_SPF_CALCULATOR_HPP
#define NETSIM_OSPF_SPF_CALCULATOR_HPP

#include "ospf_types.hpp"
#include "../l3/routing_table.hpp"
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            /**
             * @brief Interface OSPF cục bộ dùng để giải quyết next hop
             */
            struct SpfInterface
            {
                std::string name;
                Common::IPv4Address ip_address;
                Common::SubnetMask mask;
            };

            /**
             * @brief Tính cây đường đi ngắn nhất trong một area (RFC 2328 §16.1)
             *
             * Vertex là router (Router-LSA) và mạng transit (Network-LSA). Cạnh chỉ được
             * dùng khi cả hai đầu cùng quảng bá nhau. LSA MaxAge bị bỏ qua.
             */
            class SpfCalculator
            {
            public:
                /**
                 * @return Route nguồn OSPF, mỗi prefix một route có cost thấp nhất.
                 *         Mạng gắn trực tiếp với interface cục bộ không được trả về.
                 */
                static std::vector<L3::Route> calculate(const Common::IPv4Address &router_id,
                                                        const std::vector<Packet::Lsa> &lsas,
                                                        const std::vector<SpfInterface> &interfaces);

            private:
                SpfCalculator() = default;
            };

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_OSPF_SPF_CALCULATOR_HPP
