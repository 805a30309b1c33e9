// src/core/l3/routing_table.hpp
#ifndef NETSIM_ROUTING_TABLE_HPP
#define NETSIM_ROUTING_TABLE_HPP

#include "../../common/address.hpp"
#include <optional>
#include <string>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            enum class RouteSource
            {
                CONNECTED,
                STATIC,
                OSPF
            };

            std::string routeSourceToString(RouteSource source);

            /**
             * @brief Administrative distance tương ứng (0, 1, 110)
             */
            int administrativeDistance(RouteSource source);

            struct Route
            {
                Common::IPv4Address network;
                Common::SubnetMask mask;
                std::optional<Common::IPv4Address> next_hop;   // rỗng = directly connected
                std::string interface_name;
                RouteSource source = RouteSource::STATIC;
                uint32_t metric = 0;

                bool matches(const Common::IPv4Address &destination) const
                {
                    return mask.networkOf(destination) == network;
                }

                bool sameDestination(const Route &other) const
                {
                    return network == other.network && mask == other.mask;
                }

                /**
                 * @brief VD "O 10.0.2.0/24 [110/20] via 10.0.12.2, Gi0/1"
                 */
                std::string toString() const;
            };

            /**
             * @brief Bảng định tuyến
             *
             * lookup(): prefix dài nhất, sau đó metric thấp nhất, sau đó nguồn
             * connected > static > ospf.
             */
            class RoutingTable
            {
            public:
                /**
                 * @brief Thêm route (network được chuẩn hóa theo mask). Route trùng hoàn toàn bị bỏ qua.
                 */
                bool addRoute(Route route);

                bool removeRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask, RouteSource source);

                /**
                 * @brief Xóa mọi route qua interface (interface shutdown)
                 */
                size_t removeRoutesVia(const std::string &interface_name, RouteSource source);

                /**
                 * @brief Thay toàn bộ route của một nguồn (kết quả SPF)
                 */
                void replaceRoutesFromSource(RouteSource source, const std::vector<Route> &routes);

                std::optional<Route> lookup(const Common::IPv4Address &destination) const;

                std::vector<Route> getRoutes() const;
                std::vector<Route> getRoutes(RouteSource source) const;
                size_t size() const { return routes_.size(); }
                void clear() { routes_.clear(); }

            private:
                std::vector<Route> routes_;

                static bool better(const Route &a, const Route &b);
            };

        } // namespace L3
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ROUTING_TABLE_HPP
