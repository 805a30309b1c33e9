// src/core/l3/routing_table.cpp
#include "routing_table.hpp"
#include <algorithm>
#include <sstream>

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            std::string routeSourceToString(RouteSource source)
            {
                switch (source)
                {
                case RouteSource::CONNECTED:
                    return "connected";
                case RouteSource::STATIC:
                    return "static";
                case RouteSource::OSPF:
                    return "ospf";
                }
                return "unknown";
            }

            int administrativeDistance(RouteSource source)
            {
                switch (source)
                {
                case RouteSource::CONNECTED:
                    return 0;
                case RouteSource::STATIC:
                    return 1;
                case RouteSource::OSPF:
                    return 110;
                }
                return 255;
            }

            std::string Route::toString() const
            {
                static const char codes[] = {'C', 'S', 'O'};

                std::ostringstream oss;
                oss << codes[static_cast<int>(source)] << " " << network << "/" << mask.prefixLength();
                if (next_hop)
                {
                    oss << " [" << administrativeDistance(source) << "/" << metric << "] via " << *next_hop;
                    if (!interface_name.empty())
                    {
                        oss << ", " << interface_name;
                    }
                }
                else
                {
                    oss << " is directly connected, " << interface_name;
                }
                return oss.str();
            }

            // ==================== RoutingTable ====================

            bool RoutingTable::addRoute(Route route)
            {
                route.network = route.mask.networkOf(route.network);

                auto existing = std::find_if(routes_.begin(), routes_.end(), [&route](const Route &r) {
                    return r.sameDestination(route) && r.source == route.source && r.next_hop == route.next_hop &&
                           r.interface_name == route.interface_name;
                });
                if (existing != routes_.end())
                {
                    return false;
                }

                routes_.push_back(std::move(route));
                return true;
            }

            bool RoutingTable::removeRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask,
                                           RouteSource source)
            {
                Common::IPv4Address normalized = mask.networkOf(network);
                auto before = routes_.size();
                routes_.erase(std::remove_if(routes_.begin(), routes_.end(), [&](const Route &r) {
                                  return r.network == normalized && r.mask == mask && r.source == source;
                              }),
                              routes_.end());
                return routes_.size() != before;
            }

            size_t RoutingTable::removeRoutesVia(const std::string &interface_name, RouteSource source)
            {
                auto before = routes_.size();
                routes_.erase(std::remove_if(routes_.begin(), routes_.end(), [&](const Route &r) {
                                  return r.interface_name == interface_name && r.source == source;
                              }),
                              routes_.end());
                return before - routes_.size();
            }

            void RoutingTable::replaceRoutesFromSource(RouteSource source, const std::vector<Route> &routes)
            {
                routes_.erase(std::remove_if(routes_.begin(), routes_.end(),
                                             [source](const Route &r) { return r.source == source; }),
                              routes_.end());
                for (Route route : routes)
                {
                    route.source = source;
                    addRoute(std::move(route));
                }
            }

            bool RoutingTable::better(const Route &a, const Route &b)
            {
                int prefix_a = a.mask.prefixLength();
                int prefix_b = b.mask.prefixLength();
                if (prefix_a != prefix_b)
                {
                    return prefix_a > prefix_b;
                }
                if (a.metric != b.metric)
                {
                    return a.metric < b.metric;
                }
                return static_cast<int>(a.source) < static_cast<int>(b.source);
            }

            std::optional<Route> RoutingTable::lookup(const Common::IPv4Address &destination) const
            {
                const Route *best = nullptr;
                for (const auto &route : routes_)
                {
                    if (!route.matches(destination))
                    {
                        continue;
                    }
                    if (!best || better(route, *best))
                    {
                        best = &route;
                    }
                }

                if (!best)
                {
                    return std::nullopt;
                }
                return *best;
            }

            std::vector<Route> RoutingTable::getRoutes() const
            {
                std::vector<Route> result = routes_;
                std::stable_sort(result.begin(), result.end(), [](const Route &a, const Route &b) {
                    if (a.network != b.network)
                    {
                        return a.network < b.network;
                    }
                    return a.mask.prefixLength() > b.mask.prefixLength();
                });
                return result;
            }

            std::vector<Route> RoutingTable::getRoutes(RouteSource source) const
            {
                std::vector<Route> result;
                for (const auto &route : getRoutes())
                {
                    if (route.source == source)
                    {
                        result.push_back(route);
                    }
                }
                return result;
            }

        } // namespace L3
    }     // namespace Core
} // namespace NetSim
