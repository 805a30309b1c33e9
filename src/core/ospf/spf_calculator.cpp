// src/core/ospf/spf_calculator.cpp
#include "spf_calculator.hpp"
#include <map>
#include <set>
#include <tuple>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            namespace
            {
                enum class VertexType
                {
                    ROUTER,
                    NETWORK
                };

                using VertexKey = std::pair<VertexType, uint32_t>;

                struct Vertex
                {
                    uint32_t distance = 0;
                    std::optional<Common::IPv4Address> next_hop;
                    std::string interface_name;
                    bool in_tree = false;
                };

                struct Topology
                {
                    std::map<uint32_t, const Packet::RouterLsaBody *> routers;   // key: router ID
                    std::map<uint32_t, const Packet::Lsa *> networks;            // key: IP của DR

                    const Packet::RouterLsaBody *router(uint32_t id) const
                    {
                        auto it = routers.find(id);
                        return it != routers.end() ? it->second : nullptr;
                    }

                    const Packet::NetworkLsaBody *network(uint32_t id) const
                    {
                        auto it = networks.find(id);
                        return it != networks.end() ? &std::get<Packet::NetworkLsaBody>(it->second->body) : nullptr;
                    }
                };

                const Packet::RouterLink *findLink(const Packet::RouterLsaBody &body, Packet::RouterLinkType type,
                                                   uint32_t link_id)
                {
                    for (const auto &link : body.links)
                    {
                        if (link.type == type && link.link_id.toUint32() == link_id)
                        {
                            return &link;
                        }
                    }
                    return nullptr;
                }

                const SpfInterface *interfaceFor(const std::vector<SpfInterface> &interfaces,
                                                 const Common::IPv4Address &ip)
                {
                    for (const auto &iface : interfaces)
                    {
                        if (iface.ip_address == ip)
                        {
                            return &iface;
                        }
                    }
                    return nullptr;
                }

                bool isDirectlyAttached(const std::vector<SpfInterface> &interfaces,
                                        const Common::IPv4Address &network, const Common::SubnetMask &mask)
                {
                    for (const auto &iface : interfaces)
                    {
                        if (iface.mask == mask && iface.mask.networkOf(iface.ip_address) == network)
                        {
                            return true;
                        }
                    }
                    return false;
                }
            }

            std::vector<L3::Route> SpfCalculator::calculate(const Common::IPv4Address &router_id,
                                                            const std::vector<Packet::Lsa> &lsas,
                                                            const std::vector<SpfInterface> &interfaces)
            {
                Topology topology;
                for (const auto &lsa : lsas)
                {
                    if (lsa.header.ls_age >= OspfConstants::MAX_AGE)
                    {
                        continue;
                    }
                    if (lsa.header.ls_type == Packet::LsaType::ROUTER)
                    {
                        if (const auto *body = std::get_if<Packet::RouterLsaBody>(&lsa.body))
                        {
                            topology.routers[lsa.header.link_state_id.toUint32()] = body;
                        }
                    }
                    else if (lsa.header.ls_type == Packet::LsaType::NETWORK &&
                             std::holds_alternative<Packet::NetworkLsaBody>(lsa.body))
                    {
                        topology.networks[lsa.header.link_state_id.toUint32()] = &lsa;
                    }
                }

                std::vector<L3::Route> result;
                const uint32_t root_id = router_id.toUint32();
                if (topology.router(root_id) == nullptr)
                {
                    return result;
                }

                std::map<VertexKey, Vertex> vertices;
                std::set<std::tuple<uint32_t, VertexType, uint32_t>> candidates;

                const VertexKey root_key{VertexType::ROUTER, root_id};
                vertices[root_key] = Vertex{};
                candidates.insert(std::make_tuple(0u, VertexType::ROUTER, root_id));

                auto relax = [&](const VertexKey &key, uint32_t distance, const std::optional<Common::IPv4Address> &next_hop,
                                 const std::string &interface_name)
                {
                    auto it = vertices.find(key);
                    if (it != vertices.end())
                    {
                        if (it->second.in_tree || it->second.distance <= distance)
                        {
                            return;
                        }
                        candidates.erase(std::make_tuple(it->second.distance, key.first, key.second));
                    }
                    vertices[key] = Vertex{distance, next_hop, interface_name, false};
                    candidates.insert(std::make_tuple(distance, key.first, key.second));
                };

                while (!candidates.empty())
                {
                    auto top = *candidates.begin();
                    candidates.erase(candidates.begin());

                    VertexKey key{std::get<1>(top), std::get<2>(top)};
                    Vertex &vertex = vertices[key];
                    vertex.in_tree = true;
                    const bool is_root = key == root_key;

                    if (key.first == VertexType::ROUTER)
                    {
                        const auto *body = topology.router(key.second);
                        if (body == nullptr)
                        {
                            continue;
                        }

                        for (const auto &link : body->links)
                        {
                            uint32_t distance = vertex.distance + link.metric;

                            if (link.type == Packet::RouterLinkType::POINT_TO_POINT)
                            {
                                const auto *peer = topology.router(link.link_id.toUint32());
                                const Packet::RouterLink *back =
                                    peer ? findLink(*peer, Packet::RouterLinkType::POINT_TO_POINT, key.second) : nullptr;
                                if (back == nullptr)
                                {
                                    continue;
                                }

                                if (is_root)
                                {
                                    const SpfInterface *iface = interfaceFor(interfaces, link.link_data);
                                    if (iface == nullptr)
                                    {
                                        continue;
                                    }
                                    relax({VertexType::ROUTER, link.link_id.toUint32()}, distance, back->link_data, iface->name);
                                }
                                else
                                {
                                    relax({VertexType::ROUTER, link.link_id.toUint32()}, distance, vertex.next_hop,
                                          vertex.interface_name);
                                }
                            }
                            else if (link.type == Packet::RouterLinkType::TRANSIT)
                            {
                                const auto *network = topology.network(link.link_id.toUint32());
                                if (network == nullptr)
                                {
                                    continue;
                                }
                                bool listed = false;
                                for (const auto &attached : network->attached_routers)
                                {
                                    listed = listed || attached.toUint32() == key.second;
                                }
                                if (!listed)
                                {
                                    continue;
                                }

                                if (is_root)
                                {
                                    const SpfInterface *iface = interfaceFor(interfaces, link.link_data);
                                    if (iface == nullptr)
                                    {
                                        continue;
                                    }
                                    relax({VertexType::NETWORK, link.link_id.toUint32()}, distance, std::nullopt, iface->name);
                                }
                                else
                                {
                                    relax({VertexType::NETWORK, link.link_id.toUint32()}, distance, vertex.next_hop,
                                          vertex.interface_name);
                                }
                            }
                        }
                    }
                    else
                    {
                        const auto *network = topology.network(key.second);
                        if (network == nullptr)
                        {
                            continue;
                        }

                        for (const auto &attached : network->attached_routers)
                        {
                            const auto *body = topology.router(attached.toUint32());
                            const Packet::RouterLink *back =
                                body ? findLink(*body, Packet::RouterLinkType::TRANSIT, key.second) : nullptr;
                            if (back == nullptr)
                            {
                                continue;
                            }

                            // Mạng gắn trực tiếp với root: next hop là IP của router trên mạng đó
                            std::optional<Common::IPv4Address> next_hop = vertex.next_hop;
                            if (!next_hop)
                            {
                                next_hop = back->link_data;
                            }
                            relax({VertexType::ROUTER, attached.toUint32()}, vertex.distance, next_hop, vertex.interface_name);
                        }
                    }
                }

                std::map<std::pair<uint32_t, uint32_t>, L3::Route> best;
                auto offer = [&](const Common::IPv4Address &network, const Common::SubnetMask &mask, uint32_t cost,
                                 const Vertex &via)
                {
                    Common::IPv4Address prefix = mask.networkOf(network);
                    if (isDirectlyAttached(interfaces, prefix, mask) || !via.next_hop)
                    {
                        return;
                    }

                    auto key = std::make_pair(prefix.toUint32(), mask.toUint32());
                    auto it = best.find(key);
                    if (it != best.end() && it->second.metric <= cost)
                    {
                        return;
                    }

                    L3::Route route;
                    route.network = prefix;
                    route.mask = mask;
                    route.next_hop = via.next_hop;
                    route.interface_name = via.interface_name;
                    route.source = L3::RouteSource::OSPF;
                    route.metric = cost;
                    best[key] = route;
                };

                for (const auto &pair : vertices)
                {
                    const Vertex &vertex = pair.second;
                    if (!vertex.in_tree)
                    {
                        continue;
                    }

                    if (pair.first.first == VertexType::NETWORK)
                    {
                        const Packet::Lsa *lsa = topology.networks.at(pair.first.second);
                        const auto &body = std::get<Packet::NetworkLsaBody>(lsa->body);
                        offer(lsa->header.link_state_id, body.network_mask, vertex.distance, vertex);
                        continue;
                    }

                    if (pair.first == root_key)
                    {
                        continue;
                    }

                    const auto *body = topology.router(pair.first.second);
                    if (body == nullptr)
                    {
                        continue;
                    }
                    for (const auto &link : body->links)
                    {
                        if (link.type != Packet::RouterLinkType::STUB)
                        {
                            continue;
                        }
                        Common::SubnetMask mask(link.link_data.toUint32());
                        offer(link.link_id, mask, vertex.distance + link.metric, vertex);
                    }
                }

                result.reserve(best.size());
                for (const auto &pair : best)
                {
                    result.push_back(pair.second);
                }
                return result;
            }

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim
