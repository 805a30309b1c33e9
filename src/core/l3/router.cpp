// src/core/l3/router.cpp
#include "router.hpp"
#include "../packet/packet_builder.hpp"
#include "../sim/simulation_context.hpp"
#include "../../common/logger.hpp"
#include "../../common/network_utils.hpp"
#include <algorithm>

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            namespace
            {
                const Common::IPv4Address ALL_SPF_ROUTERS(Ospf::OspfConstants::ALL_SPF_ROUTERS);
                const Common::IPv4Address ALL_D_ROUTERS(Ospf::OspfConstants::ALL_D_ROUTERS);

                Common::IPv4Address directedBroadcast(const Common::IPv4Address &ip, const Common::SubnetMask &mask)
                {
                    return Common::IPv4Address(Common::NetworkUtils::calculateBroadcastAddress(ip.toUint32(), mask.prefixLength()));
                }

                /**
                 * @brief Không sinh ICMP error cho ICMP error, hay cho nguồn không phải unicast
                 */
                bool mayTriggerIcmpError(const Packet::IPv4Packet &packet)
                {
                    if (packet.source().isUnspecified() || packet.source().isBroadcast() || packet.source().isMulticast())
                    {
                        return false;
                    }
                    const auto *icmp = packet.payloadAs<Packet::IcmpMessage>();
                    return icmp == nullptr || !icmp->isError();
                }
            }

            Router::Router(Sim::SimulationContext &context, const std::string &name, size_t interface_count)
                : FrameSink(context, name),
                  logger_(NETSIM_GET_LOGGER("Router")),
                  arp_cache_(static_cast<uint64_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::ROUTER_ARP_TIMEOUT, 14400)) * 1000),
                  nat_(context.clock(),
                       static_cast<uint64_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::NAT_TRANSLATION_TIMEOUT, 86400)) * 1000,
                       static_cast<uint16_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::NAT_PAT_PORT_MIN, 1024)),
                       static_cast<uint16_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::NAT_PAT_PORT_MAX, 65535))),
                  default_ttl_(static_cast<uint8_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::ROUTER_DEFAULT_TTL, 255))),
                  ping_identifier_(1),
                  ping_sequence_(0),
                  nat_timeout_subscription_(0)
            {
                for (size_t i = 0; i < interface_count; ++i)
                {
                    RouterInterface iface;
                    iface.name = "Gi0/" + std::to_string(i);
                    iface.mac = context.allocateMac();
                    interface_order_.push_back(iface.name);
                    interfaces_.emplace(iface.name, iface);
                }

                // Timeout mới áp dụng cho translation tạo sau thời điểm thay đổi
                nat_timeout_subscription_ = context.config().registerChangeCallback(
                    Common::ConfigKeys::NAT_TRANSLATION_TIMEOUT,
                    [this](const std::string &, const std::any &, const std::any &new_value)
                    {
                        if (const int *seconds = std::any_cast<int>(&new_value))
                        {
                            nat_.setTranslationTimeout(static_cast<uint64_t>(*seconds) * 1000);
                        }
                    });
            }

            Router::~Router()
            {
                context_.config().unregisterChangeCallback(nat_timeout_subscription_);
                if (ospf_)
                {
                    ospf_->setSendCallback(nullptr);
                    ospf_->setRouteCallback(nullptr);
                    ospf_->shutdown();
                }
            }

            RouterInterface *Router::findInterface(const std::string &name)
            {
                auto it = interfaces_.find(name);
                return it != interfaces_.end() ? &it->second : nullptr;
            }

            const RouterInterface *Router::getInterface(const std::string &name) const
            {
                auto it = interfaces_.find(name);
                return it != interfaces_.end() ? &it->second : nullptr;
            }

            bool Router::ownsAddress(const Common::IPv4Address &ip) const
            {
                for (const auto &pair : interfaces_)
                {
                    if (pair.second.isUp() && pair.second.ip_address == ip)
                    {
                        return true;
                    }
                }
                return false;
            }

            // ==================== Interfaces ====================

            bool Router::configureInterface(const std::string &name, const Common::IPv4Address &ip,
                                            const Common::SubnetMask &mask)
            {
                RouterInterface *iface = findInterface(name);
                if (iface == nullptr)
                {
                    logger_->warn("{}: unknown interface {}", name_, name);
                    return false;
                }
                if (!mask.isContiguous() || ip.isUnspecified() || ip.isMulticast() || ip.isBroadcast())
                {
                    logger_->warn("{}: invalid address {} {} on {}", name_, ip.toString(), mask.toString(), name);
                    return false;
                }
                for (const auto &pair : interfaces_)
                {
                    const RouterInterface &other = pair.second;
                    if (other.name != name && other.configured &&
                        (other.mask.sameSubnet(other.ip_address, ip) || mask.sameSubnet(ip, other.ip_address)))
                    {
                        logger_->warn("{}: {} {} overlaps with {}", name_, ip.toString(), mask.toString(), other.name);
                        return false;
                    }
                }

                if (iface->configured)
                {
                    routing_table_.removeRoutesVia(name, RouteSource::CONNECTED);
                    arp_cache_.removeInterface(name);
                    if (ospf_)
                    {
                        ospf_->deactivateInterface(name);
                    }
                }

                iface->ip_address = ip;
                iface->mask = mask;
                iface->configured = true;
                logger_->info("{}: {} configured {}/{}", name_, name, ip.toString(), mask.prefixLength());

                if (iface->enabled)
                {
                    Route connected;
                    connected.network = mask.networkOf(ip);
                    connected.mask = mask;
                    connected.interface_name = name;
                    connected.source = RouteSource::CONNECTED;
                    connected.metric = 0;
                    routing_table_.addRoute(connected);
                    activateOspf(*iface);
                }
                return true;
            }

            bool Router::shutdownInterface(const std::string &name)
            {
                RouterInterface *iface = findInterface(name);
                if (iface == nullptr)
                {
                    logger_->warn("{}: unknown interface {}", name_, name);
                    return false;
                }
                if (!iface->enabled)
                {
                    return true;
                }

                iface->enabled = false;
                routing_table_.removeRoutesVia(name, RouteSource::CONNECTED);
                routing_table_.removeRoutesVia(name, RouteSource::STATIC);
                arp_cache_.removeInterface(name);
                if (ospf_)
                {
                    ospf_->deactivateInterface(name);
                }
                logger_->info("{}: interface {} shutdown", name_, name);
                return true;
            }

            bool Router::noShutdownInterface(const std::string &name)
            {
                RouterInterface *iface = findInterface(name);
                if (iface == nullptr)
                {
                    logger_->warn("{}: unknown interface {}", name_, name);
                    return false;
                }
                if (iface->enabled)
                {
                    return true;
                }

                iface->enabled = true;
                if (iface->configured)
                {
                    Route connected;
                    connected.network = iface->mask.networkOf(iface->ip_address);
                    connected.mask = iface->mask;
                    connected.interface_name = name;
                    connected.source = RouteSource::CONNECTED;
                    routing_table_.addRoute(connected);
                    restoreStaticRoutes(name);
                    activateOspf(*iface);
                }
                logger_->info("{}: interface {} up", name_, name);
                return true;
            }

            // ==================== Routing ====================

            std::optional<std::string> Router::interfaceForNextHop(const Common::IPv4Address &next_hop) const
            {
                for (const auto &name : interface_order_)
                {
                    const RouterInterface &iface = interfaces_.at(name);
                    if (iface.configured && iface.mask.sameSubnet(iface.ip_address, next_hop))
                    {
                        return name;
                    }
                }
                return std::nullopt;
            }

            bool Router::addStaticRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask,
                                        const Common::IPv4Address &next_hop)
            {
                if (!mask.isContiguous())
                {
                    logger_->warn("{}: invalid mask {}", name_, mask.toString());
                    return false;
                }
                auto egress = interfaceForNextHop(next_hop);
                if (!egress)
                {
                    logger_->warn("{}: next hop {} is not on a connected network", name_, next_hop.toString());
                    return false;
                }

                StaticRoute route{mask.networkOf(network), mask, next_hop, *egress};
                for (const auto &existing : static_routes_)
                {
                    if (existing.network == route.network && existing.mask == route.mask &&
                        existing.next_hop == route.next_hop && existing.interface_name == route.interface_name)
                    {
                        return true;
                    }
                }
                static_routes_.push_back(route);
                restoreStaticRoutes(*egress);
                return true;
            }

            bool Router::addStaticRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask,
                                        const std::string &interface_name)
            {
                if (!mask.isContiguous())
                {
                    logger_->warn("{}: invalid mask {}", name_, mask.toString());
                    return false;
                }
                if (interfaces_.count(interface_name) == 0)
                {
                    logger_->warn("{}: unknown interface {}", name_, interface_name);
                    return false;
                }

                StaticRoute route{mask.networkOf(network), mask, std::nullopt, interface_name};
                for (const auto &existing : static_routes_)
                {
                    if (existing.network == route.network && existing.mask == route.mask &&
                        !existing.next_hop && existing.interface_name == interface_name)
                    {
                        return true;
                    }
                }
                static_routes_.push_back(route);
                restoreStaticRoutes(interface_name);
                return true;
            }

            bool Router::removeStaticRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask)
            {
                Common::IPv4Address prefix = mask.networkOf(network);
                auto it = std::remove_if(static_routes_.begin(), static_routes_.end(), [&](const StaticRoute &route)
                                         { return route.network == prefix && route.mask == mask; });
                if (it == static_routes_.end())
                {
                    return false;
                }
                static_routes_.erase(it, static_routes_.end());
                routing_table_.removeRoute(prefix, mask, RouteSource::STATIC);
                return true;
            }

            bool Router::setDefaultRoute(const Common::IPv4Address &next_hop)
            {
                return addStaticRoute(Common::IPv4Address::any(), Common::SubnetMask(0u), next_hop);
            }

            void Router::restoreStaticRoutes(const std::string &interface_name)
            {
                const RouterInterface *iface = getInterface(interface_name);
                if (iface == nullptr || !iface->enabled)
                {
                    return;
                }

                for (const auto &entry : static_routes_)
                {
                    if (entry.interface_name != interface_name)
                    {
                        continue;
                    }
                    Route route;
                    route.network = entry.network;
                    route.mask = entry.mask;
                    route.next_hop = entry.next_hop;
                    route.interface_name = entry.interface_name;
                    route.source = RouteSource::STATIC;
                    route.metric = 0;
                    routing_table_.addRoute(route);
                }
            }

            // ==================== OSPF ====================

            Ospf::OspfEngine &Router::enableOspf(const Common::IPv4Address &router_id)
            {
                if (ospf_)
                {
                    logger_->warn("{}: OSPF already running with router ID {}", name_, ospf_->getRouterId().toString());
                    return *ospf_;
                }

                ospf_ = std::make_unique<Ospf::OspfEngine>(context_.scheduler(), router_id);
                ospf_->setSendCallback([this](const std::string &interface_name, const Common::IPv4Address &destination,
                                              const Packet::OspfPacket &packet)
                                       { sendOspf(interface_name, destination, packet); });
                ospf_->setRouteCallback([this](const std::vector<Route> &routes)
                                        {
                                            routing_table_.replaceRoutesFromSource(RouteSource::OSPF, routes);
                                            logger_->debug("{}: {} OSPF routes installed", name_, routes.size());
                                        });
                logger_->info("{}: OSPF enabled, router ID {}", name_, router_id.toString());
                return *ospf_;
            }

            void Router::disableOspf()
            {
                if (!ospf_)
                {
                    return;
                }
                ospf_->setSendCallback(nullptr);
                ospf_->setRouteCallback(nullptr);
                ospf_->shutdown();
                ospf_.reset();
                routing_table_.replaceRoutesFromSource(RouteSource::OSPF, {});
                logger_->info("{}: OSPF disabled", name_);
            }

            bool Router::ospfNetwork(const Common::IPv4Address &network, const Common::WildcardMask &wildcard,
                                     const Common::IPv4Address &area_id)
            {
                if (!ospf_)
                {
                    logger_->warn("{}: OSPF is not enabled", name_);
                    return false;
                }

                ospf_->addNetwork(network, wildcard, area_id);
                for (const auto &name : interface_order_)
                {
                    const RouterInterface &iface = interfaces_.at(name);
                    if (iface.isUp())
                    {
                        activateOspf(iface);
                    }
                }
                return true;
            }

            bool Router::setOspfInterfaceOptions(const std::string &interface_name, const Ospf::InterfaceOptions &options)
            {
                const RouterInterface *iface = getInterface(interface_name);
                if (iface == nullptr)
                {
                    logger_->warn("{}: unknown interface {}", name_, interface_name);
                    return false;
                }

                ospf_options_[interface_name] = options;
                if (ospf_ && ospf_->getInterface(interface_name) != nullptr)
                {
                    ospf_->deactivateInterface(interface_name);
                    activateOspf(*iface);
                }
                return true;
            }

            Ospf::InterfaceOptions Router::ospfOptionsFor(const std::string &interface_name) const
            {
                auto it = ospf_options_.find(interface_name);
                if (it != ospf_options_.end())
                {
                    return it->second;
                }

                const auto &config = context_.config();
                Ospf::InterfaceOptions options;
                options.hello_interval = static_cast<uint16_t>(
                    NETSIM_CONFIG_GET_INT(config, Common::ConfigKeys::OSPF_HELLO_INTERVAL, Ospf::OspfConstants::HELLO_INTERVAL));
                options.dead_interval = static_cast<uint32_t>(
                    NETSIM_CONFIG_GET_INT(config, Common::ConfigKeys::OSPF_DEAD_INTERVAL, Ospf::OspfConstants::ROUTER_DEAD_INTERVAL));
                options.retransmit_interval = static_cast<uint16_t>(
                    NETSIM_CONFIG_GET_INT(config, Common::ConfigKeys::OSPF_RETRANSMIT_INTERVAL, Ospf::OspfConstants::RXMT_INTERVAL));
                options.transmit_delay = static_cast<uint16_t>(
                    NETSIM_CONFIG_GET_INT(config, Common::ConfigKeys::OSPF_TRANSMIT_DELAY, Ospf::OspfConstants::INF_TRANS_DELAY));
                return options;
            }

            void Router::activateOspf(const RouterInterface &iface)
            {
                if (!ospf_ || !iface.isUp() || ospf_->getInterface(iface.name) != nullptr)
                {
                    return;
                }
                auto area = ospf_->matchNetwork(iface.ip_address);
                if (!area)
                {
                    return;
                }
                ospf_->activateInterface(iface.name, iface.ip_address, iface.mask, *area, ospfOptionsFor(iface.name));
            }

            void Router::sendOspf(const std::string &interface_name, const Common::IPv4Address &destination,
                                  const Packet::OspfPacket &packet)
            {
                const RouterInterface *iface = getInterface(interface_name);
                if (iface == nullptr || !iface->isUp())
                {
                    return;
                }

                auto ip = Packet::PacketBuilder::buildIPv4Packet(iface->ip_address, destination,
                                                                 Packet::IpProtocol::OSPF, 1, packet);
                if (!ip)
                {
                    logger_->warn("{}: OSPF packet for {} exceeds IPv4 size, dropped", name_, interface_name);
                    return;
                }
                transmit(*iface, destination, *ip);
            }

            // ==================== Local traffic ====================

            bool Router::ping(const Common::IPv4Address &destination)
            {
                auto echo = Packet::PacketBuilder::createEchoRequest(ping_identifier_, ++ping_sequence_);

                if (ownsAddress(destination))
                {
                    auto reply = Packet::PacketBuilder::buildIPv4Packet(destination, destination, Packet::IpProtocol::ICMP,
                                                                        default_ttl_,
                                                                        Packet::PacketBuilder::createEchoReply(echo));
                    if (!reply)
                    {
                        return false;
                    }
                    received_packets_.push_back(*reply);
                    return true;
                }

                auto route = routing_table_.lookup(destination);
                const RouterInterface *egress = route ? getInterface(route->interface_name) : nullptr;
                if (egress == nullptr || !egress->isUp())
                {
                    logger_->debug("{}: ping {}: no route", name_, destination.toString());
                    return false;
                }

                auto packet = Packet::PacketBuilder::buildIPv4Packet(egress->ip_address, destination, Packet::IpProtocol::ICMP,
                                                                     default_ttl_, echo);
                if (!packet)
                {
                    return false;
                }
                transmit(*egress, route->next_hop.value_or(destination), *packet);
                return true;
            }

            bool Router::originate(const Packet::IPv4Packet &packet)
            {
                auto route = routing_table_.lookup(packet.destination());
                const RouterInterface *egress = route ? getInterface(route->interface_name) : nullptr;
                if (egress == nullptr || !egress->isUp())
                {
                    logger_->debug("{}: no route for locally originated packet to {}", name_,
                                   packet.destination().toString());
                    return false;
                }
                transmit(*egress, route->next_hop.value_or(packet.destination()), packet);
                return true;
            }

            void Router::transmit(const RouterInterface &egress, const Common::IPv4Address &next_hop,
                                  const Packet::IPv4Packet &packet)
            {
                const Common::IPv4Address &destination = packet.destination();
                if (destination.isMulticast())
                {
                    sendFrame(egress.name, Packet::PacketBuilder::createFrame(
                                               egress.mac, Common::MacAddress::fromMulticastIPv4(destination), packet));
                    return;
                }
                if (destination.isBroadcast() || destination == directedBroadcast(egress.ip_address, egress.mask))
                {
                    sendFrame(egress.name, Packet::PacketBuilder::createFrame(egress.mac, Common::MacAddress::broadcast(), packet));
                    return;
                }

                auto mac = arp_cache_.lookup(next_hop, context_.nowMs());
                if (mac)
                {
                    sendFrame(egress.name, Packet::PacketBuilder::createFrame(egress.mac, *mac, packet));
                    return;
                }

                ++stats_.arp_queued;
                if (arp_cache_.enqueue(next_hop, egress.name, packet))
                {
                    logger_->debug("{}: ARP who-has {} on {}", name_, next_hop.toString(), egress.name);
                    sendFrame(egress.name, Packet::PacketBuilder::createArpRequest(egress.mac, egress.ip_address, next_hop));
                }
            }

            // ==================== Receive path ====================

            void Router::receiveFrame(const std::string &port, const Packet::EthernetFrame &frame)
            {
                RouterInterface *iface = findInterface(port);
                if (iface == nullptr || !iface->enabled)
                {
                    return;
                }

                const Common::MacAddress &destination = frame.destination();
                if (destination != iface->mac && !destination.isBroadcast() && !destination.isMulticast())
                {
                    return;
                }

                if (const auto *arp = frame.arp())
                {
                    handleArp(*iface, *arp);
                }
                else if (const auto *packet = frame.ipv4())
                {
                    handleIPv4(*iface, frame.source(), *packet);
                }
            }

            void Router::handleArp(RouterInterface &iface, const Packet::ArpPacket &arp)
            {
                if (!iface.configured || !iface.mask.sameSubnet(iface.ip_address, arp.sender_ip) ||
                    arp.sender_ip.isUnspecified())
                {
                    return;
                }

                arp_cache_.insert(arp.sender_ip, arp.sender_mac, iface.name, context_.nowMs());
                for (const auto &pending : arp_cache_.takePending(arp.sender_ip))
                {
                    const RouterInterface *egress = getInterface(pending.interface_name);
                    if (egress != nullptr && egress->isUp())
                    {
                        sendFrame(egress->name, Packet::PacketBuilder::createFrame(egress->mac, arp.sender_mac, pending.packet));
                    }
                }

                if (arp.operation != Packet::ArpOperation::REQUEST)
                {
                    return;
                }

                // Trả lời cả các địa chỉ global mà NAT đang dịch trên interface outside
                if (arp.target_ip == iface.ip_address ||
                    (nat_.isOutside(iface.name) && nat_.isTranslatedGlobal(arp.target_ip)))
                {
                    sendFrame(iface.name, Packet::PacketBuilder::createArpReply(iface.mac, arp.target_ip,
                                                                                arp.sender_mac, arp.sender_ip));
                }
            }

            bool Router::isLocalDestination(const RouterInterface &ingress, const Common::IPv4Address &destination) const
            {
                if (ownsAddress(destination) || destination.isBroadcast() ||
                    destination == ALL_SPF_ROUTERS || destination == ALL_D_ROUTERS)
                {
                    return true;
                }
                return ingress.mask.prefixLength() < 31 && destination == directedBroadcast(ingress.ip_address, ingress.mask);
            }

            void Router::handleIPv4(RouterInterface &iface, const Common::MacAddress &previous_hop,
                                    const Packet::IPv4Packet &packet)
            {
                ++stats_.received;
                if (!iface.configured)
                {
                    return;
                }
                if (!Packet::verifyChecksum(packet))
                {
                    ++stats_.checksum_errors;
                    logger_->debug("{}: bad header checksum from {} on {}", name_, packet.source().toString(), iface.name);
                    return;
                }

                Packet::IPv4Packet current = packet;
                bool ingress_checked = false;

                // NAT outside -> inside
                if (nat_.isOutside(iface.name))
                {
                    auto outcome = nat_.translateIncoming(packet);
                    if (outcome.translated())
                    {
                        if (acl_.checkInterface(iface.name, Acl::Direction::IN, packet) == Acl::AclAction::DENY)
                        {
                            ++stats_.acl_denied;
                            logger_->debug("{}: {} -> {} denied inbound on {}", name_, packet.source().toString(),
                                           packet.destination().toString(), iface.name);
                            return;
                        }
                        ingress_checked = true;
                        current = *outcome.packet;
                    }
                }

                if (!ingress_checked && isLocalDestination(iface, current.destination()))
                {
                    deliverLocally(iface, current);
                    return;
                }
                if (current.destination().isMulticast() || current.destination().isBroadcast())
                {
                    return;
                }

                if (!ingress_checked &&
                    acl_.checkInterface(iface.name, Acl::Direction::IN, current) == Acl::AclAction::DENY)
                {
                    ++stats_.acl_denied;
                    logger_->debug("{}: {} -> {} denied inbound on {}", name_, current.source().toString(),
                                   current.destination().toString(), iface.name);
                    return;
                }

                if (current.ttl() <= 1)
                {
                    ++stats_.ttl_exceeded;
                    logger_->debug("{}: TTL expired for {} -> {}", name_, current.source().toString(),
                                   current.destination().toString());
                    sendIcmpError(iface, previous_hop, packet, Packet::IcmpType::TIME_EXCEEDED,
                                  Packet::IcmpCode::TTL_EXCEEDED_IN_TRANSIT);
                    return;
                }
                Packet::IPv4Packet forwarded = current.withTTL(static_cast<uint8_t>(current.ttl() - 1)).withChecksum();

                auto route = routing_table_.lookup(forwarded.destination());
                RouterInterface *egress = route ? findInterface(route->interface_name) : nullptr;
                if (egress == nullptr || !egress->isUp())
                {
                    ++stats_.no_route;
                    logger_->debug("{}: no route to {}", name_, forwarded.destination().toString());
                    sendIcmpError(iface, previous_hop, packet, Packet::IcmpType::DEST_UNREACHABLE,
                                  Packet::IcmpCode::NET_UNREACHABLE);
                    return;
                }

                // NAT inside -> outside
                if (nat_.isInside(iface.name) && nat_.isOutside(egress->name))
                {
                    auto outcome = nat_.translateOutgoing(forwarded, iface.name, egress->ip_address, acl_);
                    if (outcome.result == Nat::NatResult::MISS)
                    {
                        ++stats_.nat_miss;
                        logger_->debug("{}: NAT miss for {}", name_, forwarded.source().toString());
                        return;
                    }
                    if (outcome.translated())
                    {
                        forwarded = *outcome.packet;
                    }
                }

                if (acl_.checkInterface(egress->name, Acl::Direction::OUT, forwarded) == Acl::AclAction::DENY)
                {
                    ++stats_.acl_denied;
                    logger_->debug("{}: {} -> {} denied outbound on {}", name_, forwarded.source().toString(),
                                   forwarded.destination().toString(), egress->name);
                    return;
                }

                ++stats_.forwarded;
                transmit(*egress, route->next_hop.value_or(forwarded.destination()), forwarded);
            }

            void Router::deliverLocally(RouterInterface &iface, const Packet::IPv4Packet &packet)
            {
                ++stats_.delivered_locally;

                if (packet.protocol() == Packet::IpProtocol::OSPF)
                {
                    const auto *ospf = packet.payloadAs<Packet::OspfPacket>();
                    if (ospf != nullptr && ospf_)
                    {
                        ospf_->processPacket(iface.name, packet.source(), *ospf);
                    }
                    return;
                }

                const auto *icmp = packet.payloadAs<Packet::IcmpMessage>();
                if (icmp != nullptr && icmp->type == Packet::IcmpType::ECHO_REQUEST)
                {
                    Common::IPv4Address source = ownsAddress(packet.destination()) ? packet.destination() : iface.ip_address;
                    auto reply = Packet::PacketBuilder::buildIPv4Packet(source, packet.source(), Packet::IpProtocol::ICMP,
                                                                        default_ttl_,
                                                                        Packet::PacketBuilder::createEchoReply(*icmp));
                    if (reply && originate(*reply))
                    {
                        ++stats_.icmp_sent;
                    }
                    return;
                }

                received_packets_.push_back(packet);
            }

            void Router::sendIcmpError(const RouterInterface &ingress, const Common::MacAddress &previous_hop,
                                       const Packet::IPv4Packet &original, Packet::IcmpType type, uint8_t code)
            {
                if (!mayTriggerIcmpError(original))
                {
                    return;
                }

                auto error = Packet::PacketBuilder::buildIPv4Packet(ingress.ip_address, original.source(),
                                                                    Packet::IpProtocol::ICMP, default_ttl_,
                                                                    Packet::PacketBuilder::createIcmpError(type, code, original));
                if (!error)
                {
                    return;
                }
                ++stats_.icmp_sent;
                sendFrame(ingress.name, Packet::PacketBuilder::createFrame(ingress.mac, previous_hop, *error));
            }

        } // namespace L3
    }     // namespace Core
} // namespace NetSim
