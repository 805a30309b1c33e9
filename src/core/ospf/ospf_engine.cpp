// src/core/ospf/ospf_engine.cpp
#include "ospf_engine.hpp"
#include "dr_election.hpp"
#include "spf_calculator.hpp"
#include "../../common/logger.hpp"
#include "../../common/utils.hpp"
#include <algorithm>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            namespace
            {
                // Neighbor NBMA cấu hình tĩnh được lưu theo IP cho đến khi biết router ID
                Common::IPv4Address neighborKey(const OspfNeighbor &neighbor)
                {
                    return neighbor.router_id.isUnspecified() ? neighbor.ip_address : neighbor.router_id;
                }

                bool sameContent(const Packet::Lsa &a, const Packet::Lsa &b)
                {
                    if (a.header.options != b.header.options)
                    {
                        return false;
                    }
                    std::vector<uint8_t> bytes_a = a.serialize();
                    std::vector<uint8_t> bytes_b = b.serialize();
                    return bytes_a.size() == bytes_b.size() &&
                           std::equal(bytes_a.begin() + Packet::LSA_HEADER_SIZE, bytes_a.end(),
                                      bytes_b.begin() + Packet::LSA_HEADER_SIZE);
                }

                bool isDuplicateDD(const OspfNeighbor &neighbor, const Packet::OspfDatabaseDescription &dd)
                {
                    return neighbor.last_received_dd &&
                           neighbor.last_received_dd->flags == dd.flags &&
                           neighbor.last_received_dd->options == dd.options &&
                           neighbor.last_received_dd->sequence_number == dd.sequence_number;
                }
            }

            OspfEngine::OspfEngine(Sim::TimerScheduler &scheduler, const Common::IPv4Address &router_id)
                : scheduler_(scheduler),
                  router_id_(router_id),
                  logger_(NETSIM_GET_LOGGER("OSPF")),
                  flushing_(false),
                  shutting_down_(false),
                  spf_pending_(false),
                  next_dd_sequence_(1),
                  refresh_timer_(Sim::INVALID_TIMER)
            {
            }

            OspfEngine::~OspfEngine()
            {
                shutdown();
            }

            // ==================== Configuration ====================

            void OspfEngine::addNetwork(const Common::IPv4Address &network, const Common::WildcardMask &wildcard,
                                        const Common::IPv4Address &area_id)
            {
                networks_.push_back(NetworkStatement{network, wildcard, area_id});
                logger_->info("Router {}: network {} {} area {}", router_id_.toString(), network.toString(),
                              wildcard.toString(), area_id.toString());
            }

            std::optional<Common::IPv4Address> OspfEngine::matchNetwork(const Common::IPv4Address &ip) const
            {
                for (const auto &statement : networks_)
                {
                    if (statement.wildcard.matches(ip, statement.network))
                    {
                        return statement.area_id;
                    }
                }
                return std::nullopt;
            }

            bool OspfEngine::activateInterface(const std::string &name, const Common::IPv4Address &ip,
                                               const Common::SubnetMask &mask, const Common::IPv4Address &area_id,
                                               const InterfaceOptions &options)
            {
                if (interfaces_.count(name) > 0)
                {
                    logger_->warn("Router {}: interface {} already active", router_id_.toString(), name);
                    return false;
                }
                if (options.hello_interval == 0 || options.dead_interval == 0 || options.retransmit_interval == 0)
                {
                    logger_->warn("Router {}: invalid timers on {}", router_id_.toString(), name);
                    return false;
                }

                OspfInterface iface;
                iface.name = name;
                iface.ip_address = ip;
                iface.mask = mask;
                iface.area_id = area_id;
                iface.options = options;

                if (options.loopback)
                {
                    iface.state = InterfaceState::LOOPBACK;
                }
                else if (options.network_type == NetworkType::POINT_TO_POINT ||
                         options.network_type == NetworkType::POINT_TO_MULTIPOINT)
                {
                    iface.state = InterfaceState::POINT_TO_POINT;
                }
                else if (options.priority == 0)
                {
                    iface.state = InterfaceState::DR_OTHER;
                }
                else
                {
                    iface.state = InterfaceState::WAITING;
                }

                OspfInterface &active = interfaces_.emplace(name, iface).first->second;
                areas_[area_id];

                logger_->info("Router {}: {} active in area {} ({}, {})", router_id_.toString(), name,
                              area_id.toString(), networkTypeToString(options.network_type),
                              interfaceStateToString(active.state));

                if (!options.passive && !options.loopback)
                {
                    sendHello(active);
                    scheduleHello(active);

                    if (active.state == InterfaceState::WAITING)
                    {
                        active.wait_timer = scheduler_.schedule(
                            static_cast<uint64_t>(options.dead_interval) * 1000,
                            [this, name]()
                            { onWaitTimer(name); },
                            "ospf.wait " + name);
                    }
                }

                if (refresh_timer_ == Sim::INVALID_TIMER)
                {
                    refresh_timer_ = scheduler_.schedule(
                        static_cast<uint64_t>(OspfConstants::LS_REFRESH_TIME) * 1000,
                        [this]()
                        { onRefreshTimer(); },
                        "ospf.refresh");
                }

                dirty_areas_.insert(area_id);
                spf_pending_ = true;
                finishProcessing();
                return true;
            }

            bool OspfEngine::deactivateInterface(const std::string &name)
            {
                auto it = interfaces_.find(name);
                if (it == interfaces_.end())
                {
                    return false;
                }

                OspfInterface &iface = it->second;
                iface.state = InterfaceState::DOWN;
                for (auto &pair : iface.neighbors)
                {
                    handleEvent(iface, pair.second, NeighborEvent::KILL_NBR);
                    scheduler_.cancel(pair.second.inactivity_timer);
                }
                iface.neighbors.clear();

                scheduler_.cancel(iface.hello_timer);
                scheduler_.cancel(iface.wait_timer);

                Common::IPv4Address area_id = iface.area_id;
                originateNetworkLsas(area_id, false);
                interfaces_.erase(it);

                logger_->info("Router {}: {} removed from OSPF", router_id_.toString(), name);

                dirty_areas_.insert(area_id);
                spf_pending_ = true;
                finishProcessing();
                return true;
            }

            bool OspfEngine::addNBMANeighbor(const std::string &interface_name, const Common::IPv4Address &ip,
                                             uint8_t priority)
            {
                OspfInterface *iface = findInterface(interface_name);
                if (iface == nullptr || iface->options.network_type != NetworkType::NBMA)
                {
                    logger_->warn("Router {}: {} is not an NBMA OSPF interface", router_id_.toString(), interface_name);
                    return false;
                }
                for (const auto &pair : iface->neighbors)
                {
                    if (pair.second.ip_address == ip)
                    {
                        logger_->warn("Router {}: neighbor {} already configured", router_id_.toString(), ip.toString());
                        return false;
                    }
                }

                OspfNeighbor neighbor;
                neighbor.ip_address = ip;
                neighbor.interface_name = interface_name;
                neighbor.priority = priority;
                neighbor.configured = true;

                OspfNeighbor &stored = iface->neighbors.emplace(ip, neighbor).first->second;
                handleEvent(*iface, stored, NeighborEvent::START);
                sendHello(*iface);
                finishProcessing();
                return true;
            }

            // ==================== Packet processing ====================

            void OspfEngine::processPacket(const std::string &interface_name, const Common::IPv4Address &source,
                                           const Packet::OspfPacket &packet)
            {
                switch (packet.type())
                {
                case Packet::OspfPacketType::HELLO:
                    processHello(interface_name, source, packet);
                    break;
                case Packet::OspfPacketType::DATABASE_DESCRIPTION:
                    processDD(interface_name, source, packet);
                    break;
                case Packet::OspfPacketType::LINK_STATE_REQUEST:
                    processLSR(interface_name, source, packet);
                    break;
                case Packet::OspfPacketType::LINK_STATE_UPDATE:
                    processLSUpdate(interface_name, source, packet);
                    break;
                case Packet::OspfPacketType::LINK_STATE_ACK:
                    processLSAck(interface_name, source, packet);
                    break;
                }
            }

            bool OspfEngine::acceptPacket(const OspfInterface *iface, const Packet::OspfPacket &packet) const
            {
                if (iface == nullptr || iface->state == InterfaceState::DOWN || iface->state == InterfaceState::LOOPBACK ||
                    iface->options.passive)
                {
                    return false;
                }
                return packet.version == 2 && packet.router_id != router_id_ && packet.area_id == iface->area_id;
            }

            void OspfEngine::processHello(const std::string &interface_name, const Common::IPv4Address &source,
                                          const Packet::OspfPacket &packet)
            {
                OspfInterface *iface = findInterface(interface_name);
                if (packet.as<Packet::OspfHello>() == nullptr || !acceptPacket(iface, packet))
                {
                    if (iface != nullptr && packet.area_id != iface->area_id)
                    {
                        ++stats_.hello_mismatches;
                        logger_->debug("Router {}: hello on {} from area {} dropped", router_id_.toString(),
                                       interface_name, packet.area_id.toString());
                    }
                    return;
                }

                handleHello(*iface, source, packet);
                finishProcessing();
            }

            void OspfEngine::handleHello(OspfInterface &iface, const Common::IPv4Address &source,
                                         const Packet::OspfPacket &packet)
            {
                const auto &hello = *packet.as<Packet::OspfHello>();
                ++stats_.hellos_received;

                bool mask_mismatch = iface.isMultiAccess() && hello.network_mask != iface.mask;
                if (mask_mismatch || hello.hello_interval != iface.options.hello_interval ||
                    hello.router_dead_interval != iface.options.dead_interval)
                {
                    ++stats_.hello_mismatches;
                    logger_->debug("Router {}: hello parameter mismatch from {} on {}", router_id_.toString(),
                                   packet.router_id.toString(), iface.name);
                    return;
                }

                const Common::IPv4Address &rid = packet.router_id;
                OspfNeighbor *neighbor = findNeighbor(iface, rid);
                bool discovered = false;

                if (neighbor == nullptr)
                {
                    for (auto it = iface.neighbors.begin(); it != iface.neighbors.end(); ++it)
                    {
                        if (it->second.configured && it->second.router_id.isUnspecified() &&
                            it->second.ip_address == source)
                        {
                            auto node = iface.neighbors.extract(it);
                            node.key() = rid;
                            node.mapped().router_id = rid;
                            iface.neighbors.insert(std::move(node));
                            neighbor = findNeighbor(iface, rid);
                            break;
                        }
                    }
                }

                if (neighbor == nullptr)
                {
                    OspfNeighbor fresh;
                    fresh.router_id = rid;
                    fresh.ip_address = source;
                    fresh.interface_name = iface.name;
                    neighbor = &iface.neighbors.emplace(rid, fresh).first->second;
                    discovered = true;
                    logger_->debug("Router {}: new neighbor {} on {}", router_id_.toString(), rid.toString(), iface.name);
                }

                uint8_t old_priority = neighbor->priority;
                bool was_dr = neighbor->designated_router == source;
                bool was_bdr = neighbor->backup_designated_router == source;

                neighbor->ip_address = source;
                neighbor->priority = hello.router_priority;
                neighbor->designated_router = hello.designated_router;
                neighbor->backup_designated_router = hello.backup_designated_router;
                neighbor->last_hello_ms = nowMs();

                handleEvent(iface, *neighbor, NeighborEvent::HELLO_RECEIVED);

                bool listed = std::find(hello.neighbors.begin(), hello.neighbors.end(), router_id_) != hello.neighbors.end();
                if (!listed)
                {
                    handleEvent(iface, *neighbor, NeighborEvent::ONE_WAY);
                }
                else
                {
                    handleEvent(iface, *neighbor, NeighborEvent::TWO_WAY_RECEIVED);

                    if (iface.isMultiAccess())
                    {
                        bool declares_dr = hello.designated_router == source;
                        bool declares_bdr = hello.backup_designated_router == source;

                        if (iface.state == InterfaceState::WAITING &&
                            (declares_bdr || (declares_dr && hello.backup_designated_router.isUnspecified())))
                        {
                            // BackupSeen
                            scheduler_.cancel(iface.wait_timer);
                            iface.wait_timer = Sim::INVALID_TIMER;
                            electDesignatedRouter(iface);
                        }
                        else if (old_priority != hello.router_priority || was_dr != declares_dr || was_bdr != declares_bdr)
                        {
                            onNeighborChange(iface);
                        }
                    }
                }

                if (discovered)
                {
                    sendHello(iface);
                }
            }

            void OspfEngine::processDD(const std::string &interface_name, const Common::IPv4Address &source,
                                       const Packet::OspfPacket &packet)
            {
                (void)source;
                OspfInterface *iface = findInterface(interface_name);
                const auto *dd = packet.as<Packet::OspfDatabaseDescription>();
                if (dd == nullptr || !acceptPacket(iface, packet))
                {
                    return;
                }
                OspfNeighbor *neighbor = findNeighbor(*iface, packet.router_id);
                if (neighbor == nullptr)
                {
                    return;
                }

                handleDD(*iface, *neighbor, *dd);
                finishProcessing();
            }

            void OspfEngine::handleDD(OspfInterface &iface, OspfNeighbor &neighbor, const Packet::OspfDatabaseDescription &dd)
            {
                using Packet::DDFlags::INIT;
                using Packet::DDFlags::MASTER;
                using Packet::DDFlags::MORE;

                ++stats_.dd_received;

                if (neighbor.state == NeighborState::INIT)
                {
                    handleEvent(iface, neighbor, NeighborEvent::TWO_WAY_RECEIVED);
                }

                if (neighbor.state == NeighborState::EX_START)
                {
                    bool initial = dd.hasFlag(INIT) && dd.hasFlag(MORE) && dd.hasFlag(MASTER);
                    if (initial && dd.lsa_headers.empty() && router_id_ < neighbor.router_id)
                    {
                        // Neighbor là master: nhận sequence number của nó
                        neighbor.is_master = false;
                        neighbor.dd_sequence = dd.sequence_number;
                        handleEvent(iface, neighbor, NeighborEvent::NEGOTIATION_DONE);

                        scheduler_.cancel(neighbor.dd_retransmit_timer);
                        neighbor.dd_retransmit_timer = Sim::INVALID_TIMER;
                        neighbor.last_received_dd = dd;
                        sendNextDD(iface, neighbor);
                    }
                    else if (!dd.hasFlag(INIT) && !dd.hasFlag(MASTER) && dd.sequence_number == neighbor.dd_sequence &&
                             neighbor.router_id < router_id_)
                    {
                        neighbor.is_master = true;
                        handleEvent(iface, neighbor, NeighborEvent::NEGOTIATION_DONE);
                        acceptDD(iface, neighbor, dd);
                    }
                    return;
                }

                if (neighbor.state == NeighborState::EXCHANGE)
                {
                    if (isDuplicateDD(neighbor, dd))
                    {
                        if (!neighbor.is_master && neighbor.last_sent_dd)
                        {
                            sendPacket(iface, neighborDestination(iface, neighbor), *neighbor.last_sent_dd);
                            ++stats_.dd_sent;
                        }
                        return;
                    }

                    bool peer_claims_master = dd.hasFlag(MASTER);
                    if (peer_claims_master == neighbor.is_master || dd.hasFlag(INIT))
                    {
                        logger_->debug("Router {}: DD flag mismatch from {}", router_id_.toString(),
                                       neighbor.router_id.toString());
                        handleEvent(iface, neighbor, NeighborEvent::SEQ_NUMBER_MISMATCH);
                        return;
                    }

                    uint32_t expected = neighbor.is_master ? neighbor.dd_sequence : neighbor.dd_sequence + 1;
                    if (dd.sequence_number != expected)
                    {
                        logger_->debug("Router {}: DD sequence {} from {}, expected {}", router_id_.toString(),
                                       dd.sequence_number, neighbor.router_id.toString(), expected);
                        handleEvent(iface, neighbor, NeighborEvent::SEQ_NUMBER_MISMATCH);
                        return;
                    }

                    acceptDD(iface, neighbor, dd);
                    return;
                }

                if (neighbor.state == NeighborState::LOADING || neighbor.state == NeighborState::FULL)
                {
                    if (isDuplicateDD(neighbor, dd))
                    {
                        if (!neighbor.is_master && neighbor.last_sent_dd)
                        {
                            sendPacket(iface, neighborDestination(iface, neighbor), *neighbor.last_sent_dd);
                            ++stats_.dd_sent;
                        }
                        return;
                    }
                    handleEvent(iface, neighbor, NeighborEvent::SEQ_NUMBER_MISMATCH);
                }
            }

            void OspfEngine::acceptDD(OspfInterface &iface, OspfNeighbor &neighbor, const Packet::OspfDatabaseDescription &dd)
            {
                neighbor.last_received_dd = dd;

                const LinkStateDatabase &lsdb = areas_[iface.area_id];
                for (const auto &header : dd.lsa_headers)
                {
                    if (header.ls_type != Packet::LsaType::ROUTER && header.ls_type != Packet::LsaType::NETWORK)
                    {
                        handleEvent(iface, neighbor, NeighborEvent::SEQ_NUMBER_MISMATCH);
                        return;
                    }
                    auto ours = lsdb.lookupHeader(header.key(), nowMs());
                    if (!ours || isNewerLSA(header, *ours))
                    {
                        neighbor.request_list[header.key()] = header;
                    }
                }

                bool peer_more = dd.hasFlag(Packet::DDFlags::MORE);
                if (neighbor.is_master)
                {
                    ++neighbor.dd_sequence;
                    if (!neighbor.more_to_send && !peer_more)
                    {
                        scheduler_.cancel(neighbor.dd_retransmit_timer);
                        neighbor.dd_retransmit_timer = Sim::INVALID_TIMER;
                        handleEvent(iface, neighbor, NeighborEvent::EXCHANGE_DONE);
                    }
                    else
                    {
                        sendNextDD(iface, neighbor);
                        restartRetransmitTimer(iface, neighbor);
                    }
                }
                else
                {
                    neighbor.dd_sequence = dd.sequence_number;
                    sendNextDD(iface, neighbor);
                    if (!peer_more && !neighbor.more_to_send)
                    {
                        handleEvent(iface, neighbor, NeighborEvent::EXCHANGE_DONE);
                    }
                }
            }

            void OspfEngine::sendDD(OspfInterface &iface, OspfNeighbor &neighbor, uint8_t flags)
            {
                Packet::OspfDatabaseDescription dd;
                dd.sequence_number = neighbor.dd_sequence;

                if ((flags & Packet::DDFlags::INIT) != 0)
                {
                    neighbor.more_to_send = true;
                    flags |= Packet::DDFlags::MORE;
                }
                else
                {
                    while (!neighbor.summary_list.empty() && dd.lsa_headers.size() < OspfConstants::DD_MAX_HEADERS)
                    {
                        dd.lsa_headers.push_back(neighbor.summary_list.front());
                        neighbor.summary_list.pop_front();
                    }
                    neighbor.more_to_send = !neighbor.summary_list.empty();
                    if (neighbor.more_to_send)
                    {
                        flags |= Packet::DDFlags::MORE;
                    }
                }
                dd.flags = flags;

                neighbor.last_sent_dd = dd;
                ++stats_.dd_sent;
                sendPacket(iface, neighborDestination(iface, neighbor), dd);
            }

            void OspfEngine::sendNextDD(OspfInterface &iface, OspfNeighbor &neighbor)
            {
                sendDD(iface, neighbor, neighbor.is_master ? Packet::DDFlags::MASTER : 0);
            }

            void OspfEngine::sendLSR(OspfInterface &iface, OspfNeighbor &neighbor)
            {
                Packet::OspfLinkStateRequest request;
                for (const auto &pair : neighbor.request_list)
                {
                    request.requests.push_back(pair.first);
                }
                ++stats_.lsr_sent;
                sendPacket(iface, neighborDestination(iface, neighbor), request);
            }

            void OspfEngine::restartRetransmitTimer(OspfInterface &iface, OspfNeighbor &neighbor)
            {
                scheduler_.cancel(neighbor.dd_retransmit_timer);

                std::string name = iface.name;
                Common::IPv4Address key = neighborKey(neighbor);
                neighbor.dd_retransmit_timer = scheduler_.schedule(
                    static_cast<uint64_t>(iface.options.retransmit_interval) * 1000,
                    [this, name, key]()
                    { onRetransmitTimer(name, key); },
                    "ospf.rxmt " + key.toString());
            }

            void OspfEngine::onRetransmitTimer(const std::string &interface_name, const Common::IPv4Address &key)
            {
                OspfInterface *iface = findInterface(interface_name);
                OspfNeighbor *neighbor = iface ? findNeighbor(*iface, key) : nullptr;
                if (neighbor == nullptr)
                {
                    return;
                }
                neighbor->dd_retransmit_timer = Sim::INVALID_TIMER;

                bool resent = false;
                if ((neighbor->state == NeighborState::EX_START ||
                     (neighbor->state == NeighborState::EXCHANGE && neighbor->is_master)) &&
                    neighbor->last_sent_dd)
                {
                    sendPacket(*iface, neighborDestination(*iface, *neighbor), *neighbor->last_sent_dd);
                    ++stats_.dd_sent;
                    resent = true;
                }
                else if (neighbor->state == NeighborState::LOADING && !neighbor->request_list.empty())
                {
                    sendLSR(*iface, *neighbor);
                    resent = true;
                }

                if (resent)
                {
                    ++stats_.retransmissions;
                    restartRetransmitTimer(*iface, *neighbor);
                }
                finishProcessing();
            }

            void OspfEngine::processLSR(const std::string &interface_name, const Common::IPv4Address &source,
                                        const Packet::OspfPacket &packet)
            {
                (void)source;
                OspfInterface *iface = findInterface(interface_name);
                const auto *request = packet.as<Packet::OspfLinkStateRequest>();
                if (request == nullptr || !acceptPacket(iface, packet))
                {
                    return;
                }
                OspfNeighbor *neighbor = findNeighbor(*iface, packet.router_id);
                if (neighbor == nullptr || neighbor->state < NeighborState::EXCHANGE)
                {
                    return;
                }

                ++stats_.lsr_received;
                const LinkStateDatabase &lsdb = areas_[iface->area_id];

                std::vector<Packet::Lsa> lsas;
                bool bad_request = false;
                for (const auto &key : request->requests)
                {
                    auto lsa = lsdb.lookup(key, nowMs());
                    if (!lsa)
                    {
                        logger_->debug("Router {}: {} requested unknown LSA {}", router_id_.toString(),
                                       neighbor->router_id.toString(), key.toString());
                        bad_request = true;
                        break;
                    }
                    lsas.push_back(*lsa);
                }

                if (bad_request)
                {
                    handleEvent(*iface, *neighbor, NeighborEvent::BAD_LS_REQ);
                }
                else if (!lsas.empty())
                {
                    sendLSU(*iface, neighborDestination(*iface, *neighbor), lsas);
                }
                finishProcessing();
            }

            // ==================== Flooding ====================

            void OspfEngine::processLSUpdate(const std::string &interface_name, const Common::IPv4Address &source,
                                             const Packet::OspfPacket &packet)
            {
                (void)source;
                OspfInterface *iface = findInterface(interface_name);
                const auto *update = packet.as<Packet::OspfLinkStateUpdate>();
                if (update == nullptr || !acceptPacket(iface, packet))
                {
                    return;
                }
                OspfNeighbor *neighbor = findNeighbor(*iface, packet.router_id);
                if (neighbor == nullptr || neighbor->state < NeighborState::EXCHANGE)
                {
                    return;
                }

                ++stats_.lsu_received;
                const Common::IPv4Address area_id = iface->area_id;
                std::vector<Packet::LsaHeader> acks;

                for (const auto &lsa : update->lsas)
                {
                    if (!Packet::verifyLsaChecksum(lsa))
                    {
                        ++stats_.bad_lsa_checksums;
                        logger_->debug("Router {}: bad LSA checksum {} from {}", router_id_.toString(),
                                       lsa.header.key().toString(), neighbor->router_id.toString());
                        continue;
                    }
                    if (lsa.header.ls_type != Packet::LsaType::ROUTER && lsa.header.ls_type != Packet::LsaType::NETWORK)
                    {
                        continue;
                    }

                    const Packet::LsaKey key = lsa.header.key();
                    LinkStateDatabase &lsdb = areas_[area_id];
                    auto current = lsdb.lookupHeader(key, nowMs());

                    if (!current && lsa.header.ls_age >= OspfConstants::MAX_AGE)
                    {
                        acks.push_back(lsa.header);
                        continue;
                    }

                    if (!current || isNewerLSA(lsa.header, *current))
                    {
                        acks.push_back(lsa.header);
                        if (isSelfOriginated(lsa.header))
                        {
                            // Instance cũ của chính mình còn trong domain: vượt qua sequence của nó
                            lsdb.install(lsa, nowMs());
                            neighbor->request_list.erase(key);
                            if (key.type == Packet::LsaType::ROUTER)
                            {
                                originateRouterLsa(area_id, true);
                            }
                            else
                            {
                                originateNetworkLsas(area_id, true);
                            }
                            spf_pending_ = true;
                        }
                        else
                        {
                            installAndFlood(iface, neighbor, area_id, lsa);
                        }
                        continue;
                    }

                    if (neighbor->request_list.count(key) > 0)
                    {
                        handleEvent(*iface, *neighbor, NeighborEvent::BAD_LS_REQ);
                        break;
                    }

                    if (compareLsaInstances(lsa.header, *current) == 0)
                    {
                        // Implied acknowledgment
                        if (neighbor->retransmission_list.erase(key) == 0)
                        {
                            acks.push_back(lsa.header);
                        }
                        continue;
                    }

                    if (current->ls_age >= OspfConstants::MAX_AGE &&
                        current->sequence_number == OspfConstants::MAX_SEQUENCE_NUMBER)
                    {
                        // Không ack: neighbor gửi lại sau khi instance cũ đã bị gỡ
                        continue;
                    }

                    auto ours = lsdb.lookup(key, nowMs());
                    if (ours)
                    {
                        sendLSU(*iface, neighborDestination(*iface, *neighbor), {*ours});
                    }
                }

                if (!acks.empty())
                {
                    sendAck(*iface, neighborDestination(*iface, *neighbor), acks);
                }
                if (neighbor->state == NeighborState::LOADING && neighbor->request_list.empty())
                {
                    handleEvent(*iface, *neighbor, NeighborEvent::LOADING_DONE);
                }
                finishProcessing();
            }

            void OspfEngine::installAndFlood(OspfInterface *from_iface, const OspfNeighbor *from_neighbor,
                                             const Common::IPv4Address &area_id, const Packet::Lsa &lsa)
            {
                LinkStateDatabase &lsdb = areas_[area_id];
                if (lsdb.install(lsa, nowMs()))
                {
                    spf_pending_ = true;
                }

                const Packet::LsaKey key = lsa.header.key();
                std::vector<std::pair<OspfInterface *, OspfNeighbor *>> loaded;

                for (auto &iface_pair : interfaces_)
                {
                    OspfInterface &iface = iface_pair.second;
                    if (iface.area_id != area_id || iface.state == InterfaceState::DOWN)
                    {
                        continue;
                    }

                    for (auto &neighbor_pair : iface.neighbors)
                    {
                        OspfNeighbor &neighbor = neighbor_pair.second;
                        neighbor.retransmission_list.erase(key);
                        if (neighbor.state < NeighborState::EXCHANGE)
                        {
                            continue;
                        }

                        auto request = neighbor.request_list.find(key);
                        if (request != neighbor.request_list.end())
                        {
                            int order = compareLsaInstances(lsa.header, request->second);
                            if (order < 0)
                            {
                                continue;
                            }
                            neighbor.request_list.erase(request);
                            if (neighbor.state == NeighborState::LOADING && neighbor.request_list.empty())
                            {
                                loaded.emplace_back(&iface, &neighbor);
                            }
                            if (order == 0)
                            {
                                continue;
                            }
                        }

                        if (&neighbor == from_neighbor)
                        {
                            continue;
                        }
                        if (&iface == from_iface && iface.state == InterfaceState::BACKUP)
                        {
                            continue;
                        }

                        addToRetransmissionList(iface, neighbor, lsa);
                        sendLSU(iface, neighborDestination(iface, neighbor), {lsa});
                    }
                }

                for (const auto &pair : loaded)
                {
                    handleEvent(*pair.first, *pair.second, NeighborEvent::LOADING_DONE);
                }
            }

            void OspfEngine::addToRetransmissionList(OspfInterface &iface, OspfNeighbor &neighbor, const Packet::Lsa &lsa)
            {
                neighbor.retransmission_list[lsa.header.key()] = lsa;
                if (!scheduler_.isPending(neighbor.lsu_retransmit_timer))
                {
                    scheduleLsuRetransmit(iface, neighbor);
                }
            }

            void OspfEngine::scheduleLsuRetransmit(OspfInterface &iface, OspfNeighbor &neighbor)
            {
                std::string name = iface.name;
                Common::IPv4Address key = neighborKey(neighbor);
                neighbor.lsu_retransmit_timer = scheduler_.schedule(
                    static_cast<uint64_t>(iface.options.retransmit_interval) * 1000,
                    [this, name, key]()
                    { onLsuRetransmitTimer(name, key); },
                    "ospf.lsu-rxmt " + key.toString());
            }

            void OspfEngine::onLsuRetransmitTimer(const std::string &interface_name, const Common::IPv4Address &key)
            {
                OspfInterface *iface = findInterface(interface_name);
                OspfNeighbor *neighbor = iface ? findNeighbor(*iface, key) : nullptr;
                if (neighbor == nullptr)
                {
                    return;
                }
                neighbor->lsu_retransmit_timer = Sim::INVALID_TIMER;
                if (neighbor->state < NeighborState::EXCHANGE || neighbor->retransmission_list.empty())
                {
                    return;
                }

                std::vector<Packet::Lsa> lsas;
                for (const auto &pair : neighbor->retransmission_list)
                {
                    lsas.push_back(pair.second);
                }
                sendLSU(*iface, neighborDestination(*iface, *neighbor), lsas);
                ++stats_.retransmissions;
                scheduleLsuRetransmit(*iface, *neighbor);
                finishProcessing();
            }

            void OspfEngine::processLSAck(const std::string &interface_name, const Common::IPv4Address &source,
                                          const Packet::OspfPacket &packet)
            {
                (void)source;
                OspfInterface *iface = findInterface(interface_name);
                const auto *ack = packet.as<Packet::OspfLinkStateAck>();
                if (ack == nullptr || !acceptPacket(iface, packet))
                {
                    return;
                }
                OspfNeighbor *neighbor = findNeighbor(*iface, packet.router_id);
                if (neighbor == nullptr || neighbor->state < NeighborState::EXCHANGE)
                {
                    return;
                }

                ++stats_.acks_received;
                for (const auto &header : ack->lsa_headers)
                {
                    auto it = neighbor->retransmission_list.find(header.key());
                    if (it != neighbor->retransmission_list.end() && compareLsaInstances(header, it->second.header) == 0)
                    {
                        neighbor->retransmission_list.erase(it);
                    }
                }

                if (neighbor->retransmission_list.empty())
                {
                    scheduler_.cancel(neighbor->lsu_retransmit_timer);
                    neighbor->lsu_retransmit_timer = Sim::INVALID_TIMER;
                }
                finishProcessing();
            }

            void OspfEngine::purgeWrappedLsas()
            {
                for (auto &area_pair : areas_)
                {
                    const Common::IPv4Address &area_id = area_pair.first;
                    auto in_flight = [this, &area_id](const Packet::LsaKey &key)
                    {
                        for (const auto &iface_pair : interfaces_)
                        {
                            if (iface_pair.second.area_id != area_id)
                            {
                                continue;
                            }
                            for (const auto &neighbor_pair : iface_pair.second.neighbors)
                            {
                                const OspfNeighbor &neighbor = neighbor_pair.second;
                                if (neighbor.state == NeighborState::EXCHANGE || neighbor.state == NeighborState::LOADING ||
                                    neighbor.retransmission_list.count(key) > 0)
                                {
                                    return true;
                                }
                            }
                        }
                        return false;
                    };

                    for (const auto &header : area_pair.second.getHeaders(nowMs()))
                    {
                        if (header.sequence_number != OspfConstants::MAX_SEQUENCE_NUMBER ||
                            header.ls_age < OspfConstants::MAX_AGE || in_flight(header.key()))
                        {
                            continue;
                        }

                        area_pair.second.remove(header.key());
                        spf_pending_ = true;
                        logger_->debug("Router {}: {} purged from LSDB", router_id_.toString(), header.key().toString());
                        if (isSelfOriginated(header))
                        {
                            dirty_areas_.insert(area_id);
                        }
                    }
                }
            }

            void OspfEngine::sendLSU(OspfInterface &iface, const Common::IPv4Address &destination,
                                     std::vector<Packet::Lsa> lsas)
            {
                for (auto &lsa : lsas)
                {
                    uint32_t age = static_cast<uint32_t>(lsa.header.ls_age) + iface.options.transmit_delay;
                    lsa.header.ls_age = static_cast<uint16_t>(std::min<uint32_t>(age, OspfConstants::MAX_AGE));
                }

                Packet::OspfLinkStateUpdate update;
                update.lsas = std::move(lsas);
                ++stats_.lsu_sent;
                sendPacket(iface, destination, update);
            }

            void OspfEngine::sendAck(OspfInterface &iface, const Common::IPv4Address &destination,
                                     const std::vector<Packet::LsaHeader> &headers)
            {
                Packet::OspfLinkStateAck ack;
                ack.lsa_headers = headers;
                ++stats_.acks_sent;
                sendPacket(iface, destination, ack);
            }

            bool OspfEngine::isSelfOriginated(const Packet::LsaHeader &header) const
            {
                if (header.advertising_router == router_id_)
                {
                    return true;
                }
                if (header.ls_type == Packet::LsaType::NETWORK)
                {
                    for (const auto &pair : interfaces_)
                    {
                        if (pair.second.ip_address == header.link_state_id)
                        {
                            return true;
                        }
                    }
                }
                return false;
            }

            // ==================== Neighbor state machine ====================

            void OspfEngine::handleEvent(OspfInterface &iface, OspfNeighbor &neighbor, NeighborEvent event)
            {
                switch (event)
                {
                case NeighborEvent::HELLO_RECEIVED:
                    if (neighbor.state == NeighborState::DOWN || neighbor.state == NeighborState::ATTEMPT)
                    {
                        setState(iface, neighbor, NeighborState::INIT, event);
                    }
                    restartInactivityTimer(iface, neighbor);
                    break;

                case NeighborEvent::START:
                    if (neighbor.state == NeighborState::DOWN)
                    {
                        setState(iface, neighbor, NeighborState::ATTEMPT, event);
                        restartInactivityTimer(iface, neighbor);
                    }
                    break;

                case NeighborEvent::TWO_WAY_RECEIVED:
                    if (neighbor.state == NeighborState::INIT)
                    {
                        if (shouldBeAdjacent(iface, neighbor))
                        {
                            setState(iface, neighbor, NeighborState::EX_START, event);
                            startExStart(iface, neighbor);
                        }
                        else
                        {
                            setState(iface, neighbor, NeighborState::TWO_WAY, event);
                        }
                    }
                    break;

                case NeighborEvent::NEGOTIATION_DONE:
                    if (neighbor.state == NeighborState::EX_START)
                    {
                        setState(iface, neighbor, NeighborState::EXCHANGE, event);
                        neighbor.summary_list.clear();
                        for (const auto &header : areas_[iface.area_id].getHeaders(nowMs()))
                        {
                            if (header.ls_age < OspfConstants::MAX_AGE)
                            {
                                neighbor.summary_list.push_back(header);
                            }
                        }
                    }
                    break;

                case NeighborEvent::EXCHANGE_DONE:
                    if (neighbor.state == NeighborState::EXCHANGE)
                    {
                        if (neighbor.request_list.empty())
                        {
                            setState(iface, neighbor, NeighborState::FULL, event);
                        }
                        else
                        {
                            setState(iface, neighbor, NeighborState::LOADING, event);
                            sendLSR(iface, neighbor);
                            restartRetransmitTimer(iface, neighbor);
                        }
                    }
                    break;

                case NeighborEvent::LOADING_DONE:
                    if (neighbor.state == NeighborState::LOADING)
                    {
                        setState(iface, neighbor, NeighborState::FULL, event);
                    }
                    break;

                case NeighborEvent::ADJ_OK:
                    if (neighbor.state == NeighborState::TWO_WAY && shouldBeAdjacent(iface, neighbor))
                    {
                        setState(iface, neighbor, NeighborState::EX_START, event);
                        startExStart(iface, neighbor);
                    }
                    else if (neighbor.state >= NeighborState::EX_START && !shouldBeAdjacent(iface, neighbor))
                    {
                        clearAdjacency(neighbor);
                        setState(iface, neighbor, NeighborState::TWO_WAY, event);
                    }
                    break;

                case NeighborEvent::SEQ_NUMBER_MISMATCH:
                case NeighborEvent::BAD_LS_REQ:
                    if (neighbor.state >= NeighborState::EXCHANGE)
                    {
                        clearAdjacency(neighbor);
                        setState(iface, neighbor, NeighborState::EX_START, event);
                        startExStart(iface, neighbor);
                    }
                    break;

                case NeighborEvent::ONE_WAY:
                    if (neighbor.state >= NeighborState::TWO_WAY)
                    {
                        clearAdjacency(neighbor);
                        setState(iface, neighbor, NeighborState::INIT, event);
                    }
                    break;

                case NeighborEvent::KILL_NBR:
                case NeighborEvent::LL_DOWN:
                case NeighborEvent::INACTIVITY_TIMER:
                    clearAdjacency(neighbor);
                    scheduler_.cancel(neighbor.inactivity_timer);
                    neighbor.inactivity_timer = Sim::INVALID_TIMER;
                    setState(iface, neighbor, NeighborState::DOWN, event);
                    break;
                }
            }

            void OspfEngine::setState(OspfInterface &iface, OspfNeighbor &neighbor, NeighborState state, NeighborEvent event)
            {
                NeighborState old_state = neighbor.state;
                if (old_state == state)
                {
                    return;
                }
                neighbor.state = state;

                std::string entry = "OSPF: Neighbor " + neighborKey(neighbor).toString() + " (" + iface.name + "): " +
                                    neighborStateToString(old_state) + " -> " + neighborStateToString(state) +
                                    " (" + neighborEventToString(event) + ")";
                event_log_.push_back(entry);
                logger_->info("Router {}: {}", router_id_.toString(), entry);

                if (state == NeighborState::FULL)
                {
                    scheduler_.cancel(neighbor.dd_retransmit_timer);
                    neighbor.dd_retransmit_timer = Sim::INVALID_TIMER;
                    neighbor.summary_list.clear();
                }

                if ((old_state == NeighborState::FULL) != (state == NeighborState::FULL))
                {
                    dirty_areas_.insert(iface.area_id);
                    spf_pending_ = true;
                }

                if ((old_state >= NeighborState::TWO_WAY) != (state >= NeighborState::TWO_WAY))
                {
                    onNeighborChange(iface);
                }
            }

            bool OspfEngine::shouldBeAdjacent(const OspfInterface &iface, const OspfNeighbor &neighbor) const
            {
                if (!iface.isMultiAccess())
                {
                    return true;
                }
                if (iface.designated_router == iface.ip_address || iface.backup_designated_router == iface.ip_address)
                {
                    return true;
                }
                return neighbor.ip_address == iface.designated_router ||
                       neighbor.ip_address == iface.backup_designated_router;
            }

            void OspfEngine::startExStart(OspfInterface &iface, OspfNeighbor &neighbor)
            {
                neighbor.dd_sequence = neighbor.dd_sequence == 0 ? next_dd_sequence_++ : neighbor.dd_sequence + 1;
                neighbor.is_master = true;
                neighbor.summary_list.clear();
                neighbor.last_received_dd.reset();

                sendDD(iface, neighbor, Packet::DDFlags::INIT | Packet::DDFlags::MASTER);
                restartRetransmitTimer(iface, neighbor);
            }

            void OspfEngine::clearAdjacency(OspfNeighbor &neighbor)
            {
                neighbor.request_list.clear();
                neighbor.retransmission_list.clear();
                neighbor.summary_list.clear();
                neighbor.last_sent_dd.reset();
                neighbor.last_received_dd.reset();
                neighbor.more_to_send = false;

                scheduler_.cancel(neighbor.dd_retransmit_timer);
                scheduler_.cancel(neighbor.lsu_retransmit_timer);
                neighbor.dd_retransmit_timer = Sim::INVALID_TIMER;
                neighbor.lsu_retransmit_timer = Sim::INVALID_TIMER;
            }

            void OspfEngine::restartInactivityTimer(OspfInterface &iface, OspfNeighbor &neighbor)
            {
                scheduler_.cancel(neighbor.inactivity_timer);

                std::string name = iface.name;
                Common::IPv4Address key = neighborKey(neighbor);
                neighbor.inactivity_timer = scheduler_.schedule(
                    static_cast<uint64_t>(iface.options.dead_interval) * 1000,
                    [this, name, key]()
                    {
                        OspfInterface *owner = findInterface(name);
                        OspfNeighbor *expired = owner ? findNeighbor(*owner, key) : nullptr;
                        if (expired == nullptr)
                        {
                            return;
                        }
                        expired->inactivity_timer = Sim::INVALID_TIMER;
                        handleEvent(*owner, *expired, NeighborEvent::INACTIVITY_TIMER);
                        if (!expired->configured)
                        {
                            removeNeighbor(*owner, key);
                        }
                        finishProcessing();
                    },
                    "ospf.inactivity " + key.toString());
            }

            void OspfEngine::removeNeighbor(OspfInterface &iface, const Common::IPv4Address &key)
            {
                auto it = iface.neighbors.find(key);
                if (it == iface.neighbors.end())
                {
                    return;
                }
                scheduler_.cancel(it->second.inactivity_timer);
                scheduler_.cancel(it->second.dd_retransmit_timer);
                scheduler_.cancel(it->second.lsu_retransmit_timer);
                iface.neighbors.erase(it);
                logger_->debug("Router {}: neighbor {} on {} removed", router_id_.toString(), key.toString(), iface.name);
            }

            // ==================== Interface state machine ====================

            void OspfEngine::onNeighborChange(OspfInterface &iface)
            {
                if (iface.state == InterfaceState::DR_OTHER || iface.state == InterfaceState::BACKUP ||
                    iface.state == InterfaceState::DR)
                {
                    electDesignatedRouter(iface);
                }
            }

            void OspfEngine::onWaitTimer(const std::string &interface_name)
            {
                OspfInterface *iface = findInterface(interface_name);
                if (iface == nullptr)
                {
                    return;
                }
                iface->wait_timer = Sim::INVALID_TIMER;
                if (iface->state == InterfaceState::WAITING)
                {
                    electDesignatedRouter(*iface);
                }
                finishProcessing();
            }

            void OspfEngine::electDesignatedRouter(OspfInterface &iface)
            {
                ElectionCandidate self;
                self.router_id = router_id_;
                self.ip_address = iface.ip_address;
                self.priority = iface.options.priority;
                self.declared_dr = iface.designated_router;
                self.declared_bdr = iface.backup_designated_router;

                std::vector<ElectionCandidate> candidates;
                for (const auto &pair : iface.neighbors)
                {
                    const OspfNeighbor &neighbor = pair.second;
                    if (neighbor.state < NeighborState::TWO_WAY)
                    {
                        continue;
                    }
                    ElectionCandidate candidate;
                    candidate.router_id = neighbor.router_id;
                    candidate.ip_address = neighbor.ip_address;
                    candidate.priority = neighbor.priority;
                    candidate.declared_dr = neighbor.designated_router;
                    candidate.declared_bdr = neighbor.backup_designated_router;
                    candidates.push_back(candidate);
                }

                ElectionResult result = DrElection::elect(self, candidates);

                InterfaceState old_state = iface.state;
                bool changed = result.designated_router != iface.designated_router ||
                               result.backup_designated_router != iface.backup_designated_router;

                iface.designated_router = result.designated_router;
                iface.backup_designated_router = result.backup_designated_router;
                if (result.designated_router == iface.ip_address)
                {
                    iface.state = InterfaceState::DR;
                }
                else if (result.backup_designated_router == iface.ip_address)
                {
                    iface.state = InterfaceState::BACKUP;
                }
                else
                {
                    iface.state = InterfaceState::DR_OTHER;
                }

                if (!changed && old_state != InterfaceState::WAITING)
                {
                    return;
                }

                logger_->info("Router {}: {} DR {} BDR {} ({})", router_id_.toString(), iface.name,
                              iface.designated_router.toString(), iface.backup_designated_router.toString(),
                              interfaceStateToString(iface.state));

                for (auto &pair : iface.neighbors)
                {
                    if (pair.second.state >= NeighborState::TWO_WAY)
                    {
                        handleEvent(iface, pair.second, NeighborEvent::ADJ_OK);
                    }
                }
                dirty_areas_.insert(iface.area_id);
            }

            // ==================== Origination, SPF ====================

            void OspfEngine::originateRouterLsa(const Common::IPv4Address &area_id, bool force)
            {
                Packet::RouterLsaBody body;

                for (const auto &pair : interfaces_)
                {
                    const OspfInterface &iface = pair.second;
                    if (iface.area_id != area_id || iface.state == InterfaceState::DOWN)
                    {
                        continue;
                    }

                    Packet::RouterLink stub;
                    stub.type = Packet::RouterLinkType::STUB;
                    stub.link_id = iface.mask.networkOf(iface.ip_address);
                    stub.link_data = Common::IPv4Address(iface.mask.toUint32());
                    stub.metric = iface.options.cost;

                    if (iface.state == InterfaceState::LOOPBACK)
                    {
                        stub.link_id = iface.ip_address;
                        stub.link_data = Common::IPv4Address::broadcast();
                        stub.metric = 0;
                        body.links.push_back(stub);
                        continue;
                    }

                    if (iface.options.passive)
                    {
                        body.links.push_back(stub);
                        continue;
                    }

                    if (!iface.isMultiAccess())
                    {
                        for (const auto &neighbor_pair : iface.neighbors)
                        {
                            const OspfNeighbor &neighbor = neighbor_pair.second;
                            if (neighbor.state == NeighborState::FULL)
                            {
                                Packet::RouterLink link;
                                link.type = Packet::RouterLinkType::POINT_TO_POINT;
                                link.link_id = neighbor.router_id;
                                link.link_data = iface.ip_address;
                                link.metric = iface.options.cost;
                                body.links.push_back(link);
                            }
                        }
                        body.links.push_back(stub);
                        continue;
                    }

                    bool transit = false;
                    if (iface.state != InterfaceState::WAITING && !iface.designated_router.isUnspecified())
                    {
                        for (const auto &neighbor_pair : iface.neighbors)
                        {
                            const OspfNeighbor &neighbor = neighbor_pair.second;
                            if (neighbor.state != NeighborState::FULL)
                            {
                                continue;
                            }
                            if (iface.state == InterfaceState::DR || neighbor.ip_address == iface.designated_router)
                            {
                                transit = true;
                                break;
                            }
                        }
                    }

                    if (transit)
                    {
                        Packet::RouterLink link;
                        link.type = Packet::RouterLinkType::TRANSIT;
                        link.link_id = iface.designated_router;
                        link.link_data = iface.ip_address;
                        link.metric = iface.options.cost;
                        body.links.push_back(link);
                    }
                    else
                    {
                        body.links.push_back(stub);
                    }
                }

                Packet::Lsa lsa;
                lsa.header.ls_type = Packet::LsaType::ROUTER;
                lsa.header.link_state_id = router_id_;
                lsa.header.advertising_router = router_id_;
                lsa.body = body;
                originate(area_id, lsa, force);
            }

            void OspfEngine::originateNetworkLsas(const Common::IPv4Address &area_id, bool force)
            {
                for (const auto &pair : interfaces_)
                {
                    const OspfInterface &iface = pair.second;
                    if (iface.area_id != area_id || !iface.isMultiAccess())
                    {
                        continue;
                    }

                    Packet::NetworkLsaBody body;
                    body.network_mask = iface.mask;
                    if (iface.state == InterfaceState::DR)
                    {
                        for (const auto &neighbor_pair : iface.neighbors)
                        {
                            if (neighbor_pair.second.state == NeighborState::FULL)
                            {
                                body.attached_routers.push_back(neighbor_pair.second.router_id);
                            }
                        }
                    }

                    Packet::LsaKey key{Packet::LsaType::NETWORK, iface.ip_address, router_id_};
                    if (!body.attached_routers.empty())
                    {
                        body.attached_routers.insert(body.attached_routers.begin(), router_id_);

                        Packet::Lsa lsa;
                        lsa.header.ls_type = Packet::LsaType::NETWORK;
                        lsa.header.link_state_id = iface.ip_address;
                        lsa.header.advertising_router = router_id_;
                        lsa.body = body;
                        originate(area_id, lsa, force);
                        continue;
                    }

                    // Không còn là DR (hoặc không còn neighbor Full): flush Network-LSA cũ
                    auto existing = areas_[area_id].lookup(key, nowMs());
                    if (existing && existing->header.ls_age < OspfConstants::MAX_AGE)
                    {
                        existing->header.ls_age = OspfConstants::MAX_AGE;
                        installAndFlood(nullptr, nullptr, area_id, *existing);
                        logger_->debug("Router {}: flushing Network-LSA {}", router_id_.toString(), key.toString());
                    }
                }
            }

            void OspfEngine::originate(const Common::IPv4Address &area_id, const Packet::Lsa &lsa, bool force)
            {
                auto current = areas_[area_id].lookup(lsa.header.key(), nowMs());
                if (current && current->header.sequence_number == OspfConstants::MAX_SEQUENCE_NUMBER)
                {
                    // RFC 2328 §12.1.6: flush instance MaxSequenceNumber, originate lại từ
                    // InitialSequenceNumber sau khi purgeWrappedLsas() gỡ nó khỏi LSDB
                    if (current->header.ls_age < OspfConstants::MAX_AGE)
                    {
                        Packet::Lsa aged = *current;
                        aged.header.ls_age = OspfConstants::MAX_AGE;
                        logger_->info("Router {}: {} reached max sequence number, flushing",
                                      router_id_.toString(), aged.header.key().toString());
                        installAndFlood(nullptr, nullptr, area_id, aged);
                    }
                    return;
                }
                if (current && !force && current->header.ls_age < OspfConstants::MAX_AGE && sameContent(*current, lsa))
                {
                    return;
                }

                Packet::Lsa fresh = lsa;
                fresh.header.ls_age = 0;
                fresh.header.sequence_number = current ? current->header.sequence_number + 1
                                                       : OspfConstants::INITIAL_SEQUENCE_NUMBER;
                fresh = Packet::finalizeLsa(fresh);

                logger_->debug("Router {}: originating {} seq 0x{:08x}", router_id_.toString(),
                               fresh.header.key().toString(), fresh.header.sequence_number);
                installAndFlood(nullptr, nullptr, area_id, fresh);
            }

            void OspfEngine::onRefreshTimer()
            {
                refresh_timer_ = scheduler_.schedule(
                    static_cast<uint64_t>(OspfConstants::LS_REFRESH_TIME) * 1000,
                    [this]()
                    { onRefreshTimer(); },
                    "ospf.refresh");

                for (const auto &pair : areas_)
                {
                    originateRouterLsa(pair.first, true);
                    originateNetworkLsas(pair.first, true);
                }
                finishProcessing();
            }

            void OspfEngine::runSpf()
            {
                spf_pending_ = false;
                ++stats_.spf_runs;

                std::map<std::pair<uint32_t, uint32_t>, L3::Route> best;
                for (const auto &area : areas_)
                {
                    std::vector<SpfInterface> local;
                    for (const auto &pair : interfaces_)
                    {
                        const OspfInterface &iface = pair.second;
                        if (iface.area_id == area.first && iface.state != InterfaceState::DOWN)
                        {
                            local.push_back(SpfInterface{iface.name, iface.ip_address, iface.mask});
                        }
                    }

                    for (const auto &route : SpfCalculator::calculate(router_id_, area.second.getAll(nowMs()), local))
                    {
                        auto key = std::make_pair(route.network.toUint32(), route.mask.toUint32());
                        auto it = best.find(key);
                        if (it == best.end() || route.metric < it->second.metric)
                        {
                            best[key] = route;
                        }
                    }
                }

                routes_.clear();
                for (const auto &pair : best)
                {
                    routes_.push_back(pair.second);
                }

                logger_->debug("Router {}: SPF run #{}, {} routes", router_id_.toString(), stats_.spf_runs, routes_.size());
                if (route_callback_)
                {
                    route_callback_(routes_);
                }
            }

            // ==================== Output ====================

            void OspfEngine::sendHello(OspfInterface &iface)
            {
                if (iface.options.passive || iface.state == InterfaceState::LOOPBACK || iface.state == InterfaceState::DOWN)
                {
                    return;
                }

                Packet::OspfHello hello;
                hello.network_mask = iface.mask;
                hello.hello_interval = iface.options.hello_interval;
                hello.router_priority = iface.options.priority;
                hello.router_dead_interval = iface.options.dead_interval;
                hello.designated_router = iface.designated_router;
                hello.backup_designated_router = iface.backup_designated_router;
                for (const auto &pair : iface.neighbors)
                {
                    if (pair.second.state >= NeighborState::INIT)
                    {
                        hello.neighbors.push_back(pair.second.router_id);
                    }
                }

                if (iface.options.network_type == NetworkType::NBMA)
                {
                    for (const auto &pair : iface.neighbors)
                    {
                        ++stats_.hellos_sent;
                        sendPacket(iface, pair.second.ip_address, hello);
                    }
                    return;
                }

                ++stats_.hellos_sent;
                sendPacket(iface, Common::IPv4Address(OspfConstants::ALL_SPF_ROUTERS), hello);
            }

            void OspfEngine::scheduleHello(OspfInterface &iface)
            {
                std::string name = iface.name;
                iface.hello_timer = scheduler_.schedule(
                    static_cast<uint64_t>(iface.options.hello_interval) * 1000,
                    [this, name]()
                    {
                        OspfInterface *owner = findInterface(name);
                        if (owner == nullptr)
                        {
                            return;
                        }
                        sendHello(*owner);
                        scheduleHello(*owner);
                        finishProcessing();
                    },
                    "ospf.hello " + name);
            }

            void OspfEngine::sendPacket(const OspfInterface &iface, const Common::IPv4Address &destination,
                                        Packet::OspfBody body)
            {
                Packet::OspfPacket packet;
                packet.router_id = router_id_;
                packet.area_id = iface.area_id;
                packet.body = std::move(body);
                outbox_.push_back(OutgoingPacket{iface.name, destination, std::move(packet)});
            }

            Common::IPv4Address OspfEngine::neighborDestination(const OspfInterface &iface, const OspfNeighbor &neighbor) const
            {
                if (iface.options.network_type == NetworkType::POINT_TO_POINT)
                {
                    return Common::IPv4Address(OspfConstants::ALL_SPF_ROUTERS);
                }
                return neighbor.ip_address;
            }

            void OspfEngine::finishProcessing()
            {
                if (shutting_down_)
                {
                    outbox_.clear();
                    return;
                }

                purgeWrappedLsas();
                while (!dirty_areas_.empty())
                {
                    Common::IPv4Address area_id = *dirty_areas_.begin();
                    dirty_areas_.erase(dirty_areas_.begin());
                    originateRouterLsa(area_id, false);
                    originateNetworkLsas(area_id, false);
                }

                if (spf_pending_)
                {
                    runSpf();
                }
                flush();
            }

            void OspfEngine::flush()
            {
                if (flushing_)
                {
                    return;
                }
                flushing_ = true;
                Common::ScopeGuard reset([this]()
                                         { flushing_ = false; });

                while (!outbox_.empty())
                {
                    OutgoingPacket outgoing = std::move(outbox_.front());
                    outbox_.pop_front();
                    if (send_callback_)
                    {
                        send_callback_(outgoing.interface_name, outgoing.destination, outgoing.packet);
                    }
                }
            }

            // ==================== Inspection ====================

            OspfInterface *OspfEngine::findInterface(const std::string &name)
            {
                auto it = interfaces_.find(name);
                return it == interfaces_.end() ? nullptr : &it->second;
            }

            OspfNeighbor *OspfEngine::findNeighbor(OspfInterface &iface, const Common::IPv4Address &router_id)
            {
                auto it = iface.neighbors.find(router_id);
                return it == iface.neighbors.end() ? nullptr : &it->second;
            }

            const OspfInterface *OspfEngine::getInterface(const std::string &name) const
            {
                auto it = interfaces_.find(name);
                return it == interfaces_.end() ? nullptr : &it->second;
            }

            std::vector<std::string> OspfEngine::getInterfaceNames() const
            {
                std::vector<std::string> names;
                for (const auto &pair : interfaces_)
                {
                    names.push_back(pair.first);
                }
                return names;
            }

            const OspfNeighbor *OspfEngine::getNeighbor(const std::string &interface_name,
                                                        const Common::IPv4Address &router_id) const
            {
                const OspfInterface *iface = getInterface(interface_name);
                if (iface == nullptr)
                {
                    return nullptr;
                }
                auto it = iface->neighbors.find(router_id);
                return it == iface->neighbors.end() ? nullptr : &it->second;
            }

            const LinkStateDatabase *OspfEngine::getLsdb(const Common::IPv4Address &area_id) const
            {
                auto it = areas_.find(area_id);
                return it == areas_.end() ? nullptr : &it->second;
            }

            void OspfEngine::shutdown()
            {
                shutting_down_ = true;
                Common::ScopeGuard reset([this]()
                                         { shutting_down_ = false; });

                scheduler_.cancel(refresh_timer_);
                refresh_timer_ = Sim::INVALID_TIMER;

                for (auto &pair : interfaces_)
                {
                    OspfInterface &iface = pair.second;
                    scheduler_.cancel(iface.hello_timer);
                    scheduler_.cancel(iface.wait_timer);
                    for (auto &neighbor_pair : iface.neighbors)
                    {
                        scheduler_.cancel(neighbor_pair.second.inactivity_timer);
                        scheduler_.cancel(neighbor_pair.second.dd_retransmit_timer);
                        scheduler_.cancel(neighbor_pair.second.lsu_retransmit_timer);
                    }
                }

                if (!interfaces_.empty())
                {
                    logger_->info("Router {}: OSPF shut down", router_id_.toString());
                }
                interfaces_.clear();
                outbox_.clear();
                dirty_areas_.clear();
                spf_pending_ = false;
                routes_.clear();
            }

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim
