// src/core/acl/acl_engine.cpp
#include "acl_engine.hpp"
#include "../../common/logger.hpp"
#include <algorithm>

namespace NetSim
{
    namespace Core
    {
        namespace Acl
        {
            AclEngine::AclEngine()
                : logger_(NETSIM_GET_LOGGER("ACL")),
                  permits_(0),
                  denies_(0),
                  implicit_denies_(0)
            {
            }

            std::optional<AclType> AclEngine::typeForNumber(int number)
            {
                if ((number >= 1 && number <= 99) || (number >= 1300 && number <= 1999))
                {
                    return AclType::STANDARD;
                }
                if ((number >= 100 && number <= 199) || (number >= 2000 && number <= 2699))
                {
                    return AclType::EXTENDED;
                }
                return std::nullopt;
            }

            // ==================== Configuration ====================

            bool AclEngine::createACL(const std::string &id, AclType type, bool named)
            {
                if (id.empty())
                {
                    return false;
                }

                auto it = acls_.find(id);
                if (it != acls_.end())
                {
                    if (it->second.type != type)
                    {
                        logger_->warn("ACL {} already exists with a different type", id);
                        return false;
                    }
                    return true;
                }

                AccessList acl;
                acl.id = id;
                acl.type = type;
                acl.named = named;
                acls_.emplace(id, std::move(acl));
                logger_->debug("ACL {} created ({})", id, type == AclType::STANDARD ? "standard" : "extended");
                return true;
            }

            std::optional<uint32_t> AclEngine::addNumberedEntry(int number, const AclEntry &entry)
            {
                auto type = typeForNumber(number);
                if (!type)
                {
                    logger_->warn("Invalid access-list number {}", number);
                    return std::nullopt;
                }

                std::string id = std::to_string(number);
                if (!createACL(id, *type, false))
                {
                    return std::nullopt;
                }
                return addEntry(acls_.at(id), entry);
            }

            std::optional<uint32_t> AclEngine::addNamedEntry(const std::string &name, AclType type, const AclEntry &entry)
            {
                if (!createACL(name, type, true))
                {
                    return std::nullopt;
                }
                return addEntry(acls_.at(name), entry);
            }

            std::optional<uint32_t> AclEngine::addEntry(AccessList &acl, AclEntry entry)
            {
                if (!validateEntry(acl, entry))
                {
                    return std::nullopt;
                }

                if (entry.sequence == 0)
                {
                    uint32_t highest = acl.entries.empty() ? 0 : acl.entries.back().sequence;
                    entry.sequence = highest + SEQUENCE_STEP;
                }
                else
                {
                    auto duplicate = std::find_if(acl.entries.begin(), acl.entries.end(),
                                                  [&entry](const AclEntry &e) { return e.sequence == entry.sequence; });
                    if (duplicate != acl.entries.end())
                    {
                        logger_->warn("ACL {}: duplicate sequence number {}", acl.id, entry.sequence);
                        return std::nullopt;
                    }
                }

                entry.hit_count = 0;
                auto position = std::upper_bound(acl.entries.begin(), acl.entries.end(), entry.sequence,
                                                 [](uint32_t seq, const AclEntry &e) { return seq < e.sequence; });
                uint32_t sequence = entry.sequence;
                acl.entries.insert(position, std::move(entry));
                return sequence;
            }

            bool AclEngine::validateEntry(const AccessList &acl, const AclEntry &entry) const
            {
                if (acl.type == AclType::STANDARD)
                {
                    if (entry.protocol != 0 || entry.source_port || entry.destination_port || entry.established)
                    {
                        logger_->warn("ACL {}: standard entry cannot match protocol, ports or flags", acl.id);
                        return false;
                    }
                    return true;
                }

                bool has_ports = entry.protocol == Packet::IpProtocol::TCP || entry.protocol == Packet::IpProtocol::UDP;
                if ((entry.source_port || entry.destination_port) && !has_ports)
                {
                    logger_->warn("ACL {}: port match requires tcp or udp", acl.id);
                    return false;
                }
                if (entry.established && entry.protocol != Packet::IpProtocol::TCP)
                {
                    logger_->warn("ACL {}: established requires tcp", acl.id);
                    return false;
                }

                for (const auto *match : {&entry.source_port, &entry.destination_port})
                {
                    if (*match && (*match)->op == PortOperator::RANGE && (*match)->start > (*match)->end)
                    {
                        logger_->warn("ACL {}: invalid port range {}-{}", acl.id, (*match)->start, (*match)->end);
                        return false;
                    }
                }
                return true;
            }

            bool AclEngine::removeEntry(const std::string &id, uint32_t sequence)
            {
                auto it = acls_.find(id);
                if (it == acls_.end())
                {
                    return false;
                }

                auto &entries = it->second.entries;
                auto entry = std::find_if(entries.begin(), entries.end(),
                                          [sequence](const AclEntry &e) { return e.sequence == sequence; });
                if (entry == entries.end())
                {
                    return false;
                }
                entries.erase(entry);
                return true;
            }

            bool AclEngine::deleteACL(const std::string &id)
            {
                // Binding được giữ lại: tham chiếu tới ACL không tồn tại sẽ permit
                bool removed = acls_.erase(id) > 0;
                if (removed)
                {
                    logger_->debug("ACL {} deleted", id);
                }
                return removed;
            }

            bool AclEngine::bindToInterface(const std::string &interface_name, const std::string &id, Direction direction)
            {
                if (interface_name.empty() || id.empty())
                {
                    return false;
                }
                bindings_[BindingKey(interface_name, direction)] = id;
                logger_->debug("ACL {} bound to {} {}", id, interface_name, directionToString(direction));
                return true;
            }

            bool AclEngine::unbindFromInterface(const std::string &interface_name, Direction direction)
            {
                return bindings_.erase(BindingKey(interface_name, direction)) > 0;
            }

            std::optional<std::string> AclEngine::getBoundACL(const std::string &interface_name, Direction direction) const
            {
                auto it = bindings_.find(BindingKey(interface_name, direction));
                if (it == bindings_.end())
                {
                    return std::nullopt;
                }
                return it->second;
            }

            // ==================== Evaluation ====================

            AclAction AclEngine::checkPacket(const std::string &id,
                                             const Common::IPv4Address &source,
                                             const std::optional<Common::IPv4Address> &destination,
                                             const std::optional<uint8_t> &protocol,
                                             const std::optional<uint16_t> &source_port,
                                             const std::optional<uint16_t> &destination_port)
            {
                AclQuery query;
                query.source = source;
                query.destination = destination;
                query.protocol = protocol;
                query.source_port = source_port;
                query.destination_port = destination_port;
                return checkPacket(id, query);
            }

            AclAction AclEngine::checkPacket(const std::string &id, const AclQuery &query)
            {
                auto it = acls_.find(id);
                if (it == acls_.end())
                {
                    return AclAction::PERMIT;
                }

                AccessList &acl = it->second;
                for (auto &entry : acl.entries)
                {
                    if (!entryMatches(entry, acl.type, query))
                    {
                        continue;
                    }

                    entry.hit_count++;
                    if (entry.action == AclAction::PERMIT)
                    {
                        permits_++;
                    }
                    else
                    {
                        denies_++;
                    }

                    if (entry.log)
                    {
                        logger_->info("list {} {}ed {} -> {} (seq {}, {} match(es))", acl.id,
                                      aclActionToString(entry.action), query.source.toString(),
                                      query.destination ? query.destination->toString() : std::string("-"),
                                      entry.sequence, entry.hit_count);
                    }
                    return entry.action;
                }

                implicit_denies_++;
                logger_->debug("ACL {}: implicit deny for {}", acl.id, query.source.toString());
                return AclAction::DENY;
            }

            AclAction AclEngine::checkPacket(const std::string &id, const Packet::IPv4Packet &packet)
            {
                return checkPacket(id, queryFromPacket(packet));
            }

            AclAction AclEngine::checkInterface(const std::string &interface_name, Direction direction,
                                                const Packet::IPv4Packet &packet)
            {
                auto bound = getBoundACL(interface_name, direction);
                if (!bound)
                {
                    return AclAction::PERMIT;
                }
                return checkPacket(*bound, packet);
            }

            bool AclEngine::matchesSource(const std::string &id, const Common::IPv4Address &source) const
            {
                auto it = acls_.find(id);
                if (it == acls_.end())
                {
                    return false;
                }

                for (const auto &entry : it->second.entries)
                {
                    if (entry.source_wildcard.matches(source, entry.source))
                    {
                        return entry.action == AclAction::PERMIT;
                    }
                }
                return false;
            }

            AclQuery AclEngine::queryFromPacket(const Packet::IPv4Packet &packet)
            {
                AclQuery query;
                query.source = packet.source();
                query.destination = packet.destination();
                query.protocol = packet.protocol();

                if (const auto *tcp = packet.payloadAs<Packet::TcpSegment>())
                {
                    query.source_port = tcp->source_port;
                    query.destination_port = tcp->destination_port;
                    query.tcp_flags = tcp->flags;
                }
                else if (const auto *udp = packet.payloadAs<Packet::UdpDatagram>())
                {
                    query.source_port = udp->source_port;
                    query.destination_port = udp->destination_port;
                }
                return query;
            }

            bool AclEngine::entryMatches(const AclEntry &entry, AclType type, const AclQuery &query)
            {
                if (!entry.source_wildcard.matches(query.source, entry.source))
                {
                    return false;
                }

                if (type == AclType::STANDARD)
                {
                    return true;
                }

                if (entry.protocol != 0 && (!query.protocol || *query.protocol != entry.protocol))
                {
                    return false;
                }

                if (query.destination)
                {
                    if (!entry.destination_wildcard.matches(*query.destination, entry.destination))
                    {
                        return false;
                    }
                }
                else if (entry.destination_wildcard.toUint32() != 0xFFFFFFFFu)
                {
                    return false;
                }

                if (entry.source_port && query.source_port && !entry.source_port->matches(*query.source_port))
                {
                    return false;
                }
                if (entry.destination_port && query.destination_port &&
                    !entry.destination_port->matches(*query.destination_port))
                {
                    return false;
                }

                if (entry.established)
                {
                    if (!query.tcp_flags ||
                        (*query.tcp_flags & (Packet::TcpFlags::ACK | Packet::TcpFlags::RST)) == 0)
                    {
                        return false;
                    }
                }

                return true;
            }

            // ==================== Inspection ====================

            const AccessList *AclEngine::getACL(const std::string &id) const
            {
                auto it = acls_.find(id);
                return it == acls_.end() ? nullptr : &it->second;
            }

            std::vector<AccessList> AclEngine::getAllACLs() const
            {
                std::vector<AccessList> result;
                result.reserve(acls_.size());
                for (const auto &pair : acls_)
                {
                    result.push_back(pair.second);
                }
                return result;
            }

            bool AclEngine::clearCounters(const std::string &id)
            {
                auto it = acls_.find(id);
                if (it == acls_.end())
                {
                    return false;
                }
                for (auto &entry : it->second.entries)
                {
                    entry.hit_count = 0;
                }
                return true;
            }

            void AclEngine::clearAllCounters()
            {
                for (auto &pair : acls_)
                {
                    clearCounters(pair.first);
                }
                permits_ = 0;
                denies_ = 0;
                implicit_denies_ = 0;
            }

            AclStatistics AclEngine::getStatistics() const
            {
                AclStatistics stats;
                stats.acl_count = acls_.size();
                stats.binding_count = bindings_.size();
                stats.permits = permits_;
                stats.denies = denies_;
                stats.implicit_denies = implicit_denies_;
                for (const auto &pair : acls_)
                {
                    stats.entry_count += pair.second.entries.size();
                    for (const auto &entry : pair.second.entries)
                    {
                        stats.total_hits += entry.hit_count;
                    }
                }
                return stats;
            }

        } // namespace Acl
    }     // namespace Core
} // namespace NetSim
