// src/core/nat/nat_engine.cpp
#include "nat_engine.hpp"
#include "../packet/packet_builder.hpp"
#include "../../common/logger.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Nat
        {
            namespace
            {
                using Packet::IPv4Packet;
                using Packet::IPv4Payload;

                IPv4Payload withPort(const IPv4Payload &payload, uint16_t port, bool source)
                {
                    if (const auto *tcp = std::get_if<Packet::TcpSegment>(&payload))
                    {
                        Packet::TcpSegment copy = *tcp;
                        (source ? copy.source_port : copy.destination_port) = port;
                        return copy;
                    }
                    if (const auto *udp = std::get_if<Packet::UdpDatagram>(&payload))
                    {
                        Packet::UdpDatagram copy = *udp;
                        (source ? copy.source_port : copy.destination_port) = port;
                        return copy;
                    }
                    if (const auto *icmp = std::get_if<Packet::IcmpMessage>(&payload))
                    {
                        // Echo identifier đóng vai trò port ở cả hai chiều
                        Packet::IcmpMessage copy = *icmp;
                        copy.identifier = port;
                        copy.checksum = Packet::PacketBuilder::computeIcmpChecksum(copy);
                        return copy;
                    }
                    return payload;
                }

                IPv4Packet rewriteSource(const IPv4Packet &packet, const Common::IPv4Address &address,
                                         const std::optional<uint16_t> &port)
                {
                    IPv4Packet result = packet.withSourceAddress(address);
                    if (port)
                    {
                        result = result.withPayload(withPort(packet.payload(), *port, true));
                    }
                    return result.withChecksum();
                }

                IPv4Packet rewriteDestination(const IPv4Packet &packet, const Common::IPv4Address &address,
                                              const std::optional<uint16_t> &port)
                {
                    IPv4Packet result = packet.withDestinationAddress(address);
                    if (port)
                    {
                        result = result.withPayload(withPort(packet.payload(), *port, false));
                    }
                    return result.withChecksum();
                }

                NatOutcome translatedOutcome(IPv4Packet packet)
                {
                    NatOutcome outcome;
                    outcome.result = NatResult::TRANSLATED;
                    outcome.packet = std::move(packet);
                    return outcome;
                }

                NatOutcome notApplicable()
                {
                    return NatOutcome{};
                }
            }

            NatEngine::NatEngine(const Sim::VirtualClock &clock, uint64_t translation_timeout_ms,
                                 uint16_t pat_port_min, uint16_t pat_port_max)
                : logger_(NETSIM_GET_LOGGER("NAT")),
                  clock_(clock),
                  timeout_ms_(translation_timeout_ms),
                  port_min_(pat_port_min),
                  port_max_(pat_port_max < pat_port_min ? pat_port_min : pat_port_max),
                  port_cursor_(pat_port_min),
                  hits_(0),
                  misses_(0),
                  expired_(0)
            {
            }

            // ==================== Interfaces ====================

            void NatEngine::setInsideInterface(const std::string &interface_name)
            {
                outside_.erase(interface_name);
                inside_.insert(interface_name);
            }

            void NatEngine::setOutsideInterface(const std::string &interface_name)
            {
                inside_.erase(interface_name);
                outside_.insert(interface_name);
            }

            bool NatEngine::removeInterface(const std::string &interface_name)
            {
                size_t removed = inside_.erase(interface_name) + outside_.erase(interface_name);
                return removed > 0;
            }

            // ==================== Static / pools / bindings ====================

            bool NatEngine::addStaticNAT(const Common::IPv4Address &inside_local, const Common::IPv4Address &inside_global)
            {
                if (statics_.count(inside_local) > 0)
                {
                    logger_->warn("Static NAT for {} already exists", inside_local.toString());
                    return false;
                }
                for (const auto &pair : statics_)
                {
                    if (pair.second.inside_global == inside_global)
                    {
                        logger_->warn("Inside global {} already used by {}", inside_global.toString(),
                                      pair.first.toString());
                        return false;
                    }
                }

                NatTranslation translation;
                translation.type = NatType::STATIC;
                translation.inside_local = inside_local;
                translation.inside_global = inside_global;
                translation.created_ms = clock_.nowMs();
                translation.last_used_ms = translation.created_ms;
                statics_.emplace(inside_local, translation);

                logger_->debug("Static NAT {} -> {}", inside_local.toString(), inside_global.toString());
                return true;
            }

            bool NatEngine::removeStaticNAT(const Common::IPv4Address &inside_local)
            {
                return statics_.erase(inside_local) > 0;
            }

            bool NatEngine::addPool(const std::string &name, const Common::IPv4Address &start,
                                    const Common::IPv4Address &end, const Common::SubnetMask &netmask)
            {
                if (name.empty() || start > end)
                {
                    logger_->warn("Invalid NAT pool {} ({} - {})", name, start.toString(), end.toString());
                    return false;
                }

                pools_[name] = NatPool{name, start, end, netmask};
                logger_->debug("NAT pool {} {} - {} netmask {}", name, start.toString(), end.toString(),
                               netmask.toString());
                return true;
            }

            bool NatEngine::removePool(const std::string &name)
            {
                return pools_.erase(name) > 0;
            }

            const NatPool *NatEngine::getPool(const std::string &name) const
            {
                auto it = pools_.find(name);
                return it == pools_.end() ? nullptr : &it->second;
            }

            bool NatEngine::bindAccessList(const std::string &acl_id,
                                           const std::optional<std::string> &pool,
                                           const std::optional<std::string> &interface_name,
                                           bool overload)
            {
                if (acl_id.empty() || pool.has_value() == interface_name.has_value())
                {
                    logger_->warn("NAT binding for list {} needs exactly one of pool or interface", acl_id);
                    return false;
                }

                NatBinding binding;
                binding.acl_id = acl_id;
                binding.pool = pool;
                binding.interface_name = interface_name;
                binding.overload = overload || interface_name.has_value();

                for (auto &existing : bindings_)
                {
                    if (existing.acl_id == acl_id)
                    {
                        existing = binding;
                        return true;
                    }
                }
                bindings_.push_back(binding);
                return true;
            }

            bool NatEngine::unbindAccessList(const std::string &acl_id)
            {
                for (auto it = bindings_.begin(); it != bindings_.end(); ++it)
                {
                    if (it->acl_id == acl_id)
                    {
                        bindings_.erase(it);
                        return true;
                    }
                }
                return false;
            }

            // ==================== Translation ====================

            NatOutcome NatEngine::translateOutgoing(const Packet::IPv4Packet &packet,
                                                    const std::string &inside_interface,
                                                    const Common::IPv4Address &outside_address,
                                                    const Acl::AclEngine &acl)
            {
                if (!isInside(inside_interface))
                {
                    return notApplicable();
                }

                const Common::IPv4Address &source = packet.source();

                auto static_it = statics_.find(source);
                if (static_it != statics_.end())
                {
                    touch(static_it->second);
                    return translatedOutcome(rewriteSource(packet, static_it->second.inside_global, std::nullopt));
                }

                for (const auto &binding : bindings_)
                {
                    if (!acl.matchesSource(binding.acl_id, source))
                    {
                        continue;
                    }

                    const NatPool *pool = nullptr;
                    if (binding.pool)
                    {
                        pool = getPool(*binding.pool);
                        if (!pool)
                        {
                            return miss("pool " + *binding.pool + " not configured", source);
                        }
                    }

                    if (binding.overload)
                    {
                        Common::IPv4Address global = pool ? pool->start : outside_address;
                        return translatePat(packet, global);
                    }
                    return translateDynamic(packet, *pool);
                }

                return notApplicable();
            }

            NatOutcome NatEngine::translatePat(const Packet::IPv4Packet &packet, const Common::IPv4Address &global)
            {
                auto port = packet.sourcePort();
                if (!port)
                {
                    return miss("no port to overload", packet.source());
                }

                PatKey key{packet.source(), *port, packet.protocol()};
                auto it = pat_.find(key);
                if (it != pat_.end())
                {
                    if (it->second.isExpired(clock_.nowMs()))
                    {
                        erasePat(it);
                        expired_++;
                    }
                    else
                    {
                        touch(it->second);
                        return translatedOutcome(rewriteSource(packet, it->second.inside_global,
                                                               it->second.inside_global_port));
                    }
                }

                auto allocated = allocatePort(global);
                if (!allocated)
                {
                    return miss("PAT port space exhausted on " + global.toString(), packet.source());
                }

                NatTranslation translation;
                translation.type = NatType::PAT;
                translation.protocol = packet.protocol();
                translation.inside_local = packet.source();
                translation.inside_local_port = *port;
                translation.inside_global = global;
                translation.inside_global_port = *allocated;
                translation.outside_address = packet.destination();
                translation.created_ms = clock_.nowMs();
                translation.last_used_ms = translation.created_ms;
                translation.timeout_ms = timeout_ms_;
                translation.hits = 1;
                hits_++;

                pat_.emplace(key, translation);
                pat_ports_in_use_.insert(std::make_pair(global.toUint32(), *allocated));

                logger_->debug("PAT {}:{} -> {}:{} (proto {})", packet.source().toString(), *port,
                               global.toString(), *allocated, packet.protocol());
                return translatedOutcome(rewriteSource(packet, global, *allocated));
            }

            NatOutcome NatEngine::translateDynamic(const Packet::IPv4Packet &packet, const NatPool &pool)
            {
                const Common::IPv4Address &source = packet.source();
                uint64_t now = clock_.nowMs();

                auto it = dynamic_.find(source);
                if (it != dynamic_.end())
                {
                    if (!it->second.isExpired(now))
                    {
                        touch(it->second);
                        return translatedOutcome(rewriteSource(packet, it->second.inside_global, std::nullopt));
                    }
                    dynamic_.erase(it);
                    expired_++;
                }

                for (uint32_t value = pool.start.toUint32(); value <= pool.end.toUint32(); ++value)
                {
                    Common::IPv4Address candidate(value);
                    if (isGlobalInUse(candidate))
                    {
                        if (value == 0xFFFFFFFFu)
                        {
                            break;
                        }
                        continue;
                    }

                    NatTranslation translation;
                    translation.type = NatType::DYNAMIC;
                    translation.inside_local = source;
                    translation.inside_global = candidate;
                    translation.outside_address = packet.destination();
                    translation.created_ms = now;
                    translation.last_used_ms = now;
                    translation.timeout_ms = timeout_ms_;
                    translation.hits = 1;
                    hits_++;
                    dynamic_.emplace(source, translation);

                    logger_->debug("Dynamic NAT {} -> {} (pool {})", source.toString(), candidate.toString(), pool.name);
                    return translatedOutcome(rewriteSource(packet, candidate, std::nullopt));
                }

                return miss("pool " + pool.name + " exhausted", source);
            }

            NatOutcome NatEngine::translateIncoming(const Packet::IPv4Packet &packet)
            {
                const Common::IPv4Address &destination = packet.destination();
                uint64_t now = clock_.nowMs();

                for (auto &pair : statics_)
                {
                    if (pair.second.inside_global == destination)
                    {
                        touch(pair.second);
                        return translatedOutcome(rewriteDestination(packet, pair.second.inside_local, std::nullopt));
                    }
                }

                auto port = packet.destinationPort();
                if (port && pat_ports_in_use_.count(std::make_pair(destination.toUint32(), *port)) > 0)
                {
                    for (auto it = pat_.begin(); it != pat_.end(); ++it)
                    {
                        NatTranslation &translation = it->second;
                        if (translation.inside_global != destination || translation.inside_global_port != *port ||
                            translation.protocol != packet.protocol())
                        {
                            continue;
                        }
                        if (translation.isExpired(now))
                        {
                            erasePat(it);
                            expired_++;
                            break;
                        }
                        touch(translation);
                        return translatedOutcome(rewriteDestination(packet, translation.inside_local,
                                                                    translation.inside_local_port));
                    }
                }

                for (auto it = dynamic_.begin(); it != dynamic_.end(); ++it)
                {
                    if (it->second.inside_global != destination)
                    {
                        continue;
                    }
                    if (it->second.isExpired(now))
                    {
                        dynamic_.erase(it);
                        expired_++;
                        break;
                    }
                    touch(it->second);
                    return translatedOutcome(rewriteDestination(packet, it->second.inside_local, std::nullopt));
                }

                return notApplicable();
            }

            std::optional<uint16_t> NatEngine::allocatePort(const Common::IPv4Address &global)
            {
                uint32_t range = static_cast<uint32_t>(port_max_) - port_min_ + 1;

                // Quét tối đa một vòng đầy đủ từ cursor
                for (uint32_t i = 0; i < range; ++i)
                {
                    uint16_t candidate = port_cursor_;
                    port_cursor_ = candidate >= port_max_ ? port_min_ : static_cast<uint16_t>(candidate + 1);

                    if (pat_ports_in_use_.count(std::make_pair(global.toUint32(), candidate)) == 0)
                    {
                        return candidate;
                    }
                }
                return std::nullopt;
            }

            void NatEngine::touch(NatTranslation &translation)
            {
                translation.last_used_ms = clock_.nowMs();
                translation.hits++;
                hits_++;
            }

            void NatEngine::erasePat(std::map<PatKey, NatTranslation>::iterator it)
            {
                if (it->second.inside_global_port)
                {
                    pat_ports_in_use_.erase(std::make_pair(it->second.inside_global.toUint32(),
                                                           *it->second.inside_global_port));
                }
                pat_.erase(it);
            }

            bool NatEngine::isTranslatedGlobal(const Common::IPv4Address &address) const
            {
                if (isGlobalInUse(address))
                {
                    return true;
                }
                for (const auto &pair : pat_)
                {
                    if (pair.second.inside_global == address)
                    {
                        return true;
                    }
                }
                return false;
            }

            bool NatEngine::isGlobalInUse(const Common::IPv4Address &address) const
            {
                for (const auto &pair : dynamic_)
                {
                    if (pair.second.inside_global == address)
                    {
                        return true;
                    }
                }
                for (const auto &pair : statics_)
                {
                    if (pair.second.inside_global == address)
                    {
                        return true;
                    }
                }
                return false;
            }

            NatOutcome NatEngine::miss(const std::string &reason, const Common::IPv4Address &source)
            {
                misses_++;
                logger_->debug("NAT miss for {}: {}", source.toString(), reason);

                NatOutcome outcome;
                outcome.result = NatResult::MISS;
                return outcome;
            }

            // ==================== Lifecycle ====================

            size_t NatEngine::cleanupExpiredTranslations()
            {
                uint64_t now = clock_.nowMs();
                size_t removed = 0;

                for (auto it = dynamic_.begin(); it != dynamic_.end();)
                {
                    if (it->second.isExpired(now))
                    {
                        logger_->trace("Expired {} translation {} -> {}", natTypeToString(it->second.type),
                                       it->second.inside_local.toString(), it->second.inside_global.toString());
                        it = dynamic_.erase(it);
                        ++removed;
                    }
                    else
                    {
                        ++it;
                    }
                }

                for (auto it = pat_.begin(); it != pat_.end();)
                {
                    if (it->second.isExpired(now))
                    {
                        auto next = std::next(it);
                        erasePat(it);
                        it = next;
                        ++removed;
                    }
                    else
                    {
                        ++it;
                    }
                }

                expired_ += removed;
                if (removed > 0)
                {
                    logger_->debug("{} NAT translation(s) expired", removed);
                }
                return removed;
            }

            void NatEngine::clearDynamicTranslations()
            {
                dynamic_.clear();
                pat_.clear();
                pat_ports_in_use_.clear();
            }

            void NatEngine::clearAllTranslations()
            {
                clearDynamicTranslations();
                port_cursor_ = port_min_;
                hits_ = 0;
                misses_ = 0;
                expired_ = 0;
            }

            std::vector<NatTranslation> NatEngine::getTranslations() const
            {
                std::vector<NatTranslation> result;
                result.reserve(statics_.size() + dynamic_.size() + pat_.size());
                for (const auto &pair : statics_)
                {
                    result.push_back(pair.second);
                }
                for (const auto &pair : dynamic_)
                {
                    result.push_back(pair.second);
                }
                for (const auto &pair : pat_)
                {
                    result.push_back(pair.second);
                }
                return result;
            }

            NatStatistics NatEngine::getStatistics() const
            {
                NatStatistics stats;
                stats.hits = hits_;
                stats.misses = misses_;
                stats.expired = expired_;
                stats.static_translations = statics_.size();
                stats.dynamic_translations = dynamic_.size();
                stats.pat_translations = pat_.size();
                stats.inside_interfaces = inside_.size();
                stats.outside_interfaces = outside_.size();
                return stats;
            }

        } // namespace Nat
    }     // namespace Core
} // namespace NetSim
