// src/core/l2/switch.cpp
#include "switch.hpp"
#include "../sim/simulation_context.hpp"
#include "../../common/logger.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace L2
        {
            Switch::Switch(Sim::SimulationContext &context, const std::string &name, size_t port_count)
                : FrameSink(context, name),
                  logger_(NETSIM_GET_LOGGER("Switch")),
                  mac_table_(static_cast<uint64_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::SWITCH_MAC_AGING_TIME, 300)) * 1000,
                             static_cast<size_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::SWITCH_MAC_TABLE_MAX, 8192))),
                  aging_subscription_(0)
            {
                for (size_t i = 1; i <= port_count; ++i)
                {
                    SwitchPort port;
                    port.name = "Fa0/" + std::to_string(i);
                    port_order_.push_back(port.name);
                    ports_.emplace(port.name, port);
                }

                aging_subscription_ = context.config().registerChangeCallback(
                    Common::ConfigKeys::SWITCH_MAC_AGING_TIME,
                    [this](const std::string &, const std::any &, const std::any &new_value)
                    {
                        if (const int *seconds = std::any_cast<int>(&new_value))
                        {
                            mac_table_.setAgingTime(static_cast<uint64_t>(*seconds) * 1000);
                            logger_->debug("{}: MAC aging time {} s", name_, *seconds);
                        }
                    });
            }

            Switch::~Switch()
            {
                context_.config().unregisterChangeCallback(aging_subscription_);
            }

            std::vector<std::string> Switch::getPortNames() const
            {
                return port_order_;
            }

            // ==================== Ports ====================

            bool Switch::setPortEnabled(const std::string &port, bool enabled)
            {
                auto it = ports_.find(port);
                if (it == ports_.end())
                {
                    logger_->warn("{}: unknown port {}", name_, port);
                    return false;
                }

                it->second.enabled = enabled;
                if (!enabled)
                {
                    size_t purged = mac_table_.removePort(port);
                    logger_->info("{}: port {} disabled, {} MAC entries purged", name_, port, purged);
                }
                else
                {
                    logger_->info("{}: port {} enabled", name_, port);
                }
                return true;
            }

            bool Switch::setAccessVlan(const std::string &port, uint16_t vlan)
            {
                auto it = ports_.find(port);
                if (it == ports_.end() || !isValidVlan(vlan))
                {
                    logger_->warn("{}: cannot set access vlan {} on {}", name_, vlan, port);
                    return false;
                }

                it->second.mode = PortMode::ACCESS;
                it->second.access_vlan = vlan;
                it->second.allowed_vlans.clear();
                mac_table_.removePort(port);
                return true;
            }

            bool Switch::setTrunk(const std::string &port, const std::set<uint16_t> &allowed_vlans, uint16_t native_vlan)
            {
                auto it = ports_.find(port);
                if (it == ports_.end() || !isValidVlan(native_vlan))
                {
                    logger_->warn("{}: cannot set trunk on {}", name_, port);
                    return false;
                }
                for (uint16_t vlan : allowed_vlans)
                {
                    if (!isValidVlan(vlan))
                    {
                        logger_->warn("{}: invalid vlan {} in allowed list of {}", name_, vlan, port);
                        return false;
                    }
                }

                it->second.mode = PortMode::TRUNK;
                it->second.allowed_vlans = allowed_vlans;
                it->second.native_vlan = native_vlan;
                mac_table_.removePort(port);
                return true;
            }

            std::optional<SwitchPort> Switch::getPort(const std::string &port) const
            {
                auto it = ports_.find(port);
                if (it == ports_.end())
                {
                    return std::nullopt;
                }
                return it->second;
            }

            size_t Switch::ageMacTable()
            {
                return mac_table_.ageOut(context_.nowMs());
            }

            void Switch::onFrameForward(FrameForwardCallback callback)
            {
                forward_callbacks_.push_back(std::move(callback));
            }

            // ==================== Forwarding ====================

            void Switch::receiveFrame(const std::string &port_name, const Packet::EthernetFrame &frame)
            {
                stats_.frames_received++;

                auto it = ports_.find(port_name);
                if (it == ports_.end() || !it->second.enabled)
                {
                    stats_.frames_dropped++;
                    logger_->debug("{}: frame on disabled/unknown port {} dropped", name_, port_name);
                    return;
                }

                const SwitchPort &ingress = it->second;
                auto vlan = classifyIngress(ingress, frame);
                if (!vlan)
                {
                    stats_.frames_dropped++;
                    logger_->debug("{}: frame on {} not accepted (vlan mismatch)", name_, port_name);
                    return;
                }

                uint64_t now = context_.nowMs();
                mac_table_.learn(frame.source(), port_name, *vlan, now);

                const Common::MacAddress &destination = frame.destination();
                if (destination.isBroadcast() || destination.isMulticast())
                {
                    flood(port_name, *vlan, frame);
                    return;
                }

                auto entry = mac_table_.lookup(destination, *vlan, now);
                if (!entry)
                {
                    flood(port_name, *vlan, frame);
                    return;
                }

                if (entry->port == port_name)
                {
                    stats_.frames_filtered++;
                    logger_->trace("{}: {} is on ingress port {}, filtered", name_, destination.toString(), port_name);
                    return;
                }

                auto egress = ports_.find(entry->port);
                if (egress == ports_.end() || !egress->second.enabled || !egress->second.carriesVlan(*vlan))
                {
                    stats_.frames_dropped++;
                    return;
                }

                stats_.frames_forwarded++;
                emit(egress->second, *vlan, frame);
            }

            std::optional<uint16_t> Switch::classifyIngress(const SwitchPort &port, const Packet::EthernetFrame &frame) const
            {
                const auto &tag = frame.vlanTag();

                if (port.mode == PortMode::ACCESS)
                {
                    if (tag && tag->vid != port.access_vlan)
                    {
                        return std::nullopt;
                    }
                    return port.access_vlan;
                }

                uint16_t vlan = tag ? tag->vid : port.native_vlan;
                if (!port.carriesVlan(vlan))
                {
                    return std::nullopt;
                }
                return vlan;
            }

            void Switch::flood(const std::string &ingress, uint16_t vlan, const Packet::EthernetFrame &frame)
            {
                stats_.frames_flooded++;

                // Sao chép danh sách port: delivery đồng bộ có thể quay lại switch này
                std::vector<SwitchPort> targets;
                for (const auto &name : port_order_)
                {
                    const SwitchPort &port = ports_.at(name);
                    if (name != ingress && port.enabled && port.carriesVlan(vlan))
                    {
                        targets.push_back(port);
                    }
                }

                for (const auto &port : targets)
                {
                    emit(port, vlan, frame);
                }
            }

            void Switch::emit(const SwitchPort &egress, uint16_t vlan, const Packet::EthernetFrame &frame)
            {
                Packet::EthernetFrame out = frame.withoutVlanTag();
                if (egress.mode == PortMode::TRUNK && vlan != egress.native_vlan)
                {
                    Packet::VlanTag tag;
                    tag.vid = vlan;
                    if (frame.vlanTag())
                    {
                        tag.pcp = frame.vlanTag()->pcp;
                    }
                    out = frame.withVlanTag(tag);
                }

                for (const auto &callback : forward_callbacks_)
                {
                    callback(egress.name, out);
                }

                sendFrame(egress.name, out);
            }

        } // namespace L2
    }     // namespace Core
} // namespace NetSim
