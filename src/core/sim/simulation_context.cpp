// src/core/sim/simulation_context.cpp
#include "simulation_context.hpp"
#include "../../common/logger.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Sim
        {
            std::string deviceKindToString(DeviceKind kind)
            {
                switch (kind)
                {
                case DeviceKind::SWITCH:
                    return "switch";
                case DeviceKind::ROUTER:
                    return "router";
                case DeviceKind::HOST:
                    return "host";
                }
                return "unknown";
            }

            std::string simulationEventTypeToString(SimulationEventType type)
            {
                switch (type)
                {
                case SimulationEventType::DEVICE_ADDED:
                    return "DEVICE_ADDED";
                case SimulationEventType::LINK_CONNECTED:
                    return "LINK_CONNECTED";
                case SimulationEventType::LINK_DISCONNECTED:
                    return "LINK_DISCONNECTED";
                case SimulationEventType::FRAME_TRANSMITTED:
                    return "FRAME_TRANSMITTED";
                case SimulationEventType::FRAME_LOST:
                    return "FRAME_LOST";
                }
                return "UNKNOWN";
            }

            void FrameSink::sendFrame(const std::string &port, const Packet::EthernetFrame &frame)
            {
                context_.transmit(name_, port, frame);
            }

            // ==================== SimulationContext ====================

            SimulationContext::SimulationContext()
                : logger_(NETSIM_GET_LOGGER("Simulation")),
                  scheduler_(clock_),
                  next_subscription_id_(1),
                  mac_sequence_(0),
                  delivery_depth_(0)
            {
            }

            SimulationContext::~SimulationContext()
            {
                disableCapture();
                // Thiết bị hủy timer của chúng trong destructor nên phải hủy trước scheduler
                devices_.clear();
            }

            FrameSink *SimulationContext::getDevice(const std::string &name) const
            {
                auto it = devices_.find(name);
                return it == devices_.end() ? nullptr : it->second.get();
            }

            bool SimulationContext::removeDevice(const std::string &name)
            {
                auto it = devices_.find(name);
                if (it == devices_.end())
                {
                    return false;
                }

                for (const auto &port : it->second->getPortNames())
                {
                    disconnect(name, port);
                }
                devices_.erase(it);
                logger_->info("Device {} removed", name);
                return true;
            }

            std::vector<std::string> SimulationContext::getDeviceNames() const
            {
                std::vector<std::string> names;
                names.reserve(devices_.size());
                for (const auto &pair : devices_)
                {
                    names.push_back(pair.first);
                }
                return names;
            }

            void SimulationContext::onDeviceAdded(const FrameSink &device)
            {
                logger_->info("Device {} ({}) added", device.getName(), deviceKindToString(device.getKind()));
                publish(SimulationEventType::DEVICE_ADDED, device.getName(), "", deviceKindToString(device.getKind()));
            }

            // ==================== Links ====================

            bool SimulationContext::connect(const std::string &device_a, const std::string &port_a,
                                            const std::string &device_b, const std::string &port_b)
            {
                FrameSink *a = getDevice(device_a);
                FrameSink *b = getDevice(device_b);
                if (!a || !b)
                {
                    logger_->warn("Cannot connect {}:{} <-> {}:{}: unknown device", device_a, port_a, device_b, port_b);
                    return false;
                }
                if (!a->hasPort(port_a) || !b->hasPort(port_b))
                {
                    logger_->warn("Cannot connect {}:{} <-> {}:{}: unknown port", device_a, port_a, device_b, port_b);
                    return false;
                }

                Endpoint end_a{device_a, port_a};
                Endpoint end_b{device_b, port_b};
                if (end_a == end_b || links_.count(end_a) > 0 || links_.count(end_b) > 0)
                {
                    logger_->warn("Cannot connect {}:{} <-> {}:{}: port already linked", device_a, port_a, device_b, port_b);
                    return false;
                }

                links_[end_a] = end_b;
                links_[end_b] = end_a;

                logger_->info("Link up {}:{} <-> {}:{}", device_a, port_a, device_b, port_b);
                publish(SimulationEventType::LINK_CONNECTED, device_a, port_a, device_b + ":" + port_b);
                return true;
            }

            bool SimulationContext::disconnect(const std::string &device, const std::string &port)
            {
                auto it = links_.find(Endpoint{device, port});
                if (it == links_.end())
                {
                    return false;
                }

                Endpoint peer = it->second;
                links_.erase(it);
                links_.erase(peer);

                logger_->info("Link down {}:{} <-> {}:{}", device, port, peer.device, peer.port);
                publish(SimulationEventType::LINK_DISCONNECTED, device, port, peer.device + ":" + peer.port);
                return true;
            }

            std::optional<Endpoint> SimulationContext::getPeer(const std::string &device, const std::string &port) const
            {
                auto it = links_.find(Endpoint{device, port});
                if (it == links_.end())
                {
                    return std::nullopt;
                }
                return it->second;
            }

            bool SimulationContext::transmit(const std::string &device, const std::string &port,
                                             const Packet::EthernetFrame &frame)
            {
                stats_.frames_transmitted++;

                if (capture_ && capture_->isOpen())
                {
                    capture_->writeFrame(frame, clock_.nowUs());
                }

                auto peer = getPeer(device, port);
                if (!peer)
                {
                    stats_.frames_unlinked++;
                    logger_->trace("{}:{} has no link, frame lost", device, port);
                    publish(SimulationEventType::FRAME_LOST, device, port, "no link");
                    return false;
                }

                FrameSink *target = getDevice(peer->device);
                if (!target)
                {
                    stats_.frames_unlinked++;
                    return false;
                }

                int max_depth = NETSIM_CONFIG_GET_INT(config_, Common::ConfigKeys::SIM_MAX_DELIVERY_DEPTH, 64);
                if (delivery_depth_ >= max_depth)
                {
                    stats_.frames_depth_exceeded++;
                    logger_->warn("Delivery depth {} exceeded at {}:{}, frame dropped (forwarding loop?)",
                                  max_depth, device, port);
                    publish(SimulationEventType::FRAME_LOST, device, port, "delivery depth exceeded");
                    return false;
                }

                publish(SimulationEventType::FRAME_TRANSMITTED, device, port, peer->device + ":" + peer->port);

                delivery_depth_++;
                Common::ScopeGuard depth_guard([this]() { delivery_depth_--; });

                target->receiveFrame(peer->port, frame);
                stats_.frames_delivered++;
                return true;
            }

            // ==================== Time ====================

            size_t SimulationContext::advanceTime(uint64_t delta_ms)
            {
                return scheduler_.advance(delta_ms);
            }

            // ==================== Events ====================

            uint64_t SimulationContext::subscribe(SimulationListener listener)
            {
                uint64_t id = next_subscription_id_++;
                listeners_[id] = std::move(listener);
                return id;
            }

            bool SimulationContext::unsubscribe(uint64_t subscription_id)
            {
                return listeners_.erase(subscription_id) > 0;
            }

            void SimulationContext::publish(SimulationEventType type, const std::string &device,
                                            const std::string &port, const std::string &description)
            {
                if (listeners_.empty())
                {
                    return;
                }

                SimulationEvent event{type, clock_.nowMs(), device, port, description};

                // Listener có thể unsubscribe trong callback
                auto snapshot = listeners_;
                for (const auto &pair : snapshot)
                {
                    pair.second(event);
                }
            }

            // ==================== Capture ====================

            bool SimulationContext::enableCapture(const std::string &file_path)
            {
                if (!capture_)
                {
                    capture_ = std::make_unique<Storage::PcapWriter>();
                }
                return capture_->open(file_path);
            }

            void SimulationContext::disableCapture()
            {
                if (capture_)
                {
                    capture_->close();
                }
            }

            Common::MacAddress SimulationContext::allocateMac()
            {
                return Common::MacAddress::generate(++mac_sequence_);
            }

        } // namespace Sim
    }     // namespace Core
} // namespace NetSim
