// src/core/l3/host.cpp
#include "host.hpp"
#include "../packet/packet_builder.hpp"
#include "../sim/simulation_context.hpp"
#include "../../common/logger.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            Host::Host(Sim::SimulationContext &context, const std::string &name)
                : FrameSink(context, name),
                  logger_(NETSIM_GET_LOGGER("Host")),
                  mac_(context.allocateMac()),
                  configured_(false),
                  arp_cache_(static_cast<uint64_t>(NETSIM_CONFIG_GET_INT(context.config(), Common::ConfigKeys::ROUTER_ARP_TIMEOUT, 14400)) * 1000),
                  ping_identifier_(0x100),
                  ping_sequence_(0)
            {
            }

            bool Host::configure(const Common::IPv4Address &ip, const Common::SubnetMask &mask,
                                 const std::optional<Common::IPv4Address> &gateway)
            {
                if (!mask.isContiguous() || ip.isUnspecified() || ip.isMulticast() || ip.isBroadcast())
                {
                    logger_->warn("{}: invalid address {} {}", name_, ip.toString(), mask.toString());
                    return false;
                }
                if (gateway && !mask.sameSubnet(ip, *gateway))
                {
                    logger_->warn("{}: gateway {} is not in {}/{}", name_, gateway->toString(), ip.toString(),
                                  mask.prefixLength());
                    return false;
                }

                ip_address_ = ip;
                mask_ = mask;
                gateway_ = gateway;
                configured_ = true;
                arp_cache_.clear();
                logger_->info("{}: {}/{} gateway {}", name_, ip.toString(), mask.prefixLength(),
                              gateway ? gateway->toString() : std::string("none"));
                return true;
            }

            // ==================== Traffic ====================

            bool Host::ping(const Common::IPv4Address &destination, uint8_t ttl)
            {
                if (!configured_)
                {
                    logger_->warn("{}: cannot ping, no address configured", name_);
                    return false;
                }

                auto echo = Packet::PacketBuilder::createEchoRequest(ping_identifier_, ++ping_sequence_);
                auto packet = Packet::PacketBuilder::buildIPv4Packet(ip_address_, destination, Packet::IpProtocol::ICMP,
                                                                     ttl, echo, 0, ping_sequence_);
                return packet && sendPacket(*packet);
            }

            bool Host::sendPacket(const Packet::IPv4Packet &packet)
            {
                if (!configured_)
                {
                    return false;
                }

                const Common::IPv4Address &destination = packet.destination();
                if (destination.isBroadcast())
                {
                    ++stats_.sent;
                    sendFrame(PORT_NAME, Packet::PacketBuilder::createFrame(mac_, Common::MacAddress::broadcast(), packet));
                    return true;
                }
                if (destination.isMulticast())
                {
                    ++stats_.sent;
                    sendFrame(PORT_NAME, Packet::PacketBuilder::createFrame(
                                             mac_, Common::MacAddress::fromMulticastIPv4(destination), packet));
                    return true;
                }

                if (mask_.sameSubnet(ip_address_, destination))
                {
                    transmit(destination, packet);
                    return true;
                }
                if (!gateway_)
                {
                    logger_->debug("{}: no gateway for {}", name_, destination.toString());
                    return false;
                }
                transmit(*gateway_, packet);
                return true;
            }

            void Host::transmit(const Common::IPv4Address &next_hop, const Packet::IPv4Packet &packet)
            {
                ++stats_.sent;
                auto mac = arp_cache_.lookup(next_hop, context_.nowMs());
                if (mac)
                {
                    sendFrame(PORT_NAME, Packet::PacketBuilder::createFrame(mac_, *mac, packet));
                    return;
                }

                if (arp_cache_.enqueue(next_hop, PORT_NAME, packet))
                {
                    sendFrame(PORT_NAME, Packet::PacketBuilder::createArpRequest(mac_, ip_address_, next_hop));
                }
            }

            // ==================== Receive path ====================

            void Host::receiveFrame(const std::string &port, const Packet::EthernetFrame &frame)
            {
                if (port != PORT_NAME || !configured_)
                {
                    return;
                }
                if (frame.destination() != mac_ && !frame.destination().isBroadcast())
                {
                    return;
                }

                if (const auto *arp = frame.arp())
                {
                    handleArp(*arp);
                }
                else if (const auto *packet = frame.ipv4())
                {
                    handleIPv4(*packet);
                }
            }

            void Host::handleArp(const Packet::ArpPacket &arp)
            {
                if (!mask_.sameSubnet(ip_address_, arp.sender_ip) || arp.sender_ip.isUnspecified())
                {
                    return;
                }

                arp_cache_.insert(arp.sender_ip, arp.sender_mac, PORT_NAME, context_.nowMs());
                for (const auto &pending : arp_cache_.takePending(arp.sender_ip))
                {
                    sendFrame(PORT_NAME, Packet::PacketBuilder::createFrame(mac_, arp.sender_mac, pending.packet));
                }

                if (arp.operation == Packet::ArpOperation::REQUEST && arp.target_ip == ip_address_)
                {
                    sendFrame(PORT_NAME, Packet::PacketBuilder::createArpReply(mac_, ip_address_, arp.sender_mac, arp.sender_ip));
                }
            }

            void Host::handleIPv4(const Packet::IPv4Packet &packet)
            {
                if (!Packet::verifyChecksum(packet))
                {
                    ++stats_.checksum_errors;
                    logger_->debug("{}: bad header checksum from {}", name_, packet.source().toString());
                    return;
                }
                if (packet.destination() != ip_address_ && !packet.destination().isBroadcast())
                {
                    return;
                }

                ++stats_.received;
                const auto *icmp = packet.payloadAs<Packet::IcmpMessage>();
                if (icmp != nullptr && icmp->type == Packet::IcmpType::ECHO_REQUEST)
                {
                    auto reply = Packet::PacketBuilder::buildIPv4Packet(ip_address_, packet.source(), Packet::IpProtocol::ICMP,
                                                                        64, Packet::PacketBuilder::createEchoReply(*icmp));
                    if (reply && sendPacket(*reply))
                    {
                        ++stats_.echo_replies_sent;
                    }
                    return;
                }

                received_packets_.push_back(packet);
            }

        } // namespace L3
    }     // namespace Core
} // namespace NetSim
