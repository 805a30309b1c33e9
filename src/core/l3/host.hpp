// src/core/l3/host.hpp
#ifndef NETSIM_HOST_HPP
#define NETSIM_HOST_HPP

#include "arp_cache.hpp"
#include "../sim/frame_sink.hpp"
#include <memory>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            struct HostStatistics
            {
                uint64_t sent = 0;
                uint64_t received = 0;
                uint64_t checksum_errors = 0;
                uint64_t echo_replies_sent = 0;
            };

            /**
             * @brief End host một interface (eth0) với IP, default gateway và ARP
             *
             * Tự trả lời ARP request và ICMP echo request; mọi packet khác gửi tới host
             * được lưu lại trong getReceivedPackets().
             */
            class Host : public Sim::FrameSink
            {
            public:
                static constexpr const char *PORT_NAME = "eth0";

                Host(Sim::SimulationContext &context, const std::string &name);

                // ==================== FrameSink ====================
                void receiveFrame(const std::string &port, const Packet::EthernetFrame &frame) override;
                Sim::DeviceKind getKind() const override { return Sim::DeviceKind::HOST; }
                std::vector<std::string> getPortNames() const override { return {PORT_NAME}; }
                bool hasPort(const std::string &port) const override { return port == PORT_NAME; }

                // ==================== Configuration ====================
                bool configure(const Common::IPv4Address &ip, const Common::SubnetMask &mask,
                               const std::optional<Common::IPv4Address> &gateway = std::nullopt);

                const Common::IPv4Address &getIpAddress() const { return ip_address_; }
                const std::optional<Common::IPv4Address> &getGateway() const { return gateway_; }

                // ==================== Traffic ====================

                /**
                 * @brief Gửi ICMP echo request
                 * @return false nếu host chưa cấu hình hoặc đích ngoài subnet mà không có gateway
                 */
                bool ping(const Common::IPv4Address &destination, uint8_t ttl = 64);

                /**
                 * @brief Gửi packet có sẵn (checksum giữ nguyên như người gọi tạo)
                 */
                bool sendPacket(const Packet::IPv4Packet &packet);

                const std::vector<Packet::IPv4Packet> &getReceivedPackets() const { return received_packets_; }
                void clearReceivedPackets() { received_packets_.clear(); }

                const ArpCache &getArpCache() const { return arp_cache_; }
                const HostStatistics &getStatistics() const { return stats_; }

            private:
                std::shared_ptr<spdlog::logger> logger_;
                Common::MacAddress mac_;
                Common::IPv4Address ip_address_;
                Common::SubnetMask mask_;
                std::optional<Common::IPv4Address> gateway_;
                bool configured_;

                ArpCache arp_cache_;
                uint16_t ping_identifier_;
                uint16_t ping_sequence_;
                std::vector<Packet::IPv4Packet> received_packets_;
                HostStatistics stats_;

                void handleArp(const Packet::ArpPacket &arp);
                void handleIPv4(const Packet::IPv4Packet &packet);
                void transmit(const Common::IPv4Address &next_hop, const Packet::IPv4Packet &packet);
            };

        } // namespace L3
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_HOST_HPP
