// src/core/l2/switch.hpp
#ifndef NETSIM_SWITCH_HPP
#define NETSIM_SWITCH_HPP

#include "mac_table.hpp"
#include "../sim/frame_sink.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <map>
#include <memory>
#include <set>

namespace NetSim
{
    namespace Core
    {
        namespace L2
        {
            enum class PortMode
            {
                ACCESS,
                TRUNK
            };

            struct SwitchPort
            {
                std::string name;
                bool enabled = true;
                PortMode mode = PortMode::ACCESS;
                uint16_t access_vlan = 1;
                uint16_t native_vlan = 1;
                std::set<uint16_t> allowed_vlans;   // trunk; rỗng = mọi VLAN

                bool carriesVlan(uint16_t vlan) const
                {
                    if (mode == PortMode::ACCESS)
                    {
                        return access_vlan == vlan;
                    }
                    return allowed_vlans.empty() || allowed_vlans.count(vlan) > 0;
                }
            };

            struct SwitchStatistics
            {
                uint64_t frames_received = 0;
                uint64_t frames_forwarded = 0;
                uint64_t frames_flooded = 0;
                uint64_t frames_filtered = 0;   // đích nằm trên chính port nhận
                uint64_t frames_dropped = 0;    // port tắt, VLAN không hợp lệ
            };

            using FrameForwardCallback = std::function<void(const std::string &egress_port, const Packet::EthernetFrame &frame)>;

            /**
             * @brief Switch học MAC với VLAN access/trunk (802.1Q)
             *
             * Nhận frame trên port P:
             *  1. Học MAC nguồn unicast -> P
             *  2. Broadcast/multicast/unknown: flood ra mọi port bật cùng VLAN, trừ P
             *  3. Đích đã biết: forward ra port đã học; nếu chính là P thì lọc bỏ
             */
            class Switch : public Sim::FrameSink
            {
            public:
                Switch(Sim::SimulationContext &context, const std::string &name, size_t port_count = 8);
                ~Switch() override;

                // ==================== FrameSink ====================
                void receiveFrame(const std::string &port, const Packet::EthernetFrame &frame) override;
                Sim::DeviceKind getKind() const override { return Sim::DeviceKind::SWITCH; }
                std::vector<std::string> getPortNames() const override;
                bool hasPort(const std::string &port) const override { return ports_.count(port) > 0; }

                // ==================== Ports ====================
                bool setPortEnabled(const std::string &port, bool enabled);
                bool setAccessVlan(const std::string &port, uint16_t vlan);
                bool setTrunk(const std::string &port, const std::set<uint16_t> &allowed_vlans = {}, uint16_t native_vlan = 1);
                std::optional<SwitchPort> getPort(const std::string &port) const;

                // ==================== MAC table ====================
                const MacTable &getMacTable() const { return mac_table_; }
                size_t ageMacTable();

                /**
                 * @brief Observer cho mọi frame được phát ra
                 */
                void onFrameForward(FrameForwardCallback callback);

                const SwitchStatistics &getStatistics() const { return stats_; }

                static bool isValidVlan(uint16_t vlan) { return vlan >= 1 && vlan <= 4094; }

            private:
                std::shared_ptr<spdlog::logger> logger_;
                std::map<std::string, SwitchPort> ports_;
                std::vector<std::string> port_order_;
                MacTable mac_table_;
                std::vector<FrameForwardCallback> forward_callbacks_;
                SwitchStatistics stats_;
                uint64_t aging_subscription_;

                /**
                 * @brief VLAN của frame vào, nullopt nếu port không chấp nhận frame
                 */
                std::optional<uint16_t> classifyIngress(const SwitchPort &port, const Packet::EthernetFrame &frame) const;

                void flood(const std::string &ingress, uint16_t vlan, const Packet::EthernetFrame &frame);
                void emit(const SwitchPort &egress, uint16_t vlan, const Packet::EthernetFrame &frame);
            };

        } // namespace L2
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_SWITCH_HPP
