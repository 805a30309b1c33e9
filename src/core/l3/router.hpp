// src/core/l3/router.hpp
#ifndef NETSIM_ROUTER_HPP
#define NETSIM_ROUTER_HPP

#include "arp_cache.hpp"
#include "routing_table.hpp"
#include "../acl/acl_engine.hpp"
#include "../nat/nat_engine.hpp"
#include "../ospf/ospf_engine.hpp"
#include "../sim/frame_sink.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace NetSim
{
    namespace Core
    {
        namespace L3
        {
            struct RouterInterface
            {
                std::string name;
                Common::MacAddress mac;
                Common::IPv4Address ip_address;
                Common::SubnetMask mask;
                bool configured = false;   // đã có địa chỉ IP
                bool enabled = true;

                bool isUp() const { return configured && enabled; }
            };

            struct RouterStatistics
            {
                uint64_t received = 0;
                uint64_t forwarded = 0;
                uint64_t delivered_locally = 0;
                uint64_t ttl_exceeded = 0;
                uint64_t no_route = 0;
                uint64_t acl_denied = 0;
                uint64_t checksum_errors = 0;
                uint64_t nat_miss = 0;
                uint64_t arp_queued = 0;
                uint64_t icmp_sent = 0;
            };

            /**
             * @brief Router IPv4: chuyển tiếp theo bảng định tuyến, ACL, NAT, ARP và OSPF
             *
             * Thứ tự xử lý packet đi vào: checksum, NAT outside -> inside, giao nội bộ
             * (bỏ qua ACL), ACL vào, TTL, tra route, NAT inside -> outside, ACL ra, ARP.
             * Mọi lỗi đều kết thúc bằng drop có đếm hoặc một ICMP tổng hợp.
             */
            class Router : public Sim::FrameSink
            {
            public:
                Router(Sim::SimulationContext &context, const std::string &name, size_t interface_count = 4);
                ~Router() override;

                // ==================== FrameSink ====================
                void receiveFrame(const std::string &port, const Packet::EthernetFrame &frame) override;
                Sim::DeviceKind getKind() const override { return Sim::DeviceKind::ROUTER; }
                std::vector<std::string> getPortNames() const override { return interface_order_; }
                bool hasPort(const std::string &port) const override { return interfaces_.count(port) > 0; }

                // ==================== Interfaces ====================

                /**
                 * @brief Gán IP cho interface và thêm connected route
                 */
                bool configureInterface(const std::string &name, const Common::IPv4Address &ip,
                                        const Common::SubnetMask &mask);
                bool shutdownInterface(const std::string &name);
                bool noShutdownInterface(const std::string &name);
                const RouterInterface *getInterface(const std::string &name) const;

                /**
                 * @brief true nếu ip là địa chỉ của một interface đang up
                 */
                bool ownsAddress(const Common::IPv4Address &ip) const;

                // ==================== Routing ====================

                /**
                 * @brief Static route qua next hop. Interface ra là interface có subnet chứa next hop.
                 */
                bool addStaticRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask,
                                    const Common::IPv4Address &next_hop);

                /**
                 * @brief Static route gắn trực tiếp vào interface
                 */
                bool addStaticRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask,
                                    const std::string &interface_name);

                bool removeStaticRoute(const Common::IPv4Address &network, const Common::SubnetMask &mask);
                bool setDefaultRoute(const Common::IPv4Address &next_hop);

                const RoutingTable &getRoutingTable() const { return routing_table_; }

                // ==================== Services ====================
                Acl::AclEngine &acl() { return acl_; }
                const Acl::AclEngine &acl() const { return acl_; }
                Nat::NatEngine &nat() { return nat_; }
                const Nat::NatEngine &nat() const { return nat_; }
                const ArpCache &getArpCache() const { return arp_cache_; }

                // ==================== OSPF ====================

                /**
                 * @brief "router ospf" với router ID cho trước
                 */
                Ospf::OspfEngine &enableOspf(const Common::IPv4Address &router_id);
                void disableOspf();
                Ospf::OspfEngine *ospf() { return ospf_.get(); }
                const Ospf::OspfEngine *ospf() const { return ospf_.get(); }

                /**
                 * @brief "network A.B.C.D W.W.W.W area X": kích hoạt OSPF trên các interface khớp
                 */
                bool ospfNetwork(const Common::IPv4Address &network, const Common::WildcardMask &wildcard,
                                 const Common::IPv4Address &area_id);

                /**
                 * @brief "ip ospf ..." trên interface; áp dụng lại nếu interface đang chạy OSPF
                 */
                bool setOspfInterfaceOptions(const std::string &interface_name, const Ospf::InterfaceOptions &options);

                // ==================== Local traffic ====================

                /**
                 * @brief Gửi ICMP echo request từ interface ra
                 * @return false nếu không có route tới đích
                 */
                bool ping(const Common::IPv4Address &destination);

                /**
                 * @brief Packet giao cho router mà không phải OSPF hay echo request (echo reply, ICMP error...)
                 */
                const std::vector<Packet::IPv4Packet> &getReceivedPackets() const { return received_packets_; }
                void clearReceivedPackets() { received_packets_.clear(); }

                const RouterStatistics &getStatistics() const { return stats_; }

            private:
                struct StaticRoute
                {
                    Common::IPv4Address network;
                    Common::SubnetMask mask;
                    std::optional<Common::IPv4Address> next_hop;
                    std::string interface_name;
                };

                std::shared_ptr<spdlog::logger> logger_;
                std::map<std::string, RouterInterface> interfaces_;
                std::vector<std::string> interface_order_;

                RoutingTable routing_table_;
                std::vector<StaticRoute> static_routes_;
                ArpCache arp_cache_;
                Acl::AclEngine acl_;
                Nat::NatEngine nat_;
                std::unique_ptr<Ospf::OspfEngine> ospf_;
                std::map<std::string, Ospf::InterfaceOptions> ospf_options_;

                uint8_t default_ttl_;
                uint16_t ping_identifier_;
                uint16_t ping_sequence_;
                uint64_t nat_timeout_subscription_;
                std::vector<Packet::IPv4Packet> received_packets_;
                RouterStatistics stats_;

                RouterInterface *findInterface(const std::string &name);
                std::optional<std::string> interfaceForNextHop(const Common::IPv4Address &next_hop) const;
                bool isLocalDestination(const RouterInterface &ingress, const Common::IPv4Address &destination) const;

                void handleArp(RouterInterface &iface, const Packet::ArpPacket &arp);
                void handleIPv4(RouterInterface &iface, const Common::MacAddress &previous_hop,
                                const Packet::IPv4Packet &packet);
                void deliverLocally(RouterInterface &iface, const Packet::IPv4Packet &packet);

                /**
                 * @brief ICMP error về nguồn của packet gốc, phát ra interface nhận tới MAC của hop trước
                 */
                void sendIcmpError(const RouterInterface &ingress, const Common::MacAddress &previous_hop,
                                   const Packet::IPv4Packet &original, Packet::IcmpType type, uint8_t code);

                /**
                 * @brief Gửi packet do router tạo ra theo bảng định tuyến (không qua ACL/NAT)
                 */
                bool originate(const Packet::IPv4Packet &packet);
                void transmit(const RouterInterface &egress, const Common::IPv4Address &next_hop,
                              const Packet::IPv4Packet &packet);

                void sendOspf(const std::string &interface_name, const Common::IPv4Address &destination,
                              const Packet::OspfPacket &packet);
                void activateOspf(const RouterInterface &iface);
                Ospf::InterfaceOptions ospfOptionsFor(const std::string &interface_name) const;
                void restoreStaticRoutes(const std::string &interface_name);
            };

        } // namespace L3
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ROUTER_HPP
