// src/core/ospf/ospf_engine.hpp
#ifndef NETSIM_OSPF_ENGINE_HPP
#define NETSIM_OSPF_ENGINE_HPP

#include "ospf_types.hpp"
#include "lsdb.hpp"
#include "../l3/routing_table.hpp"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            /**
             * @brief OSPFv2 của một router: interface, neighbor FSM (RFC 2328 §10),
             *        trao đổi database, flooding và SPF
             *
             * Engine không biết gì về frame hay cable: packet đi ra qua SendCallback,
             * packet đi vào qua processPacket(). Packet gửi đi được xếp hàng và chỉ được
             * đẩy ra sau khi handler hiện tại hoàn tất, nên việc chuyển phát đồng bộ
             * không bao giờ gặp một neighbor đang cập nhật dở.
             *
             * Mọi timer (hello, wait, inactivity, retransmit, refresh) là task trên
             * TimerScheduler, thuộc về interface hoặc neighbor tương ứng và bị hủy cùng nó.
             */
            class OspfEngine
            {
            public:
                using SendCallback = std::function<void(const std::string &interface_name,
                                                        const Common::IPv4Address &destination,
                                                        const Packet::OspfPacket &packet)>;
                using RouteCallback = std::function<void(const std::vector<L3::Route> &routes)>;

                OspfEngine(Sim::TimerScheduler &scheduler, const Common::IPv4Address &router_id);
                ~OspfEngine();

                OspfEngine(const OspfEngine &) = delete;
                OspfEngine &operator=(const OspfEngine &) = delete;

                void setSendCallback(SendCallback callback) { send_callback_ = std::move(callback); }
                void setRouteCallback(RouteCallback callback) { route_callback_ = std::move(callback); }

                const Common::IPv4Address &getRouterId() const { return router_id_; }

                // ==================== Configuration ====================

                /**
                 * @brief "network A.B.C.D W.W.W.W area X"
                 */
                void addNetwork(const Common::IPv4Address &network, const Common::WildcardMask &wildcard,
                                const Common::IPv4Address &area_id);

                /**
                 * @brief Area của network statement đầu tiên khớp với ip
                 */
                std::optional<Common::IPv4Address> matchNetwork(const Common::IPv4Address &ip) const;

                const std::vector<NetworkStatement> &getNetworks() const { return networks_; }

                bool activateInterface(const std::string &name, const Common::IPv4Address &ip,
                                       const Common::SubnetMask &mask, const Common::IPv4Address &area_id,
                                       const InterfaceOptions &options = InterfaceOptions());

                /**
                 * @brief Gỡ interface: KillNbr mọi neighbor, hủy timer, tính lại LSA và SPF
                 */
                bool deactivateInterface(const std::string &name);

                /**
                 * @brief Neighbor tĩnh trên interface NBMA, bắt đầu ở Attempt
                 */
                bool addNBMANeighbor(const std::string &interface_name, const Common::IPv4Address &ip,
                                     uint8_t priority = OspfConstants::DEFAULT_PRIORITY);

                // ==================== Packet processing ====================

                void processPacket(const std::string &interface_name, const Common::IPv4Address &source,
                                   const Packet::OspfPacket &packet);

                void processHello(const std::string &interface_name, const Common::IPv4Address &source,
                                  const Packet::OspfPacket &packet);
                void processDD(const std::string &interface_name, const Common::IPv4Address &source,
                               const Packet::OspfPacket &packet);
                void processLSR(const std::string &interface_name, const Common::IPv4Address &source,
                                const Packet::OspfPacket &packet);
                void processLSUpdate(const std::string &interface_name, const Common::IPv4Address &source,
                                     const Packet::OspfPacket &packet);
                void processLSAck(const std::string &interface_name, const Common::IPv4Address &source,
                                  const Packet::OspfPacket &packet);

                // ==================== Inspection ====================

                const OspfInterface *getInterface(const std::string &name) const;
                std::vector<std::string> getInterfaceNames() const;
                const OspfNeighbor *getNeighbor(const std::string &interface_name,
                                                const Common::IPv4Address &router_id) const;

                /**
                 * @brief Nhật ký chuyển trạng thái neighbor theo thứ tự thời gian
                 *
                 * Mỗi dòng: "OSPF: Neighbor <rid> (<iface>): <old> -> <new> (<event>)"
                 */
                const std::vector<std::string> &getEventLog() const { return event_log_; }
                void clearEventLog() { event_log_.clear(); }

                /**
                 * @brief LSDB của area, nullptr nếu router không có interface trong area đó
                 */
                const LinkStateDatabase *getLsdb(const Common::IPv4Address &area_id = Common::IPv4Address::any()) const;

                const std::vector<L3::Route> &getRoutes() const { return routes_; }
                const OspfStatistics &getStatistics() const { return stats_; }

                /**
                 * @brief Hủy mọi timer và interface. Không gửi packet nào nữa.
                 */
                void shutdown();

            private:
                struct OutgoingPacket
                {
                    std::string interface_name;
                    Common::IPv4Address destination;
                    Packet::OspfPacket packet;
                };

                Sim::TimerScheduler &scheduler_;
                Common::IPv4Address router_id_;
                std::shared_ptr<spdlog::logger> logger_;

                SendCallback send_callback_;
                RouteCallback route_callback_;

                std::vector<NetworkStatement> networks_;
                std::map<std::string, OspfInterface> interfaces_;
                std::map<Common::IPv4Address, LinkStateDatabase> areas_;

                std::vector<std::string> event_log_;
                std::vector<L3::Route> routes_;
                OspfStatistics stats_;

                std::deque<OutgoingPacket> outbox_;
                bool flushing_;
                bool shutting_down_;
                std::set<Common::IPv4Address> dirty_areas_;
                bool spf_pending_;
                uint32_t next_dd_sequence_;
                Sim::TimerId refresh_timer_;

                uint64_t nowMs() const { return scheduler_.clock().nowMs(); }

                OspfInterface *findInterface(const std::string &name);
                OspfNeighbor *findNeighbor(OspfInterface &iface, const Common::IPv4Address &router_id);
                bool acceptPacket(const OspfInterface *iface, const Packet::OspfPacket &packet) const;

                // ---- Neighbor state machine ----
                void handleEvent(OspfInterface &iface, OspfNeighbor &neighbor, NeighborEvent event);
                void setState(OspfInterface &iface, OspfNeighbor &neighbor, NeighborState state, NeighborEvent event);
                bool shouldBeAdjacent(const OspfInterface &iface, const OspfNeighbor &neighbor) const;
                void startExStart(OspfInterface &iface, OspfNeighbor &neighbor);
                void clearAdjacency(OspfNeighbor &neighbor);
                void restartInactivityTimer(OspfInterface &iface, OspfNeighbor &neighbor);
                void removeNeighbor(OspfInterface &iface, const Common::IPv4Address &key);

                // ---- Interface state machine ----
                void electDesignatedRouter(OspfInterface &iface);
                void onNeighborChange(OspfInterface &iface);
                void onWaitTimer(const std::string &interface_name);

                // ---- Database exchange ----
                void handleHello(OspfInterface &iface, const Common::IPv4Address &source, const Packet::OspfPacket &packet);
                void handleDD(OspfInterface &iface, OspfNeighbor &neighbor, const Packet::OspfDatabaseDescription &dd);
                void acceptDD(OspfInterface &iface, OspfNeighbor &neighbor, const Packet::OspfDatabaseDescription &dd);
                void sendDD(OspfInterface &iface, OspfNeighbor &neighbor, uint8_t flags);
                void sendNextDD(OspfInterface &iface, OspfNeighbor &neighbor);
                void sendLSR(OspfInterface &iface, OspfNeighbor &neighbor);
                void restartRetransmitTimer(OspfInterface &iface, OspfNeighbor &neighbor);
                void onRetransmitTimer(const std::string &interface_name, const Common::IPv4Address &key);

                // ---- Flooding ----
                void installAndFlood(OspfInterface *from_iface, const OspfNeighbor *from_neighbor,
                                     const Common::IPv4Address &area_id, const Packet::Lsa &lsa);
                void addToRetransmissionList(OspfInterface &iface, OspfNeighbor &neighbor, const Packet::Lsa &lsa);
                void scheduleLsuRetransmit(OspfInterface &iface, OspfNeighbor &neighbor);
                void onLsuRetransmitTimer(const std::string &interface_name, const Common::IPv4Address &key);
                void sendLSU(OspfInterface &iface, const Common::IPv4Address &destination, std::vector<Packet::Lsa> lsas);
                void sendAck(OspfInterface &iface, const Common::IPv4Address &destination,
                             const std::vector<Packet::LsaHeader> &headers);
                bool isSelfOriginated(const Packet::LsaHeader &header) const;

                /**
                 * @brief Gỡ LSA MaxAge mang MaxSequenceNumber khi không còn chờ ack
                 *
                 * LSA tự sinh bị gỡ được originate lại với InitialSequenceNumber.
                 */
                void purgeWrappedLsas();

                // ---- Origination, SPF ----
                void originateRouterLsa(const Common::IPv4Address &area_id, bool force);
                void originateNetworkLsas(const Common::IPv4Address &area_id, bool force);
                void originate(const Common::IPv4Address &area_id, const Packet::Lsa &lsa, bool force);
                void onRefreshTimer();
                void runSpf();

                // ---- Output ----
                void sendHello(OspfInterface &iface);
                void scheduleHello(OspfInterface &iface);
                void sendPacket(const OspfInterface &iface, const Common::IPv4Address &destination, Packet::OspfBody body);
                Common::IPv4Address neighborDestination(const OspfInterface &iface, const OspfNeighbor &neighbor) const;

                /**
                 * @brief Tính lại LSA/SPF nếu cần, rồi đẩy outbox ra SendCallback
                 */
                void finishProcessing();
                void flush();
            };

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_OSPF_ENGINE_HPP
