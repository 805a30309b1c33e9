// src/core/nat/nat_engine.hpp
#ifndef NETSIM_NAT_ENGINE_HPP
#define NETSIM_NAT_ENGINE_HPP

#include "nat_types.hpp"
#include "../acl/acl_engine.hpp"
#include "../sim/timer_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Nat
        {
            /**
             * @brief NAT/PAT engine của một router
             *
             * Chiều ra (inside -> outside): static trước, sau đó các binding ACL theo thứ
             * tự cấu hình (PAT nếu overload, ngược lại cấp địa chỉ pool). Chiều vào: tra
             * ngược theo inside global (và port với PAT).
             *
             * Packet gốc không bao giờ bị sửa; kết quả là packet mới có checksum tính lại.
             */
            class NatEngine
            {
            public:
                static constexpr uint64_t DEFAULT_TIMEOUT_MS = 86400ULL * 1000;

                explicit NatEngine(const Sim::VirtualClock &clock,
                                   uint64_t translation_timeout_ms = DEFAULT_TIMEOUT_MS,
                                   uint16_t pat_port_min = 1024,
                                   uint16_t pat_port_max = 65535);

                // ==================== Interfaces ====================
                void setInsideInterface(const std::string &interface_name);
                void setOutsideInterface(const std::string &interface_name);
                bool removeInterface(const std::string &interface_name);
                bool isInside(const std::string &interface_name) const { return inside_.count(interface_name) > 0; }
                bool isOutside(const std::string &interface_name) const { return outside_.count(interface_name) > 0; }

                // ==================== Static / pools / bindings ====================

                /**
                 * @brief Static NAT 1:1. Một inside local chỉ map tới một inside global.
                 */
                bool addStaticNAT(const Common::IPv4Address &inside_local, const Common::IPv4Address &inside_global);
                bool removeStaticNAT(const Common::IPv4Address &inside_local);

                bool addPool(const std::string &name, const Common::IPv4Address &start,
                             const Common::IPv4Address &end, const Common::SubnetMask &netmask);
                bool removePool(const std::string &name);
                const NatPool *getPool(const std::string &name) const;

                /**
                 * @brief Gắn ACL với pool hoặc interface. Binding cùng ACL bị thay thế.
                 */
                bool bindAccessList(const std::string &acl_id,
                                    const std::optional<std::string> &pool,
                                    const std::optional<std::string> &interface_name,
                                    bool overload);
                bool unbindAccessList(const std::string &acl_id);
                const std::vector<NatBinding> &getBindings() const { return bindings_; }

                // ==================== Translation ====================

                /**
                 * @brief Dịch packet đi từ inside ra outside
                 * @param inside_interface Interface nhận packet
                 * @param outside_address IP của interface outside (cho "interface overload")
                 * @param acl ACL engine của router để khớp source với binding
                 */
                NatOutcome translateOutgoing(const Packet::IPv4Packet &packet,
                                             const std::string &inside_interface,
                                             const Common::IPv4Address &outside_address,
                                             const Acl::AclEngine &acl);

                /**
                 * @brief Dịch ngược packet đi từ outside vào
                 */
                NatOutcome translateIncoming(const Packet::IPv4Packet &packet);

                /**
                 * @brief Địa chỉ inside global đang được dùng bởi một translation (static, dynamic hoặc PAT)
                 */
                bool isTranslatedGlobal(const Common::IPv4Address &address) const;

                // ==================== Lifecycle ====================

                /**
                 * @brief Xóa các dynamic/PAT translation quá timeout
                 * @return Số translation bị xóa
                 */
                size_t cleanupExpiredTranslations();

                void clearDynamicTranslations();
                void clearAllTranslations();

                std::vector<NatTranslation> getTranslations() const;
                NatStatistics getStatistics() const;

                uint64_t getTranslationTimeout() const { return timeout_ms_; }
                void setTranslationTimeout(uint64_t timeout_ms) { timeout_ms_ = timeout_ms; }

            private:
                std::shared_ptr<spdlog::logger> logger_;
                const Sim::VirtualClock &clock_;
                uint64_t timeout_ms_;
                uint16_t port_min_;
                uint16_t port_max_;
                uint16_t port_cursor_;

                std::set<std::string> inside_;
                std::set<std::string> outside_;

                std::map<Common::IPv4Address, NatTranslation> statics_;
                std::map<std::string, NatPool> pools_;
                std::vector<NatBinding> bindings_;

                std::map<Common::IPv4Address, NatTranslation> dynamic_;            // key: inside local
                std::map<PatKey, NatTranslation> pat_;
                std::set<std::pair<uint32_t, uint16_t>> pat_ports_in_use_;        // (global, port)

                uint64_t hits_;
                uint64_t misses_;
                uint64_t expired_;

                NatOutcome translatePat(const Packet::IPv4Packet &packet, const Common::IPv4Address &global);
                NatOutcome translateDynamic(const Packet::IPv4Packet &packet, const NatPool &pool);
                std::optional<uint16_t> allocatePort(const Common::IPv4Address &global);
                void touch(NatTranslation &translation);
                void erasePat(std::map<PatKey, NatTranslation>::iterator it);
                bool isGlobalInUse(const Common::IPv4Address &address) const;
                NatOutcome miss(const std::string &reason, const Common::IPv4Address &source);
            };

        } // namespace Nat
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_NAT_ENGINE_HPP
