// src/core/acl/acl_engine.hpp
#ifndef NETSIM_ACL_ENGINE_HPP
#define NETSIM_ACL_ENGINE_HPP

#include "acl_types.hpp"
#include "../packet/ipv4_packet.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <utility>

namespace NetSim
{
    namespace Core
    {
        namespace Acl
        {
            /**
             * @brief ACL engine của một router
             *
             * Entries được đánh giá theo sequence tăng dần; entry đầu tiên khớp quyết
             * định kết quả và tăng hit counter. Không entry nào khớp thì deny ngầm định.
             * ACL không tồn tại thì permit.
             */
            class AclEngine
            {
            public:
                static constexpr uint32_t SEQUENCE_STEP = 10;

                AclEngine();

                /**
                 * @brief Loại ACL theo số: 1-99, 1300-1999 standard; 100-199, 2000-2699 extended
                 */
                static std::optional<AclType> typeForNumber(int number);

                // ==================== Configuration ====================

                /**
                 * @brief Tạo ACL rỗng. Không làm gì nếu ACL đã tồn tại cùng loại.
                 */
                bool createACL(const std::string &id, AclType type, bool named = false);

                /**
                 * @brief Thêm entry vào ACL đánh số (tạo ACL nếu chưa có)
                 * @return Sequence được gán, nullopt nếu bị từ chối
                 */
                std::optional<uint32_t> addNumberedEntry(int number, const AclEntry &entry);

                /**
                 * @brief Thêm entry vào named ACL (tạo ACL nếu chưa có)
                 */
                std::optional<uint32_t> addNamedEntry(const std::string &name, AclType type, const AclEntry &entry);

                bool removeEntry(const std::string &id, uint32_t sequence);
                bool deleteACL(const std::string &id);

                /**
                 * @brief Gắn ACL vào (interface, direction). Gắn lại sẽ ghi đè.
                 */
                bool bindToInterface(const std::string &interface_name, const std::string &id, Direction direction);
                bool unbindFromInterface(const std::string &interface_name, Direction direction);
                std::optional<std::string> getBoundACL(const std::string &interface_name, Direction direction) const;

                // ==================== Evaluation ====================

                AclAction checkPacket(const std::string &id,
                                      const Common::IPv4Address &source,
                                      const std::optional<Common::IPv4Address> &destination = std::nullopt,
                                      const std::optional<uint8_t> &protocol = std::nullopt,
                                      const std::optional<uint16_t> &source_port = std::nullopt,
                                      const std::optional<uint16_t> &destination_port = std::nullopt);

                AclAction checkPacket(const std::string &id, const AclQuery &query);
                AclAction checkPacket(const std::string &id, const Packet::IPv4Packet &packet);

                /**
                 * @brief Đánh giá ACL gắn trên interface; không có binding thì permit
                 */
                AclAction checkInterface(const std::string &interface_name, Direction direction,
                                         const Packet::IPv4Packet &packet);

                /**
                 * @brief true nếu source khớp ACL mà không tăng hit counter (dùng cho NAT)
                 */
                bool matchesSource(const std::string &id, const Common::IPv4Address &source) const;

                static AclQuery queryFromPacket(const Packet::IPv4Packet &packet);

                // ==================== Inspection ====================

                const AccessList *getACL(const std::string &id) const;
                std::vector<AccessList> getAllACLs() const;
                bool clearCounters(const std::string &id);
                void clearAllCounters();
                AclStatistics getStatistics() const;

            private:
                using BindingKey = std::pair<std::string, Direction>;

                std::shared_ptr<spdlog::logger> logger_;
                std::map<std::string, AccessList> acls_;
                std::map<BindingKey, std::string> bindings_;

                uint64_t permits_;
                uint64_t denies_;
                uint64_t implicit_denies_;

                std::optional<uint32_t> addEntry(AccessList &acl, AclEntry entry);
                bool validateEntry(const AccessList &acl, const AclEntry &entry) const;
                static bool entryMatches(const AclEntry &entry, AclType type, const AclQuery &query);
            };

        } // namespace Acl
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ACL_ENGINE_HPP
