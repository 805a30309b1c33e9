// src/core/l2/mac_table.hpp
#ifndef NETSIM_MAC_TABLE_HPP
#define NETSIM_MAC_TABLE_HPP

#include "../../common/address.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <map>
#include <utility>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace L2
        {
            struct MacTableEntry
            {
                Common::MacAddress mac;
                std::string port;
                uint16_t vlan = 1;
                uint64_t last_seen_ms = 0;
            };

            struct MacTableStatistics
            {
                uint64_t learned = 0;
                uint64_t moved = 0;
                uint64_t aged = 0;
                uint64_t evicted = 0;
                uint64_t lookups = 0;
                uint64_t hits = 0;
                uint64_t misses = 0;
            };

            /**
             * @brief Bảng MAC: (MAC, VLAN) -> (port, last seen)
             *
             * Mỗi VLAN có không gian MAC riêng: cùng một MAC có thể nằm trên port khác
             * nhau ở hai VLAN (ví dụ sub-interface router trên trunk). Chỉ học MAC unicast. Entry quá aging time bị coi là không tồn tại và được
             * dọn trong lần lookup/ageOut kế tiếp.
             */
            class MacTable
            {
            public:
                MacTable(uint64_t aging_time_ms, size_t max_entries);

                /**
                 * @brief Học hoặc làm mới MAC trên port
                 * @return false nếu MAC không phải unicast
                 */
                bool learn(const Common::MacAddress &mac, const std::string &port, uint16_t vlan, uint64_t now_ms);

                /**
                 * @brief Tìm port đã học cho MAC trong VLAN (bỏ qua entry đã hết hạn)
                 */
                std::optional<MacTableEntry> lookup(const Common::MacAddress &mac, uint16_t vlan, uint64_t now_ms);

                /**
                 * @brief Xóa các entry quá aging time
                 * @return Số entry bị xóa
                 */
                size_t ageOut(uint64_t now_ms);

                size_t removePort(const std::string &port);

                /**
                 * @brief Entries sắp xếp theo (MAC, VLAN)
                 */
                std::vector<MacTableEntry> getEntries() const;

                size_t size() const { return entries_.size(); }
                uint64_t getAgingTime() const { return aging_time_ms_; }
                void setAgingTime(uint64_t aging_time_ms) { aging_time_ms_ = aging_time_ms; }

                const MacTableStatistics &getStatistics() const { return stats_; }

            private:
                uint64_t aging_time_ms_;
                size_t max_entries_;
                using Key = std::pair<Common::MacAddress, uint16_t>;

                std::map<Key, MacTableEntry> entries_;
                MacTableStatistics stats_;

                bool isExpired(const MacTableEntry &entry, uint64_t now_ms) const;
                void evictOldest();
            };

        } // namespace L2
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_MAC_TABLE_HPP
