// src/core/ospf/lsdb.hpp
#ifndef NETSIM_OSPF_LSDB_HPP
#define NETSIM_OSPF_LSDB_HPP

#include "ospf_types.hpp"
#include <map>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Ospf
        {
            /**
             * @brief So sánh hai instance của cùng một LSA (RFC 2328 §13.1)
             * @return > 0 nếu a mới hơn, < 0 nếu b mới hơn, 0 nếu coi là cùng instance
             */
            int compareLsaInstances(const Packet::LsaHeader &a, const Packet::LsaHeader &b);

            /**
             * @brief true nếu a mới hơn b
             */
            bool isNewerLSA(const Packet::LsaHeader &a, const Packet::LsaHeader &b);

            /**
             * @brief Link-state database của một area
             *
             * LS age được lưu tại thời điểm cài đặt và tăng theo đồng hồ ảo khi đọc ra.
             */
            class LinkStateDatabase
            {
            public:
                /**
                 * @brief Cài LSA (thay instance cũ nếu có)
                 * @return true nếu nội dung khác instance cũ (cần chạy lại SPF)
                 */
                bool install(const Packet::Lsa &lsa, uint64_t now_ms);

                bool remove(const Packet::LsaKey &key);

                /**
                 * @brief LSA với LS age hiện tại, nullopt nếu không có
                 */
                std::optional<Packet::Lsa> lookup(const Packet::LsaKey &key, uint64_t now_ms) const;
                std::optional<Packet::LsaHeader> lookupHeader(const Packet::LsaKey &key, uint64_t now_ms) const;
                bool contains(const Packet::LsaKey &key) const { return entries_.count(key) > 0; }

                std::vector<Packet::LsaHeader> getHeaders(uint64_t now_ms) const;
                std::vector<Packet::Lsa> getAll(uint64_t now_ms) const;

                size_t size() const { return entries_.size(); }
                void clear() { entries_.clear(); }

            private:
                struct Entry
                {
                    Packet::Lsa lsa;
                    uint64_t installed_ms = 0;
                };

                std::map<Packet::LsaKey, Entry> entries_;

                static uint16_t ageAt(const Entry &entry, uint64_t now_ms);
            };

        } // namespace Ospf
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_OSPF_LSDB_HPP
