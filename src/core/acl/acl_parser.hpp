// src/core/acl/acl_parser.hpp
#ifndef NETSIM_ACL_PARSER_HPP
#define NETSIM_ACL_PARSER_HPP

#include "acl_types.hpp"
#include <utility>

namespace NetSim
{
    namespace Core
    {
        namespace Acl
        {
            /**
             * @brief Parser cú pháp ACL kiểu Cisco
             *
             * Standard:  {permit|deny} {any | host A | A [wildcard]} [log]
             * Extended:  {permit|deny} proto src [port-op] dst [port-op] [established] [log]
             *            src/dst = any | host A | A wildcard
             *            port-op = eq|neq|lt|gt P | range P1 P2 (chỉ tcp/udp)
             */
            class AclParser
            {
            public:
                static std::optional<AclEntry> parseStandardEntry(const std::vector<std::string> &tokens);
                static std::optional<AclEntry> parseExtendedEntry(const std::vector<std::string> &tokens);

                /**
                 * @brief Parse "access-list <number> ..." thành (number, entry)
                 */
                static std::optional<std::pair<int, AclEntry>> parseAccessListCommand(const std::string &line);

                /**
                 * @brief Số port hoặc tên dịch vụ (www, ssh, domain, ...)
                 */
                static std::optional<uint16_t> parsePort(const std::string &token);

                /**
                 * @brief Tên protocol (ip, tcp, udp, icmp, ospf, ...) hoặc số 0-255
                 */
                static std::optional<uint8_t> parseProtocol(const std::string &token);

                /**
                 * @brief Dòng cấu hình tương ứng, VD "deny tcp any host 10.0.0.1 eq www"
                 */
                static std::string formatEntry(const AclEntry &entry, AclType type);

            private:
                AclParser() = default;

                static bool parseAddress(const std::vector<std::string> &tokens, size_t &index,
                                         Common::IPv4Address &address, Common::WildcardMask &wildcard,
                                         bool wildcard_optional);
                static bool parsePortMatch(const std::vector<std::string> &tokens, size_t &index,
                                           std::optional<PortMatch> &match);
                static std::optional<AclAction> parseAction(const std::string &token);
                static std::string formatAddress(const Common::IPv4Address &address, const Common::WildcardMask &wildcard);
                static std::string formatPortMatch(const PortMatch &match);
            };

        } // namespace Acl
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_ACL_PARSER_HPP
