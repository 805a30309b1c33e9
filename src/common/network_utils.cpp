// src/common/network_utils.cpp
#include "network_utils.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <map>

namespace NetSim
{
    namespace Common
    {
        namespace
        {
            const std::map<std::string, int> &protocolMap()
            {
                static const std::map<std::string, int> protocols = {
                    {"ip", 0}, {"icmp", 1}, {"tcp", 6}, {"udp", 17}, {"gre", 47},
                    {"esp", 50}, {"ah", 51}, {"eigrp", 88}, {"ospf", 89}};
                return protocols;
            }

            const std::map<std::string, int> &portMap()
            {
                static const std::map<std::string, int> ports = {
                    {"ftp-data", 20}, {"ftp", 21}, {"ssh", 22}, {"telnet", 23}, {"smtp", 25},
                    {"dns", 53}, {"domain", 53}, {"dhcp", 67}, {"bootps", 67}, {"bootpc", 68},
                    {"tftp", 69}, {"http", 80}, {"www", 80}, {"pop3", 110}, {"ntp", 123},
                    {"snmp", 161}, {"https", 443}};
                return ports;
            }
        }

        // ==================== IP address utilities ====================

        std::string NetworkUtils::ipIntToString(uint32_t ip)
        {
            struct in_addr addr;
            addr.s_addr = htonl(ip);
            char str[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &addr, str, INET_ADDRSTRLEN)) {
                return std::string(str);
            }
            return "";
        }

        // ==================== Network calculation utilities ====================

        uint32_t NetworkUtils::calculateBroadcastAddress(uint32_t ip, int prefix_len)
        {
            uint32_t mask = calculateSubnetMask(prefix_len);
            return (ip & mask) | ~mask;
        }

        uint32_t NetworkUtils::calculateSubnetMask(int prefix_len)
        {
            if (prefix_len <= 0 || prefix_len > 32) {
                return 0;
            }
            return 0xFFFFFFFFu << (32 - prefix_len);
        }

        int NetworkUtils::calculatePrefixLength(uint32_t subnet_mask)
        {
            int prefix_len = 0;
            while (subnet_mask & 0x80000000u) {
                prefix_len++;
                subnet_mask <<= 1;
            }
            return prefix_len;
        }

        // ==================== Protocol utilities ====================

        int NetworkUtils::getProtocolNumber(const std::string &protocol_name)
        {
            std::string lower = Utils::toLowerCase(protocol_name);
            auto it = protocolMap().find(lower);
            if (it != protocolMap().end()) {
                return it->second;
            }

            uint32_t number = 0;
            if (Utils::parseUnsigned(lower, number) && number <= 255) {
                return static_cast<int>(number);
            }
            return -1;
        }

        std::string NetworkUtils::getProtocolName(int protocol_number)
        {
            for (const auto &[name, number] : protocolMap()) {
                if (number == protocol_number) {
                    return name;
                }
            }
            return std::to_string(protocol_number);
        }

        // ==================== Port utilities ====================

        int NetworkUtils::getPortNumber(const std::string &service_name)
        {
            std::string lower = Utils::toLowerCase(service_name);
            auto it = portMap().find(lower);
            if (it != portMap().end()) {
                return it->second;
            }

            uint32_t number = 0;
            if (Utils::parseUnsigned(lower, number) && isValidPort(static_cast<int>(number))) {
                return static_cast<int>(number);
            }
            return -1;
        }

        std::string NetworkUtils::getPortService(int port)
        {
            // Ưu tiên tên Cisco hiển thị (www thay vì http)
            if (port == 80) {
                return "www";
            }
            if (port == 53) {
                return "domain";
            }
            for (const auto &[name, number] : portMap()) {
                if (number == port) {
                    return name;
                }
            }
            return std::to_string(port);
        }

        bool NetworkUtils::isValidPort(int port)
        {
            return port >= 0 && port <= 65535;
        }

        // ==================== Checksum ====================

        uint16_t NetworkUtils::internetChecksum(const uint8_t *data, size_t length)
        {
            uint32_t sum = 0;

            for (size_t i = 0; i + 1 < length; i += 2) {
                sum += (static_cast<uint32_t>(data[i]) << 8) | data[i + 1];
            }

            // Byte lẻ cuối cùng được pad 0
            if (length & 1) {
                sum += static_cast<uint32_t>(data[length - 1]) << 8;
            }

            // Add carry
            while (sum >> 16) {
                sum = (sum & 0xFFFF) + (sum >> 16);
            }

            return static_cast<uint16_t>(~sum);
        }

    } // namespace Common
} // namespace NetSim
