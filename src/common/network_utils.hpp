// src/common/network_utils.hpp
#ifndef NETSIM_NETWORK_UTILS_HPP
#define NETSIM_NETWORK_UTILS_HPP

#include <string>
#include <cstdint>
#include <cstddef>

namespace NetSim
{
    namespace Common
    {
        /**
         * @brief Tiện ích mạng
         */
        class NetworkUtils
        {
        public:
            /**
             * @brief IP address utilities
             */
            static std::string ipIntToString(uint32_t ip);

            /**
             * @brief Network calculation utilities
             */
            static uint32_t calculateBroadcastAddress(uint32_t ip, int prefix_len);
            static uint32_t calculateSubnetMask(int prefix_len);
            static int calculatePrefixLength(uint32_t subnet_mask);

            /**
             * @brief Protocol utilities (tên kiểu Cisco: ip, icmp, tcp, udp, gre, esp, ah, eigrp, ospf)
             * @return -1 nếu không biết
             */
            static int getProtocolNumber(const std::string &protocol_name);
            static std::string getProtocolName(int protocol_number);

            /**
             * @brief Port utilities (ftp, ssh, telnet, www, ...)
             * @return -1 nếu không biết
             */
            static int getPortNumber(const std::string &service_name);
            static std::string getPortService(int port);
            static bool isValidPort(int port);

            /**
             * @brief Internet checksum (RFC 1071) trên buffer big-endian
             */
            static uint16_t internetChecksum(const uint8_t *data, size_t length);

        private:
            NetworkUtils() = default;
        };

    } // namespace Common
} // namespace NetSim

#endif // NETSIM_NETWORK_UTILS_HPP
