// src/common/address.cpp
#include "address.hpp"
#include "network_utils.hpp"
#include <arpa/inet.h>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace NetSim
{
    namespace Common
    {
        // ==================== IPv4Address ====================

        std::optional<IPv4Address> IPv4Address::parse(const std::string &text)
        {
            struct in_addr addr;
            if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            {
                return std::nullopt;
            }
            return IPv4Address(ntohl(addr.s_addr));
        }

        IPv4Address IPv4Address::fromString(const std::string &text)
        {
            auto parsed = parse(text);
            if (!parsed)
            {
                throw std::invalid_argument("Invalid IPv4 address: " + text);
            }
            return *parsed;
        }

        std::string IPv4Address::toString() const
        {
            return NetworkUtils::ipIntToString(value_);
        }

        // ==================== SubnetMask ====================

        SubnetMask SubnetMask::fromPrefixLength(int prefix_len)
        {
            return SubnetMask(NetworkUtils::calculateSubnetMask(prefix_len));
        }

        std::optional<SubnetMask> SubnetMask::parse(const std::string &text)
        {
            auto ip = IPv4Address::parse(text);
            if (!ip)
            {
                return std::nullopt;
            }
            SubnetMask mask(ip->toUint32());
            if (!mask.isContiguous())
            {
                return std::nullopt;
            }
            return mask;
        }

        SubnetMask SubnetMask::fromString(const std::string &text)
        {
            auto parsed = parse(text);
            if (!parsed)
            {
                throw std::invalid_argument("Invalid subnet mask: " + text);
            }
            return *parsed;
        }

        std::string SubnetMask::toString() const
        {
            return NetworkUtils::ipIntToString(value_);
        }

        int SubnetMask::prefixLength() const
        {
            return NetworkUtils::calculatePrefixLength(value_);
        }

        bool SubnetMask::isContiguous() const
        {
            // ~mask + 1 phải là lũy thừa của 2 (hoặc 0 với /0)
            uint32_t inverted = ~value_;
            return (inverted & (inverted + 1)) == 0;
        }

        WildcardMask SubnetMask::toWildcard() const
        {
            return WildcardMask(~value_);
        }

        // ==================== WildcardMask ====================

        std::optional<WildcardMask> WildcardMask::parse(const std::string &text)
        {
            auto ip = IPv4Address::parse(text);
            if (!ip)
            {
                return std::nullopt;
            }
            return WildcardMask(ip->toUint32());
        }

        WildcardMask WildcardMask::fromString(const std::string &text)
        {
            auto parsed = parse(text);
            if (!parsed)
            {
                throw std::invalid_argument("Invalid wildcard mask: " + text);
            }
            return *parsed;
        }

        std::string WildcardMask::toString() const
        {
            return NetworkUtils::ipIntToString(value_);
        }

        // ==================== MacAddress ====================

        std::optional<MacAddress> MacAddress::parse(const std::string &text)
        {
            std::string hex;
            hex.reserve(12);

            if (text.size() == 14 && text[4] == '.' && text[9] == '.')
            {
                // Cisco dotted: aabb.ccdd.eeff
                hex = text.substr(0, 4) + text.substr(5, 4) + text.substr(10, 4);
            }
            else if (text.size() == 17)
            {
                char sep = text[2];
                if (sep != ':' && sep != '-')
                {
                    return std::nullopt;
                }
                for (size_t i = 0; i < text.size(); ++i)
                {
                    if (i % 3 == 2)
                    {
                        if (text[i] != sep)
                            return std::nullopt;
                    }
                    else
                    {
                        hex.push_back(text[i]);
                    }
                }
            }
            else
            {
                return std::nullopt;
            }

            Bytes bytes{};
            for (size_t i = 0; i < 6; ++i)
            {
                unsigned value = 0;
                for (size_t j = 0; j < 2; ++j)
                {
                    char c = hex[i * 2 + j];
                    if (!std::isxdigit(static_cast<unsigned char>(c)))
                        return std::nullopt;
                    value = value * 16 + static_cast<unsigned>(std::isdigit(static_cast<unsigned char>(c))
                                                                  ? c - '0'
                                                                  : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
                }
                bytes[i] = static_cast<uint8_t>(value);
            }
            return MacAddress(bytes);
        }

        MacAddress MacAddress::fromString(const std::string &text)
        {
            auto parsed = parse(text);
            if (!parsed)
            {
                throw std::invalid_argument("Invalid MAC address: " + text);
            }
            return *parsed;
        }

        MacAddress MacAddress::broadcast()
        {
            return MacAddress(Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
        }

        MacAddress MacAddress::generate(uint32_t sequence)
        {
            return MacAddress(Bytes{0x02, 0x00, 0x00,
                                    static_cast<uint8_t>(sequence >> 16),
                                    static_cast<uint8_t>(sequence >> 8),
                                    static_cast<uint8_t>(sequence)});
        }

        MacAddress MacAddress::fromMulticastIPv4(const IPv4Address &group)
        {
            uint32_t low = group.toUint32() & 0x007FFFFFu;
            return MacAddress(Bytes{0x01, 0x00, 0x5E,
                                    static_cast<uint8_t>(low >> 16),
                                    static_cast<uint8_t>(low >> 8),
                                    static_cast<uint8_t>(low)});
        }

        std::string MacAddress::toString() const
        {
            char buf[18];
            std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                          bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
            return std::string(buf);
        }

        uint64_t MacAddress::toUint64() const
        {
            uint64_t value = 0;
            for (uint8_t b : bytes_)
            {
                value = (value << 8) | b;
            }
            return value;
        }

        bool MacAddress::isBroadcast() const
        {
            for (uint8_t b : bytes_)
            {
                if (b != 0xFF)
                    return false;
            }
            return true;
        }

        bool MacAddress::isZero() const
        {
            for (uint8_t b : bytes_)
            {
                if (b != 0)
                    return false;
            }
            return true;
        }

    } // namespace Common
} // namespace NetSim
