// src/common/address.hpp
#ifndef NETSIM_ADDRESS_HPP
#define NETSIM_ADDRESS_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace NetSim
{
    namespace Common
    {
        /**
         * @brief Địa chỉ IPv4 (32-bit, host byte order), bất biến
         */
        class IPv4Address
        {
        public:
            IPv4Address() : value_(0) {}
            explicit IPv4Address(uint32_t value) : value_(value) {}
            IPv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
                : value_((static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
                         (static_cast<uint32_t>(c) << 8) | static_cast<uint32_t>(d)) {}

            /**
             * @brief Parse dotted-quad, std::nullopt nếu không hợp lệ
             */
            static std::optional<IPv4Address> parse(const std::string &text);

            /**
             * @brief Parse dotted-quad
             * @throws std::invalid_argument nếu không hợp lệ
             */
            static IPv4Address fromString(const std::string &text);

            static IPv4Address any() { return IPv4Address(0u); }
            static IPv4Address broadcast() { return IPv4Address(0xFFFFFFFFu); }

            uint32_t toUint32() const { return value_; }
            std::string toString() const;
            uint8_t octet(int index) const { return static_cast<uint8_t>(value_ >> (24 - 8 * index)); }

            bool isUnspecified() const { return value_ == 0; }
            bool isBroadcast() const { return value_ == 0xFFFFFFFFu; }
            bool isMulticast() const { return (value_ & 0xF0000000u) == 0xE0000000u; }
            bool isLoopback() const { return (value_ & 0xFF000000u) == 0x7F000000u; }

            bool operator==(const IPv4Address &other) const { return value_ == other.value_; }
            bool operator!=(const IPv4Address &other) const { return value_ != other.value_; }
            bool operator<(const IPv4Address &other) const { return value_ < other.value_; }
            bool operator>(const IPv4Address &other) const { return value_ > other.value_; }

        private:
            uint32_t value_;
        };

        class WildcardMask;

        /**
         * @brief Subnet mask (các bit 1 liên tục từ MSB)
         */
        class SubnetMask
        {
        public:
            SubnetMask() : value_(0) {}

            /**
             * @brief Tạo mask từ 32-bit; không kiểm tra tính liên tục (xem isContiguous)
             */
            explicit SubnetMask(uint32_t value) : value_(value) {}

            static SubnetMask fromPrefixLength(int prefix_len);

            /**
             * @brief Parse "255.255.255.0"; từ chối mask không liên tục
             */
            static std::optional<SubnetMask> parse(const std::string &text);

            /**
             * @throws std::invalid_argument nếu không hợp lệ
             */
            static SubnetMask fromString(const std::string &text);

            uint32_t toUint32() const { return value_; }
            std::string toString() const;
            int prefixLength() const;
            bool isContiguous() const;
            WildcardMask toWildcard() const;

            IPv4Address networkOf(const IPv4Address &ip) const { return IPv4Address(ip.toUint32() & value_); }
            bool sameSubnet(const IPv4Address &a, const IPv4Address &b) const
            {
                return (a.toUint32() & value_) == (b.toUint32() & value_);
            }

            bool operator==(const SubnetMask &other) const { return value_ == other.value_; }
            bool operator!=(const SubnetMask &other) const { return value_ != other.value_; }

        private:
            uint32_t value_;
        };

        /**
         * @brief Wildcard mask kiểu Cisco: bit 1 = "don't care"
         */
        class WildcardMask
        {
        public:
            WildcardMask() : value_(0) {}
            explicit WildcardMask(uint32_t value) : value_(value) {}

            static std::optional<WildcardMask> parse(const std::string &text);
            static WildcardMask fromString(const std::string &text);

            /** @brief 0.0.0.0 - khớp chính xác một host */
            static WildcardMask host() { return WildcardMask(0u); }

            /** @brief 255.255.255.255 - khớp mọi địa chỉ */
            static WildcardMask any() { return WildcardMask(0xFFFFFFFFu); }

            uint32_t toUint32() const { return value_; }
            std::string toString() const;
            SubnetMask toSubnetMask() const { return SubnetMask(~value_); }

            /**
             * @brief (ip XOR network) AND NOT(wildcard) == 0
             */
            bool matches(const IPv4Address &ip, const IPv4Address &network) const
            {
                return ((ip.toUint32() ^ network.toUint32()) & ~value_) == 0;
            }

            bool operator==(const WildcardMask &other) const { return value_ == other.value_; }
            bool operator!=(const WildcardMask &other) const { return value_ != other.value_; }

        private:
            uint32_t value_;
        };

        /**
         * @brief Địa chỉ MAC 48-bit
         */
        class MacAddress
        {
        public:
            using Bytes = std::array<uint8_t, 6>;

            MacAddress() : bytes_{} {}
            explicit MacAddress(const Bytes &bytes) : bytes_(bytes) {}

            /**
             * @brief Parse "aa:bb:cc:dd:ee:ff", "aa-bb-cc-dd-ee-ff" hoặc "aabb.ccdd.eeff"
             */
            static std::optional<MacAddress> parse(const std::string &text);
            static MacAddress fromString(const std::string &text);

            static MacAddress broadcast();

            /**
             * @brief MAC locally-administered 02:00:00:xx:xx:xx từ một bộ đếm
             */
            static MacAddress generate(uint32_t sequence);

            /**
             * @brief MAC multicast IPv4 (01:00:5e + 23 bit thấp của địa chỉ nhóm)
             */
            static MacAddress fromMulticastIPv4(const IPv4Address &group);

            const Bytes &bytes() const { return bytes_; }
            std::string toString() const;
            uint64_t toUint64() const;

            bool isBroadcast() const;
            bool isMulticast() const { return (bytes_[0] & 0x01) != 0 && !isBroadcast(); }
            bool isUnicast() const { return (bytes_[0] & 0x01) == 0; }
            bool isZero() const;

            bool operator==(const MacAddress &other) const { return bytes_ == other.bytes_; }
            bool operator!=(const MacAddress &other) const { return bytes_ != other.bytes_; }
            bool operator<(const MacAddress &other) const { return bytes_ < other.bytes_; }

        private:
            Bytes bytes_;
        };

        inline std::ostream &operator<<(std::ostream &os, const IPv4Address &ip) { return os << ip.toString(); }
        inline std::ostream &operator<<(std::ostream &os, const SubnetMask &mask) { return os << mask.toString(); }
        inline std::ostream &operator<<(std::ostream &os, const WildcardMask &mask) { return os << mask.toString(); }
        inline std::ostream &operator<<(std::ostream &os, const MacAddress &mac) { return os << mac.toString(); }

    } // namespace Common
} // namespace NetSim

namespace std
{
    template <>
    struct hash<NetSim::Common::IPv4Address>
    {
        size_t operator()(const NetSim::Common::IPv4Address &ip) const noexcept
        {
            return std::hash<uint32_t>()(ip.toUint32());
        }
    };

    template <>
    struct hash<NetSim::Common::MacAddress>
    {
        size_t operator()(const NetSim::Common::MacAddress &mac) const noexcept
        {
            return std::hash<uint64_t>()(mac.toUint64());
        }
    };
} // namespace std

#endif // NETSIM_ADDRESS_HPP
