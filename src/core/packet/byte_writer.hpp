// src/core/packet/byte_writer.hpp
#ifndef NETSIM_BYTE_WRITER_HPP
#define NETSIM_BYTE_WRITER_HPP

#include "../../common/address.hpp"
#include <cstdint>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Packet
        {
            /**
             * @brief Ghi giá trị network byte order vào buffer
             */
            class ByteWriter
            {
            public:
                explicit ByteWriter(std::vector<uint8_t> &buffer) : buffer_(buffer) {}

                void u8(uint8_t value) { buffer_.push_back(value); }

                void u16(uint16_t value)
                {
                    buffer_.push_back(static_cast<uint8_t>(value >> 8));
                    buffer_.push_back(static_cast<uint8_t>(value));
                }

                void u32(uint32_t value)
                {
                    buffer_.push_back(static_cast<uint8_t>(value >> 24));
                    buffer_.push_back(static_cast<uint8_t>(value >> 16));
                    buffer_.push_back(static_cast<uint8_t>(value >> 8));
                    buffer_.push_back(static_cast<uint8_t>(value));
                }

                void ip(const Common::IPv4Address &address) { u32(address.toUint32()); }

                void mac(const Common::MacAddress &address)
                {
                    buffer_.insert(buffer_.end(), address.bytes().begin(), address.bytes().end());
                }

                void bytes(const std::vector<uint8_t> &data)
                {
                    buffer_.insert(buffer_.end(), data.begin(), data.end());
                }

                /**
                 * @brief Ghi đè u16 tại vị trí đã ghi trước đó
                 */
                void patch16(size_t offset, uint16_t value)
                {
                    buffer_[offset] = static_cast<uint8_t>(value >> 8);
                    buffer_[offset + 1] = static_cast<uint8_t>(value);
                }

                size_t size() const { return buffer_.size(); }

            private:
                std::vector<uint8_t> &buffer_;
            };

        } // namespace Packet
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_BYTE_WRITER_HPP
