// src/core/storage/pcap_writer.hpp
#ifndef NETSIM_PCAP_WRITER_HPP
#define NETSIM_PCAP_WRITER_HPP

#include "../packet/ethernet_frame.hpp"
#include <spdlog/spdlog.h>
#include <pcap/pcap.h>
#include <memory>
#include <string>

namespace NetSim
{
    namespace Core
    {
        namespace Storage
        {
            /**
             * @brief Ghi các frame mô phỏng ra file PCAP (DLT_EN10MB)
             *
             * Timestamp lấy từ đồng hồ ảo (microseconds) để file mở được bằng
             * Wireshark/tcpdump với thứ tự thời gian mô phỏng.
             */
            class PcapWriter
            {
            public:
                PcapWriter();
                ~PcapWriter();

                PcapWriter(const PcapWriter &) = delete;
                PcapWriter &operator=(const PcapWriter &) = delete;

                /**
                 * @brief Mở file PCAP mới (đóng file cũ nếu đang mở)
                 * @param file_path Đường dẫn file
                 * @return true nếu thành công
                 */
                bool open(const std::string &file_path);

                /**
                 * @brief Serialize và ghi một frame
                 * @param timestamp_us Thời điểm mô phỏng (microseconds)
                 */
                bool writeFrame(const Packet::EthernetFrame &frame, uint64_t timestamp_us);

                bool writeRawPacket(const uint8_t *data, size_t length, uint64_t timestamp_us);

                void close();
                void flush();

                bool isOpen() const { return pcap_dumper_ != nullptr; }
                const std::string &getCurrentFile() const { return current_file_; }
                uint64_t getPacketCount() const { return packet_count_; }

            private:
                static constexpr int SNAPLEN = 65535;
                static constexpr uint64_t FLUSH_INTERVAL = 100;

                std::shared_ptr<spdlog::logger> logger_;
                std::string current_file_;
                size_t current_size_;
                uint64_t packet_count_;
                uint64_t writes_since_flush_;

                pcap_t *pcap_handle_;
                pcap_dumper_t *pcap_dumper_;
            };

        } // namespace Storage
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_PCAP_WRITER_HPP
