// src/core/storage/pcap_writer.cpp
#include "pcap_writer.hpp"
#include "../../common/logger.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Storage
        {
            PcapWriter::PcapWriter()
                : logger_(NETSIM_GET_LOGGER("PcapWriter")),
                  current_size_(0),
                  packet_count_(0),
                  writes_since_flush_(0),
                  pcap_handle_(nullptr),
                  pcap_dumper_(nullptr)
            {
            }

            PcapWriter::~PcapWriter()
            {
                close();
            }

            bool PcapWriter::open(const std::string &file_path)
            {
                if (pcap_dumper_)
                {
                    logger_->debug("Closing existing capture before opening {}", file_path);
                    close();
                }

                pcap_handle_ = pcap_open_dead(DLT_EN10MB, SNAPLEN);
                if (!pcap_handle_)
                {
                    logger_->error("Failed to create PCAP handle for {}", file_path);
                    return false;
                }

                pcap_dumper_ = pcap_dump_open(pcap_handle_, file_path.c_str());
                if (!pcap_dumper_)
                {
                    logger_->error("Failed to open PCAP dump file {}: {}", file_path, pcap_geterr(pcap_handle_));
                    pcap_close(pcap_handle_);
                    pcap_handle_ = nullptr;
                    return false;
                }

                current_file_ = file_path;
                current_size_ = 0;
                packet_count_ = 0;
                writes_since_flush_ = 0;

                logger_->info("Capture started: {}", current_file_);
                return true;
            }

            bool PcapWriter::writeFrame(const Packet::EthernetFrame &frame, uint64_t timestamp_us)
            {
                std::vector<uint8_t> bytes = frame.serialize();
                return writeRawPacket(bytes.data(), bytes.size(), timestamp_us);
            }

            bool PcapWriter::writeRawPacket(const uint8_t *data, size_t length, uint64_t timestamp_us)
            {
                if (!pcap_dumper_)
                {
                    logger_->error("Cannot write packet: PCAP dumper not initialized");
                    return false;
                }

                if (!data || length == 0)
                {
                    logger_->warn("Invalid packet data: length={}", length);
                    return false;
                }

                struct pcap_pkthdr header;
                header.ts.tv_sec = static_cast<time_t>(timestamp_us / 1000000);
                header.ts.tv_usec = static_cast<suseconds_t>(timestamp_us % 1000000);
                header.caplen = static_cast<bpf_u_int32>(length > SNAPLEN ? SNAPLEN : length);
                header.len = static_cast<bpf_u_int32>(length);

                pcap_dump(reinterpret_cast<u_char *>(pcap_dumper_), &header, data);

                packet_count_++;
                current_size_ += length + sizeof(struct pcap_pkthdr);
                writes_since_flush_++;

                if (writes_since_flush_ >= FLUSH_INTERVAL)
                {
                    flush();
                    writes_since_flush_ = 0;
                }

                return true;
            }

            void PcapWriter::flush()
            {
                if (pcap_dumper_)
                {
                    pcap_dump_flush(pcap_dumper_);
                }
            }

            void PcapWriter::close()
            {
                if (pcap_dumper_)
                {
                    logger_->info("Closing capture {} (packets={}, size={} bytes)",
                                  current_file_, packet_count_, current_size_);
                    flush();
                    pcap_dump_close(pcap_dumper_);
                    pcap_dumper_ = nullptr;
                }

                if (pcap_handle_)
                {
                    pcap_close(pcap_handle_);
                    pcap_handle_ = nullptr;
                }

                current_file_.clear();
            }

        } // namespace Storage
    }     // namespace Core
} // namespace NetSim
