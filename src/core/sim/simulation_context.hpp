// src/core/sim/simulation_context.hpp
#ifndef NETSIM_SIMULATION_CONTEXT_HPP
#define NETSIM_SIMULATION_CONTEXT_HPP

#include "frame_sink.hpp"
#include "timer_scheduler.hpp"
#include "../storage/pcap_writer.hpp"
#include "../../common/config_manager.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Sim
        {
            // ==================== Events ====================

            enum class SimulationEventType
            {
                DEVICE_ADDED,
                LINK_CONNECTED,
                LINK_DISCONNECTED,
                FRAME_TRANSMITTED,
                FRAME_LOST
            };

            std::string simulationEventTypeToString(SimulationEventType type);

            struct SimulationEvent
            {
                SimulationEventType type;
                uint64_t time_ms = 0;
                std::string device;
                std::string port;
                std::string description;
            };

            using SimulationListener = std::function<void(const SimulationEvent &)>;

            /**
             * @brief Một đầu cable
             */
            struct Endpoint
            {
                std::string device;
                std::string port;

                bool operator<(const Endpoint &other) const
                {
                    return device < other.device || (device == other.device && port < other.port);
                }
                bool operator==(const Endpoint &other) const
                {
                    return device == other.device && port == other.port;
                }
            };

            struct SimulationStatistics
            {
                uint64_t frames_transmitted = 0;
                uint64_t frames_delivered = 0;
                uint64_t frames_unlinked = 0;         // port không có cable
                uint64_t frames_depth_exceeded = 0;   // vòng lặp forwarding
            };

            /**
             * @brief Ngữ cảnh mô phỏng
             *
             * Sở hữu cấu hình, đồng hồ ảo, bộ lập lịch timer, danh sách thiết bị và
             * các cable. Mỗi thiết bị nhận tham chiếu tới context khi khởi tạo; không
             * có trạng thái toàn cục nào ngoài logger.
             *
             * Việc phát frame là đồng bộ: transmit() gọi thẳng receiveFrame() của đầu kia.
             */
            class SimulationContext
            {
            public:
                SimulationContext();
                ~SimulationContext();

                SimulationContext(const SimulationContext &) = delete;
                SimulationContext &operator=(const SimulationContext &) = delete;

                // ==================== Devices ====================

                /**
                 * @brief Tạo thiết bị kiểu T(context, name, args...)
                 * @return nullptr nếu tên đã tồn tại
                 */
                template <typename T, typename... Args>
                T *createDevice(const std::string &name, Args &&...args)
                {
                    static_assert(std::is_base_of<FrameSink, T>::value, "device must implement FrameSink");

                    if (devices_.count(name) > 0)
                    {
                        logger_->warn("Device {} already exists", name);
                        return nullptr;
                    }

                    auto device = std::make_unique<T>(*this, name, std::forward<Args>(args)...);
                    T *raw = device.get();
                    devices_.emplace(name, std::move(device));
                    onDeviceAdded(*raw);
                    return raw;
                }

                FrameSink *getDevice(const std::string &name) const;

                template <typename T>
                T *getDeviceAs(const std::string &name) const
                {
                    return dynamic_cast<T *>(getDevice(name));
                }

                bool removeDevice(const std::string &name);
                std::vector<std::string> getDeviceNames() const;

                // ==================== Links ====================

                /**
                 * @brief Nối cable giữa hai port. Mỗi port chỉ có một cable.
                 */
                bool connect(const std::string &device_a, const std::string &port_a,
                             const std::string &device_b, const std::string &port_b);

                bool disconnect(const std::string &device, const std::string &port);

                std::optional<Endpoint> getPeer(const std::string &device, const std::string &port) const;

                bool isLinked(const std::string &device, const std::string &port) const
                {
                    return getPeer(device, port).has_value();
                }

                /**
                 * @brief Phát frame từ (device, port) tới đầu kia của cable
                 * @return true nếu frame được giao cho thiết bị bên kia
                 */
                bool transmit(const std::string &device, const std::string &port, const Packet::EthernetFrame &frame);

                // ==================== Time ====================

                VirtualClock &clock() { return clock_; }
                const VirtualClock &clock() const { return clock_; }
                TimerScheduler &scheduler() { return scheduler_; }

                /**
                 * @brief Tiến thời gian mô phỏng, chạy các timer đến hạn
                 */
                size_t advanceTime(uint64_t delta_ms);

                uint64_t nowMs() const { return clock_.nowMs(); }

                // ==================== Config / events ====================

                Common::ConfigManager &config() { return config_; }
                const Common::ConfigManager &config() const { return config_; }

                uint64_t subscribe(SimulationListener listener);
                bool unsubscribe(uint64_t subscription_id);

                // ==================== Capture ====================

                bool enableCapture(const std::string &file_path);
                void disableCapture();
                bool isCapturing() const { return capture_ && capture_->isOpen(); }
                const Storage::PcapWriter *capture() const { return capture_.get(); }

                /**
                 * @brief Cấp MAC duy nhất trong phạm vi context (02:00:00:xx:xx:xx)
                 */
                Common::MacAddress allocateMac();

                const SimulationStatistics &getStatistics() const { return stats_; }

            private:
                std::shared_ptr<spdlog::logger> logger_;
                Common::ConfigManager config_;
                VirtualClock clock_;
                TimerScheduler scheduler_;

                std::map<std::string, std::unique_ptr<FrameSink>> devices_;
                std::map<Endpoint, Endpoint> links_;

                std::map<uint64_t, SimulationListener> listeners_;
                uint64_t next_subscription_id_;

                std::unique_ptr<Storage::PcapWriter> capture_;
                uint32_t mac_sequence_;
                int delivery_depth_;
                SimulationStatistics stats_;

                void onDeviceAdded(const FrameSink &device);
                void publish(SimulationEventType type, const std::string &device,
                             const std::string &port, const std::string &description);
            };

        } // namespace Sim
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_SIMULATION_CONTEXT_HPP
