// src/core/sim/frame_sink.hpp
#ifndef NETSIM_FRAME_SINK_HPP
#define NETSIM_FRAME_SINK_HPP

#include "../packet/ethernet_frame.hpp"
#include <string>
#include <vector>

namespace NetSim
{
    namespace Core
    {
        namespace Sim
        {
            class SimulationContext;

            enum class DeviceKind
            {
                SWITCH,
                ROUTER,
                HOST
            };

            std::string deviceKindToString(DeviceKind kind);

            /**
             * @brief Interface chung cho mọi thiết bị nhận frame
             *
             * Mọi device (Switch, Router, Host) được tạo qua SimulationContext và nhận
             * frame qua receiveFrame(). Việc phát frame đi luôn qua context để context
             * tìm đầu kia của cable.
             */
            class FrameSink
            {
            public:
                FrameSink(SimulationContext &context, const std::string &name)
                    : context_(context), name_(name) {}
                virtual ~FrameSink() = default;

                FrameSink(const FrameSink &) = delete;
                FrameSink &operator=(const FrameSink &) = delete;

                /**
                 * @brief Nhận một frame trên port
                 */
                virtual void receiveFrame(const std::string &port, const Packet::EthernetFrame &frame) = 0;

                virtual DeviceKind getKind() const = 0;
                virtual std::vector<std::string> getPortNames() const = 0;
                virtual bool hasPort(const std::string &port) const = 0;

                const std::string &getName() const { return name_; }

            protected:
                /**
                 * @brief Phát frame ra port (qua cable nếu có)
                 */
                void sendFrame(const std::string &port, const Packet::EthernetFrame &frame);

                SimulationContext &context_;
                std::string name_;
            };

        } // namespace Sim
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_FRAME_SINK_HPP
