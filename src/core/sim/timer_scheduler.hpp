// src/core/sim/timer_scheduler.hpp
#ifndef NETSIM_TIMER_SCHEDULER_HPP
#define NETSIM_TIMER_SCHEDULER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>

namespace NetSim
{
    namespace Core
    {
        namespace Sim
        {
            using TimerId = uint64_t;
            constexpr TimerId INVALID_TIMER = 0;

            /**
             * @brief Đồng hồ ảo (ms). Chỉ tiến khi được gọi advance.
             */
            class VirtualClock
            {
            public:
                VirtualClock() : now_ms_(0) {}

                uint64_t nowMs() const { return now_ms_; }
                uint64_t nowUs() const { return now_ms_ * 1000; }
                uint64_t nowSeconds() const { return now_ms_ / 1000; }

            private:
                friend class TimerScheduler;
                uint64_t now_ms_;
            };

            /**
             * @brief Bộ lập lịch timer trên đồng hồ ảo
             *
             * Task chạy theo thứ tự (due time, thứ tự đăng ký). Đồng hồ được đặt bằng
             * due time của task trước khi callback chạy. cancel() idempotent; một
             * callback có thể đăng ký hoặc hủy task khác.
             */
            class TimerScheduler
            {
            public:
                using Callback = std::function<void()>;

                explicit TimerScheduler(VirtualClock &clock);

                /**
                 * @brief Đăng ký task chạy sau delay_ms
                 * @param label Nhãn để debug (VD: "ospf.inactivity 2.2.2.2")
                 */
                TimerId schedule(uint64_t delay_ms, Callback callback, const std::string &label = "");

                /**
                 * @brief Hủy task. Trả về false nếu task không còn chờ.
                 */
                bool cancel(TimerId id);

                bool isPending(TimerId id) const;

                /**
                 * @brief Thời điểm task sẽ chạy, 0 nếu không tồn tại
                 */
                uint64_t dueTime(TimerId id) const;

                /**
                 * @brief Tiến đồng hồ, chạy mọi task đến hạn
                 * @return Số task đã chạy
                 */
                size_t advance(uint64_t delta_ms);

                /**
                 * @brief Chạy mọi task có due time <= nowMs() hiện tại
                 */
                size_t runDue();

                size_t pendingCount() const { return queue_.size(); }
                const VirtualClock &clock() const { return clock_; }

            private:
                struct Task
                {
                    Callback callback;
                    std::string label;
                };

                // key = (due time, sequence) giữ thứ tự ổn định cho task cùng hạn
                using QueueKey = std::pair<uint64_t, TimerId>;

                VirtualClock &clock_;
                TimerId next_id_;
                std::map<QueueKey, Task> queue_;
                std::unordered_map<TimerId, uint64_t> due_by_id_;

                size_t runUntil(uint64_t target_ms);
            };

        } // namespace Sim
    }     // namespace Core
} // namespace NetSim

#endif // NETSIM_TIMER_SCHEDULER_HPP
