// src/core/sim/timer_scheduler.cpp
#include "timer_scheduler.hpp"

namespace NetSim
{
    namespace Core
    {
        namespace Sim
        {
            TimerScheduler::TimerScheduler(VirtualClock &clock)
                : clock_(clock), next_id_(1)
            {
            }

            TimerId TimerScheduler::schedule(uint64_t delay_ms, Callback callback, const std::string &label)
            {
                TimerId id = next_id_++;
                uint64_t due = clock_.now_ms_ + delay_ms;

                queue_.emplace(QueueKey(due, id), Task{std::move(callback), label});
                due_by_id_[id] = due;
                return id;
            }

            bool TimerScheduler::cancel(TimerId id)
            {
                auto it = due_by_id_.find(id);
                if (it == due_by_id_.end())
                {
                    return false;
                }
                queue_.erase(QueueKey(it->second, id));
                due_by_id_.erase(it);
                return true;
            }

            bool TimerScheduler::isPending(TimerId id) const
            {
                return due_by_id_.count(id) > 0;
            }

            uint64_t TimerScheduler::dueTime(TimerId id) const
            {
                auto it = due_by_id_.find(id);
                return it == due_by_id_.end() ? 0 : it->second;
            }

            size_t TimerScheduler::advance(uint64_t delta_ms)
            {
                uint64_t target = clock_.now_ms_ + delta_ms;
                size_t fired = runUntil(target);
                clock_.now_ms_ = target;
                return fired;
            }

            size_t TimerScheduler::runDue()
            {
                return runUntil(clock_.now_ms_);
            }

            size_t TimerScheduler::runUntil(uint64_t target_ms)
            {
                size_t fired = 0;

                // Callback có thể schedule task mới đến hạn trước target, nên luôn đọc lại begin()
                while (!queue_.empty())
                {
                    auto it = queue_.begin();
                    if (it->first.first > target_ms)
                    {
                        break;
                    }

                    TimerId id = it->first.second;
                    if (it->first.first > clock_.now_ms_)
                    {
                        clock_.now_ms_ = it->first.first;
                    }

                    Callback callback = std::move(it->second.callback);
                    queue_.erase(it);
                    due_by_id_.erase(id);

                    if (callback)
                    {
                        callback();
                    }
                    ++fired;
                }

                return fired;
            }

        } // namespace Sim
    }     // namespace Core
} // namespace NetSim
