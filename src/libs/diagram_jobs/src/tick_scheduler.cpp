#include <diagram_jobs/tick_scheduler.hpp>
#include <utility>

namespace diagram_jobs {

TickScheduler::TickScheduler(std::size_t max_timers)
    : max_timers_(max_timers)
{
}

std::optional<Scheduler::TimerId> TickScheduler::start_timer(std::chrono::milliseconds delay,
    std::chrono::milliseconds repeat, Callback callback)
{
    if (!callback) return std::nullopt;
    if (max_timers_ != 0 && timers_.size() >= max_timers_) return std::nullopt;
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    if (repeat.count() < 0) repeat = std::chrono::milliseconds(0);

    const TimerId id = next_id_++;
    timers_.emplace(id, Timer{now_ + delay, repeat, std::move(callback)});
    return id;
}

bool TickScheduler::stop_timer(TimerId id) {
    return timers_.erase(id) > 0;
}

bool TickScheduler::is_active(TimerId id) const {
    return timers_.find(id) != timers_.end();
}

std::size_t TickScheduler::advance(std::chrono::milliseconds elapsed) {
    const std::chrono::milliseconds target = now_ + (elapsed.count() > 0 ? elapsed : std::chrono::milliseconds(0));
    std::size_t ran = 0;

    for (;;) {
        // Earliest due timer; ties go to the older timer.
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due > target) continue;
            if (next == timers_.end() || it->second.due < next->second.due) next = it;
        }
        if (next == timers_.end()) break;

        now_ = next->second.due;
        // The callback may stop or start timers, so it runs from a copy.
        Callback callback = next->second.callback;
        if (next->second.repeat.count() > 0) {
            next->second.due += next->second.repeat;
        } else {
            timers_.erase(next);
        }
        callback();
        ++ran;
    }

    now_ = target;
    return ran;
}

} // namespace diagram_jobs
