#pragma once

#include <diagram_jobs/scheduler.hpp>
#include <chrono>
#include <cstddef>
#include <map>

namespace diagram_jobs {

// Scheduler driven by explicit clock advances from the host loop.
class TickScheduler : public Scheduler {
public:
    // max_timers == 0 means unlimited.
    explicit TickScheduler(std::size_t max_timers = 0);

    std::optional<TimerId> start_timer(std::chrono::milliseconds delay,
        std::chrono::milliseconds repeat, Callback callback) override;
    bool stop_timer(TimerId id) override;
    bool is_active(TimerId id) const override;

    // Moves the clock forward and runs every timer falling due, earliest first.
    // Returns the number of callbacks run.
    std::size_t advance(std::chrono::milliseconds elapsed);

    std::chrono::milliseconds now() const { return now_; }
    std::size_t active_timers() const { return timers_.size(); }

private:
    struct Timer {
        std::chrono::milliseconds due{0};
        std::chrono::milliseconds repeat{0};
        Callback callback;
    };

    std::map<TimerId, Timer> timers_;
    std::chrono::milliseconds now_{0};
    TimerId next_id_ = 1;
    std::size_t max_timers_ = 0;
};

} // namespace diagram_jobs
