#pragma once

#include <diagram_jobs/job_control.hpp>
#include <diagram_jobs/scheduler.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>

namespace diagram_jobs {

// Turns an external job into a completion callback by polling its state on a
// recurring host timer. The callback fires exactly once, after the job is
// observed finished, and the timer is stopped before it runs.
class JobPoller {
public:
    static constexpr std::chrono::milliseconds default_interval{100};

    JobPoller(Scheduler& scheduler, JobControl& jobs,
        std::chrono::milliseconds interval = default_interval);
    ~JobPoller();

    JobPoller(const JobPoller&) = delete;
    JobPoller& operator=(const JobPoller&) = delete;

    // If no timer can be created the job is dropped and `on_complete` never runs.
    void watch(JobId job, std::function<void()> on_complete);

    // Stops every outstanding timer without running the callbacks.
    void cancel_all();

    std::size_t pending() const { return watches_.size(); }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    struct Watch {
        JobId job = 0;
        Scheduler::TimerId timer = 0;
        std::function<void()> on_complete;
        bool done = false;
    };

    void poll(const std::shared_ptr<Watch>& watch);

    Scheduler& scheduler_;
    JobControl& jobs_;
    std::chrono::milliseconds interval_;
    std::unordered_map<Scheduler::TimerId, std::shared_ptr<Watch>> watches_;
};

} // namespace diagram_jobs
