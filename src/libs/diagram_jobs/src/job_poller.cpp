#include <diagram_jobs/job_poller.hpp>
#include <diagram_log/log.hpp>
#include <utility>

namespace diagram_jobs {

JobPoller::JobPoller(Scheduler& scheduler, JobControl& jobs, std::chrono::milliseconds interval)
    : scheduler_(scheduler)
    , jobs_(jobs)
    , interval_(interval.count() > 0 ? interval : default_interval)
{
}

JobPoller::~JobPoller() {
    cancel_all();
}

void JobPoller::watch(JobId job, std::function<void()> on_complete) {
    auto w = std::make_shared<Watch>();
    w->job = job;
    w->on_complete = std::move(on_complete);

    std::weak_ptr<Watch> weak = w;
    auto timer = scheduler_.start_timer(std::chrono::milliseconds(0), interval_, [this, weak]() {
        if (auto locked = weak.lock()) poll(locked);
    });
    if (!timer) {
        diagram_log::logger()->warn("job_watch_dropped job={} reason=timer_unavailable", job);
        return;
    }
    w->timer = *timer;
    watches_.emplace(w->timer, std::move(w));
}

void JobPoller::poll(const std::shared_ptr<Watch>& w) {
    if (w->done) return;

    const auto states = jobs_.status({w->job});
    if (states.empty() || states.front() == JobState::Running) return;

    w->done = true;
    if (scheduler_.is_active(w->timer)) {
        (void)scheduler_.stop_timer(w->timer);
    }
    watches_.erase(w->timer);

    auto on_complete = std::move(w->on_complete);
    if (on_complete) on_complete();
}

void JobPoller::cancel_all() {
    for (auto& kv : watches_) {
        kv.second->done = true;
        (void)scheduler_.stop_timer(kv.first);
    }
    watches_.clear();
}

} // namespace diagram_jobs
