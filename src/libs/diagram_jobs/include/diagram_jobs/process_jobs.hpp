#pragma once

#include <diagram_jobs/job_control.hpp>
#include <sys/types.h>
#include <cstddef>
#include <deque>
#include <optional>
#include <unordered_map>
#include <utility>

namespace diagram_jobs {

// Runs jobs as child processes (fork/execvp) and reaps them with waitpid(WNOHANG).
// A reaped job is forgotten except for the exit codes of the last
// `finished_capacity` jobs.
class ProcessJobs : public JobControl {
public:
    static constexpr std::size_t default_finished_capacity = 64;

    explicit ProcessJobs(std::size_t finished_capacity = default_finished_capacity);
    ~ProcessJobs() override;

    ProcessJobs(const ProcessJobs&) = delete;
    ProcessJobs& operator=(const ProcessJobs&) = delete;

    std::optional<JobId> start(const JobSpec& spec) override;
    std::vector<JobState> status(const std::vector<JobId>& jobs) override;

    // Exit code of a recently finished job (128 + signal for signalled children).
    std::optional<int> exit_code(JobId job) const;

    std::size_t running_jobs() const { return processes_.size(); }
    std::size_t finished_jobs() const { return finished_.size(); }

private:
    // Reaps `pid` if it has exited; nullopt while it is still running.
    static std::optional<int> reap(pid_t pid);
    void remember_finished(JobId job, int exit_code);

    std::unordered_map<JobId, pid_t> processes_;
    std::deque<std::pair<JobId, int>> finished_;
    std::size_t finished_capacity_;
    JobId next_id_ = 1;
};

} // namespace diagram_jobs
