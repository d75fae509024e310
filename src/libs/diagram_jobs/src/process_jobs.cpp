#include <diagram_jobs/process_jobs.hpp>
#include <diagram_log/log.hpp>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>

namespace diagram_jobs {

namespace {

int open_read_fd(const std::filesystem::path& path) {
    return ::open(path.empty() ? "/dev/null" : path.c_str(), O_RDONLY | O_CLOEXEC);
}

int open_write_fd(const std::filesystem::path& path) {
    return ::open(path.empty() ? "/dev/null" : path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
}

void close_all(int a, int b, int c) {
    if (a >= 0) ::close(a);
    if (b >= 0) ::close(b);
    if (c >= 0) ::close(c);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

} // namespace

ProcessJobs::ProcessJobs(std::size_t finished_capacity)
    : finished_capacity_(finished_capacity)
{
}

ProcessJobs::~ProcessJobs() {
    // Jobs are never cancelled; only collect the ones that already exited.
    for (const auto& kv : processes_) {
        (void)reap(kv.second);
    }
}

std::optional<JobId> ProcessJobs::start(const JobSpec& spec) {
    auto log = diagram_log::logger();
    if (spec.argv.empty()) {
        log->error("job_start_failed reason=empty_argv");
        return std::nullopt;
    }

    const int in_fd = open_read_fd(spec.stdin_path);
    const int out_fd = open_write_fd(spec.stdout_path);
    const int err_fd = open_write_fd(spec.stderr_path);
    if (in_fd < 0 || out_fd < 0 || err_fd < 0) {
        log->error("job_start_failed program={} reason=redirect_open errno={}", spec.argv[0], errno);
        close_all(in_fd, out_fd, err_fd);
        return std::nullopt;
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1U);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        close_all(in_fd, out_fd, err_fd);
        log->error("job_start_failed program={} reason=fork errno={}", spec.argv[0], errno);
        return std::nullopt;
    }

    if (pid == 0) {
        if (::dup2(in_fd, STDIN_FILENO) < 0) _exit(127);
        if (::dup2(out_fd, STDOUT_FILENO) < 0) _exit(127);
        if (::dup2(err_fd, STDERR_FILENO) < 0) _exit(127);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    close_all(in_fd, out_fd, err_fd);

    const JobId id = next_id_++;
    processes_.emplace(id, pid);
    log->debug("job_started id={} pid={} program={}", id, pid, spec.argv[0]);
    return id;
}

std::optional<int> ProcessJobs::reap(pid_t pid) {
    int status = 0;
    const pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == 0) return std::nullopt;
    // Lost the child (ECHILD); report it as finished with a failure code.
    if (rc < 0) return -1;
    return decode_status(status);
}

void ProcessJobs::remember_finished(JobId job, int exit_code) {
    if (finished_capacity_ == 0) return;
    while (finished_.size() >= finished_capacity_) finished_.pop_front();
    finished_.emplace_back(job, exit_code);
}

std::vector<JobState> ProcessJobs::status(const std::vector<JobId>& jobs) {
    std::vector<JobState> out;
    out.reserve(jobs.size());
    for (const JobId job : jobs) {
        auto it = processes_.find(job);
        if (it == processes_.end()) {
            out.push_back(JobState::Finished);
            continue;
        }
        const auto code = reap(it->second);
        if (!code) {
            out.push_back(JobState::Running);
            continue;
        }
        diagram_log::logger()->debug("job_finished id={} pid={} exit_code={}", job, it->second, *code);
        remember_finished(job, *code);
        processes_.erase(it);
        out.push_back(JobState::Finished);
    }
    return out;
}

std::optional<int> ProcessJobs::exit_code(JobId job) const {
    for (const auto& entry : finished_) {
        if (entry.first == job) return entry.second;
    }
    return std::nullopt;
}

} // namespace diagram_jobs
