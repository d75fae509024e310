#include "fakes.hpp"
#include <diagram_jobs/process_jobs.hpp>
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

bool wait_finished(diagram_jobs::ProcessJobs& jobs, diagram_model::JobId id) {
    for (int i = 0; i < 500; ++i) {
        if (jobs.status({id}).front() == diagram_jobs::JobState::Finished) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

TEST(ProcessJobsTest, ReportsExitCodeOnceFinished) {
    diagram_jobs::ProcessJobs jobs;
    diagram_jobs::JobSpec spec;
    spec.argv = { "/bin/sh", "-c", "exit 3" };
    const auto id = jobs.start(spec);
    ASSERT_TRUE(id);
    ASSERT_TRUE(wait_finished(jobs, *id));
    EXPECT_EQ(jobs.exit_code(*id).value_or(-99), 3);
    // Finished stays finished.
    EXPECT_EQ(jobs.status({*id}).front(), diagram_jobs::JobState::Finished);
}

TEST(ProcessJobsTest, RedirectsStdinAndStdout) {
    fakes::TempDir dir;
    const auto in = dir.path() / "in.txt";
    const auto out = dir.path() / "out.txt";
    fakes::write_file(in, "hello diagram\n");

    diagram_jobs::ProcessJobs jobs;
    diagram_jobs::JobSpec spec;
    spec.argv = { "/bin/cat" };
    spec.stdin_path = in;
    spec.stdout_path = out;
    const auto id = jobs.start(spec);
    ASSERT_TRUE(id);
    ASSERT_TRUE(wait_finished(jobs, *id));
    EXPECT_EQ(jobs.exit_code(*id).value_or(-99), 0);
    EXPECT_EQ(read_file(out), "hello diagram\n");
}

TEST(ProcessJobsTest, RunningJobReportsRunning) {
    diagram_jobs::ProcessJobs jobs;
    diagram_jobs::JobSpec spec;
    spec.argv = { "/bin/sh", "-c", "sleep 0.3" };
    const auto id = jobs.start(spec);
    ASSERT_TRUE(id);
    EXPECT_EQ(jobs.status({*id}).front(), diagram_jobs::JobState::Running);
    EXPECT_FALSE(jobs.exit_code(*id));
    ASSERT_TRUE(wait_finished(jobs, *id));
}

TEST(ProcessJobsTest, MissingProgramFinishesWithFailure) {
    diagram_jobs::ProcessJobs jobs;
    diagram_jobs::JobSpec spec;
    spec.argv = { "inline-diagrams-no-such-program" };
    const auto id = jobs.start(spec);
    ASSERT_TRUE(id);
    ASSERT_TRUE(wait_finished(jobs, *id));
    EXPECT_EQ(jobs.exit_code(*id).value_or(-99), 127);
}

TEST(ProcessJobsTest, RejectsEmptyCommandAndUnreadableInput) {
    diagram_jobs::ProcessJobs jobs;
    EXPECT_FALSE(jobs.start(diagram_jobs::JobSpec{}));

    diagram_jobs::JobSpec spec;
    spec.argv = { "/bin/cat" };
    spec.stdin_path = "/nonexistent/inline_diagrams/input";
    EXPECT_FALSE(jobs.start(spec));
}

TEST(ProcessJobsTest, ReapedJobsAreForgottenBeyondCapacity) {
    diagram_jobs::ProcessJobs jobs(2);
    std::vector<diagram_model::JobId> ids;
    for (int code = 1; code <= 3; ++code) {
        diagram_jobs::JobSpec spec;
        spec.argv = { "/bin/sh", "-c", "exit " + std::to_string(code) };
        const auto id = jobs.start(spec);
        ASSERT_TRUE(id);
        ids.push_back(*id);
    }
    EXPECT_EQ(jobs.running_jobs(), 3u);
    for (const auto id : ids) {
        ASSERT_TRUE(wait_finished(jobs, id));
    }

    EXPECT_EQ(jobs.running_jobs(), 0u);
    EXPECT_EQ(jobs.finished_jobs(), 2u);
    EXPECT_FALSE(jobs.exit_code(ids[0]));
    EXPECT_EQ(jobs.exit_code(ids[1]).value_or(-99), 2);
    EXPECT_EQ(jobs.exit_code(ids[2]).value_or(-99), 3);
    EXPECT_EQ(jobs.status({ ids[0] }).front(), diagram_jobs::JobState::Finished);
}

TEST(ProcessJobsTest, UnknownJobsReportFinished) {
    diagram_jobs::ProcessJobs jobs;
    const auto states = jobs.status({ 41, 42 });
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[0], diagram_jobs::JobState::Finished);
    EXPECT_EQ(states[1], diagram_jobs::JobState::Finished);
}

} // namespace
