#pragma once

#include <diagram_model/types.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace diagram_jobs {

using diagram_model::JobId;

// Success and failure are not distinguished at this level.
enum class JobState { Running, Finished };

struct JobSpec {
    std::vector<std::string> argv;
    // Empty paths mean /dev/null.
    std::filesystem::path stdin_path;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
};

class JobControl {
public:
    virtual ~JobControl() = default;

    virtual std::optional<JobId> start(const JobSpec& spec) = 0;

    // Non-blocking. One state per requested job, in request order.
    // Unknown job ids report Finished.
    virtual std::vector<JobState> status(const std::vector<JobId>& jobs) = 0;
};

} // namespace diagram_jobs
