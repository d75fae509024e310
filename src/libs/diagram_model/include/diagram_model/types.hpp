#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace diagram_model {

using BufferId = int;
using WindowId = int;
using JobId = std::int64_t;

// Zero-based rows and columns, as reported by the integration that found the block.
struct Range {
    int start_row = 0;
    int start_col = 0;
    int end_row = 0;
    int end_col = 0;
};

bool operator==(const Range& a, const Range& b);
bool operator!=(const Range& a, const Range& b);

// Unset fields fall back to the renderer's own default.
struct RendererOptions {
    std::optional<std::string> background;
    std::optional<std::string> theme;
    std::optional<double> scale;
    std::optional<int> width;
    std::optional<int> height;

    bool empty() const;
};

// `job_id` is set when the file at `file_path` is still being produced by an external job.
struct RenderResult {
    std::string file_path;
    std::optional<JobId> job_id;
};

class ImageHandle {
public:
    virtual ~ImageHandle() = default;
    virtual void render() = 0;
    virtual void clear() = 0;
};

struct Diagram {
    BufferId buffer_id = 0;
    std::string source;
    std::string renderer_id;
    Range range;
    // Null until materialized.
    std::shared_ptr<ImageHandle> image;
};

} // namespace diagram_model
