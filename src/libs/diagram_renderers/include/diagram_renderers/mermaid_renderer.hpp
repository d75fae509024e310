#pragma once

#include <diagram_jobs/job_control.hpp>
#include <diagram_model/renderer.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace diagram_renderers {

// Renders through the mermaid CLI (`mmdc`). Outputs are cached in `cache_dir`
// by source and options, so an unchanged diagram is ready without a job.
class MermaidRenderer : public diagram_model::Renderer {
public:
    MermaidRenderer(diagram_jobs::JobControl& jobs, std::filesystem::path cache_dir,
        std::string program = "mmdc");

    const std::string& id() const override;
    diagram_model::RenderResult render(const std::string& source,
        const diagram_model::RendererOptions& options) override;

    std::vector<std::string> command_line(const std::filesystem::path& input,
        const std::filesystem::path& output, const diagram_model::RendererOptions& options) const;

private:
    diagram_jobs::JobControl& jobs_;
    std::filesystem::path cache_dir_;
    std::string program_;
};

} // namespace diagram_renderers
