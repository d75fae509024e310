#pragma once

#include <diagram_jobs/job_control.hpp>
#include <diagram_model/renderer.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace diagram_renderers {

// Renders through the `plantuml` launcher; same cache scheme as MermaidRenderer.
// Width and height are not supported by plantuml and are ignored.
class PlantumlRenderer : public diagram_model::Renderer {
public:
    PlantumlRenderer(diagram_jobs::JobControl& jobs, std::filesystem::path cache_dir,
        std::string program = "plantuml");

    const std::string& id() const override;
    diagram_model::RenderResult render(const std::string& source,
        const diagram_model::RendererOptions& options) override;

    std::vector<std::string> command_line(const std::filesystem::path& input,
        const diagram_model::RendererOptions& options) const;

private:
    diagram_jobs::JobControl& jobs_;
    std::filesystem::path cache_dir_;
    std::string program_;
};

} // namespace diagram_renderers
