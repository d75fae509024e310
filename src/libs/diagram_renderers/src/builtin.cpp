#include <diagram_renderers/builtin.hpp>
#include <diagram_renderers/mermaid_renderer.hpp>
#include <diagram_renderers/plantuml_renderer.hpp>

namespace diagram_renderers {

RendererList make_builtin_renderers(diagram_jobs::JobControl& jobs, const std::filesystem::path& cache_dir) {
    RendererList out;
    out.push_back(std::make_shared<MermaidRenderer>(jobs, cache_dir));
    out.push_back(std::make_shared<PlantumlRenderer>(jobs, cache_dir));
    return out;
}

} // namespace diagram_renderers
