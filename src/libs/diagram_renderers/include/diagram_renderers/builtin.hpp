#pragma once

#include <diagram_jobs/job_control.hpp>
#include <diagram_model/renderer.hpp>
#include <filesystem>
#include <memory>
#include <vector>

namespace diagram_renderers {

using RendererList = std::vector<std::shared_ptr<diagram_model::Renderer>>;

// mermaid and plantuml, both writing into `cache_dir`.
RendererList make_builtin_renderers(diagram_jobs::JobControl& jobs, const std::filesystem::path& cache_dir);

} // namespace diagram_renderers
