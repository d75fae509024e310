#include <diagram_renderers/plantuml_renderer.hpp>
#include <diagram_renderers/cache_files.hpp>
#include <diagram_log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <utility>

namespace diagram_renderers {

namespace {

const std::string plantuml_id = "plantuml";
const double base_dpi = 96.0;

} // namespace

PlantumlRenderer::PlantumlRenderer(diagram_jobs::JobControl& jobs, std::filesystem::path cache_dir,
    std::string program)
    : jobs_(jobs)
    , cache_dir_(std::move(cache_dir))
    , program_(std::move(program))
{
}

const std::string& PlantumlRenderer::id() const {
    return plantuml_id;
}

std::vector<std::string> PlantumlRenderer::command_line(const std::filesystem::path& input,
    const diagram_model::RendererOptions& options) const
{
    // plantuml names the output after the input file, inside the -o directory.
    std::vector<std::string> argv = { program_, "-tpng", "-o", cache_dir_.string() };
    if (options.theme) {
        argv.push_back("-theme");
        argv.push_back(*options.theme);
    }
    if (options.background) {
        argv.push_back("-SbackgroundColor=" + *options.background);
    }
    if (options.scale && *options.scale > 0.0) {
        argv.push_back(fmt::format("-Sdpi={}", static_cast<int>(std::lround(base_dpi * *options.scale))));
    }
    argv.push_back(input.string());
    return argv;
}

diagram_model::RenderResult PlantumlRenderer::render(const std::string& source,
    const diagram_model::RendererOptions& options)
{
    auto log = diagram_log::logger();
    const std::string key = cache_key(plantuml_id, source, options);
    const std::filesystem::path input = cache_dir_ / (key + ".puml");
    const std::filesystem::path output = cache_dir_ / (key + ".png");

    diagram_model::RenderResult result;
    result.file_path = output.string();

    if (is_readable_file(output)) {
        log->debug("render_cached renderer=plantuml file={}", result.file_path);
        return result;
    }

    // plantuml wants the @start/@end markers; fenced blocks often leave them out.
    std::string text = source;
    if (text.find("@start") == std::string::npos) {
        text = "@startuml\n" + text + (text.empty() || text.back() == '\n' ? "" : "\n") + "@enduml\n";
    }
    if (!write_text_file(input, text)) {
        log->error("render_source_write_failed renderer=plantuml file={}", input.string());
        return result;
    }

    diagram_jobs::JobSpec spec;
    spec.argv = command_line(input, options);
    spec.stderr_path = cache_dir_ / (key + ".log");
    result.job_id = jobs_.start(spec);
    if (!result.job_id) {
        log->error("render_job_failed renderer=plantuml program={}", program_);
    }
    return result;
}

} // namespace diagram_renderers
