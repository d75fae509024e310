#include <diagram_renderers/mermaid_renderer.hpp>
#include <diagram_renderers/cache_files.hpp>
#include <diagram_log/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace diagram_renderers {

namespace {

const std::string mermaid_id = "mermaid";

} // namespace

MermaidRenderer::MermaidRenderer(diagram_jobs::JobControl& jobs, std::filesystem::path cache_dir,
    std::string program)
    : jobs_(jobs)
    , cache_dir_(std::move(cache_dir))
    , program_(std::move(program))
{
}

const std::string& MermaidRenderer::id() const {
    return mermaid_id;
}

std::vector<std::string> MermaidRenderer::command_line(const std::filesystem::path& input,
    const std::filesystem::path& output, const diagram_model::RendererOptions& options) const
{
    std::vector<std::string> argv = { program_, "-i", input.string(), "-o", output.string() };
    if (options.background) {
        argv.push_back("-b");
        argv.push_back(*options.background);
    }
    if (options.theme) {
        argv.push_back("-t");
        argv.push_back(*options.theme);
    }
    if (options.scale) {
        argv.push_back("-s");
        argv.push_back(fmt::format("{}", *options.scale));
    }
    if (options.width) {
        argv.push_back("-w");
        argv.push_back(std::to_string(*options.width));
    }
    if (options.height) {
        argv.push_back("-H");
        argv.push_back(std::to_string(*options.height));
    }
    return argv;
}

diagram_model::RenderResult MermaidRenderer::render(const std::string& source,
    const diagram_model::RendererOptions& options)
{
    auto log = diagram_log::logger();
    const std::string key = cache_key(mermaid_id, source, options);
    const std::filesystem::path input = cache_dir_ / (key + ".mmd");
    const std::filesystem::path output = cache_dir_ / (key + ".png");

    diagram_model::RenderResult result;
    result.file_path = output.string();

    if (is_readable_file(output)) {
        log->debug("render_cached renderer=mermaid file={}", result.file_path);
        return result;
    }

    if (!write_text_file(input, source)) {
        log->error("render_source_write_failed renderer=mermaid file={}", input.string());
        return result;
    }

    diagram_jobs::JobSpec spec;
    spec.argv = command_line(input, output, options);
    spec.stderr_path = cache_dir_ / (key + ".log");
    result.job_id = jobs_.start(spec);
    if (!result.job_id) {
        log->error("render_job_failed renderer=mermaid program={}", program_);
    }
    return result;
}

} // namespace diagram_renderers
