#include <diagram_session/session.hpp>
#include <diagram_integrations/block_integration.hpp>
#include <diagram_log/log.hpp>
#include <diagram_renderers/builtin.hpp>
#include <diagram_renderers/cache_files.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <utility>

namespace diagram_session {

const char* const command_group = "inline_diagrams";

namespace {

// Content types whose integration reports ranges one row below the row the
// image belongs on.
const std::vector<std::string> shifted_origin_filetypes = { "norg" };

bool needs_origin_shift(const std::string& filetype) {
    return std::find(shifted_origin_filetypes.begin(), shifted_origin_filetypes.end(), filetype)
        != shifted_origin_filetypes.end();
}

} // namespace

Session::Session(Host& host, diagram_registry::ImageBackend* images,
    diagram_jobs::Scheduler& scheduler, diagram_jobs::JobControl& jobs)
    : host_(host)
    , image_backend_(images)
    , jobs_(jobs)
    , poller_(scheduler, jobs)
{
}

Session::~Session() {
    teardown();
}

void Session::setup(const diagram_config::PluginOptions& options) {
    const std::filesystem::path dir = options.cache_dir.empty() ? diagram_config::default_cache_dir() : options.cache_dir;
    const auto renderers = diagram_renderers::make_builtin_renderers(jobs_, dir);

    diagram_model::IntegrationList integrations;
    for (const auto& name : options.integrations) {
        auto integration = diagram_integrations::make_builtin_integration(name, renderers);
        if (!integration) {
            throw ConfigError(fmt::format("diagram: unknown integration `{}`", name));
        }
        integrations.push_back(std::move(integration));
    }
    setup(options, std::move(integrations));
}

void Session::setup(const diagram_config::PluginOptions& options, diagram_model::IntegrationList integrations) {
    if (!image_backend_) {
        throw MissingDependency("diagram: missing dependency `image backend`");
    }
    if (is_set_up()) teardown();

    options_ = options;
    if (options_.cache_dir.empty()) options_.cache_dir = diagram_config::default_cache_dir();
    integrations_ = std::move(integrations);
    images_ = std::make_unique<diagram_registry::ImageLifecycle>(*image_backend_);
    registry_ = std::make_unique<diagram_registry::DiagramRegistry>(*images_);

    register_commands();

    const diagram_model::BufferId current = host_.current_buffer();
    const std::string current_filetype = host_.filetype(current);
    for (const auto& integration : integrations_) {
        host_.create_filetype_autocmd(command_group, integration->filetypes(),
            [this](diagram_model::BufferId buffer) { install_clear_autocmd(buffer); });
        if (integration->handles_filetype(current_filetype)) {
            install_clear_autocmd(current);
        }
    }

    diagram_log::logger()->info("session_setup integrations={} cache_dir={} stale_completions={}",
        integrations_.size(), options_.cache_dir.string(),
        diagram_config::stale_completions_name(options_.stale_completions));
}

void Session::teardown() {
    if (!is_set_up()) return;
    poller_.cancel_all();
    const std::size_t removed = registry_->clear_all();
    host_.clear_group(command_group);
    autocmd_buffers_.clear();
    generations_.clear();
    registry_.reset();
    images_.reset();
    integrations_.clear();
    diagram_log::logger()->info("session_teardown cleared={}", removed);
}

void Session::register_commands() {
    host_.create_user_command(command_group, "DiagramRender", "Render diagrams in the current buffer",
        [this]() { (void)run_guarded("DiagramRender", [this]() { render_diagrams(); }); });
    host_.create_user_command(command_group, "DiagramClear", "Clear diagrams in the current buffer",
        [this]() { (void)run_guarded("DiagramClear", [this]() { clear_buffer(); }); });
}

void Session::install_clear_autocmd(diagram_model::BufferId buffer) {
    if (options_.clear_buffer_events.empty()) return;
    if (!autocmd_buffers_.insert(buffer).second) return;
    host_.create_buffer_autocmd(command_group, options_.clear_buffer_events, buffer,
        [this, buffer]() { clear_buffer(buffer); });
}

bool Session::run_guarded(const std::string& what, const std::function<void()>& action) {
    try {
        action();
        return true;
    } catch (const ConfigError& e) {
        diagram_log::logger()->error("{} aborted: {}", what, e.what());
        host_.notify(e.what(), NotifyLevel::Error);
        return false;
    }
}

RenderOutcome Session::render_diagrams() {
    if (!is_set_up()) {
        throw ConfigError("diagram: render requested before setup");
    }
    const diagram_model::BufferId buffer = host_.current_buffer();
    const diagram_model::WindowId window = host_.current_window();
    const std::string filetype = host_.filetype(buffer);

    const diagram_model::Integration* integration = diagram_model::find_integration_for(integrations_, filetype);
    if (!integration) {
        diagram_log::logger()->warn("no_integration buffer={} filetype={}", buffer, filetype);
        host_.notify("No integration found for filetype: " + filetype, NotifyLevel::Warn);
        return RenderOutcome::NoIntegration;
    }

    render_buffer(buffer, window, *integration);
    return RenderOutcome::Rendered;
}

void Session::render_buffer(diagram_model::BufferId buffer, diagram_model::WindowId window,
    const diagram_model::Integration& integration)
{
    if (!is_set_up()) {
        throw ConfigError("diagram: render requested before setup");
    }
    auto log = diagram_log::logger();

    std::vector<diagram_model::Diagram> diagrams = integration.query_buffer_diagrams(host_, buffer);
    // The snapshot above supersedes everything shown for this buffer so far.
    registry_->clear(buffer);
    const std::uint64_t generation = bump_generation(buffer);
    const std::string filetype = host_.filetype(buffer);

    log->info("render_pass buffer={} window={} integration={} diagrams={} generation={}",
        buffer, window, integration.name(), diagrams.size(), generation);

    for (auto& diagram : diagrams) {
        diagram_model::Renderer* renderer = integration.find_renderer(diagram.renderer_id);
        if (!renderer) {
            throw ConfigError(fmt::format("diagram: cannot find renderer with id `{}`", diagram.renderer_id));
        }

        const diagram_model::RendererOptions renderer_options = options_.options_for(renderer->id());
        diagram_model::RenderResult result = renderer->render(diagram.source, renderer_options);

        auto pending = std::make_shared<PendingDiagram>();
        pending->diagram = std::move(diagram);
        pending->file_path = std::move(result.file_path);
        pending->window = window;
        pending->filetype = filetype;
        pending->generation = generation;

        if (result.job_id) {
            log->debug("render_dispatched renderer={} row={} job={}",
                renderer->id(), pending->diagram.range.start_row, *result.job_id);
            poller_.watch(*result.job_id, [this, pending]() { materialize(*pending); });
        } else {
            materialize(*pending);
        }
    }
}

void Session::materialize(PendingDiagram& pending) {
    auto log = diagram_log::logger();
    diagram_model::Diagram& diagram = pending.diagram;

    if (!registry_) return;
    if (options_.stale_completions == diagram_config::StaleCompletions::Discard
        && generation(diagram.buffer_id) != pending.generation)
    {
        log->debug("render_stale_dropped buffer={} row={} generation={} current={}",
            diagram.buffer_id, diagram.range.start_row, pending.generation, generation(diagram.buffer_id));
        return;
    }
    if (!diagram_renderers::is_readable_file(pending.file_path)) {
        log->debug("render_output_missing buffer={} row={} file={}",
            diagram.buffer_id, diagram.range.start_row, pending.file_path);
        return;
    }

    diagram_registry::ImageAnchor anchor;
    anchor.col = diagram.range.start_col;
    anchor.row = diagram.range.start_row;
    if (needs_origin_shift(pending.filetype)) {
        anchor.row = std::max(0, anchor.row - 1);
    }

    auto image = images_->materialize(pending.file_path, diagram.buffer_id, pending.window, anchor);
    if (!image) return;

    diagram.image = image;
    if (!registry_->record(diagram)) {
        images_->dispose(image);
        return;
    }
    image->render();
}

void Session::clear_buffer(std::optional<diagram_model::BufferId> buffer) {
    const diagram_model::BufferId target = buffer ? *buffer : host_.current_buffer();
    if (!is_set_up()) return;
    bump_generation(target);
    registry_->clear(target);
}

std::filesystem::path Session::cache_dir() const {
    return options_.cache_dir.empty() ? diagram_config::default_cache_dir() : options_.cache_dir;
}

std::uint64_t Session::generation(diagram_model::BufferId buffer) const {
    auto it = generations_.find(buffer);
    return it == generations_.end() ? 0 : it->second;
}

std::uint64_t Session::bump_generation(diagram_model::BufferId buffer) {
    return ++generations_[buffer];
}

} // namespace diagram_session
