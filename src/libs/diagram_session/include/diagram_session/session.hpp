#pragma once

#include <diagram_config/options.hpp>
#include <diagram_jobs/job_control.hpp>
#include <diagram_jobs/job_poller.hpp>
#include <diagram_jobs/scheduler.hpp>
#include <diagram_model/integration.hpp>
#include <diagram_registry/image_lifecycle.hpp>
#include <diagram_registry/registry.hpp>
#include <diagram_session/host.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace diagram_session {

// Broken configuration: unknown renderer or integration. Aborts the
// operation in progress, never the process.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MissingDependency : public ConfigError {
public:
    using ConfigError::ConfigError;
};

enum class RenderOutcome { Rendered, NoIntegration };

extern const char* const command_group;

// One plugin session: owns the diagram registry, the job poller and the
// active integrations, and wires the render/clear commands into the host.
class Session {
public:
    Session(Host& host, diagram_registry::ImageBackend* images,
        diagram_jobs::Scheduler& scheduler, diagram_jobs::JobControl& jobs);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Uses the builtin integrations named in `options`.
    void setup(const diagram_config::PluginOptions& options);
    void setup(const diagram_config::PluginOptions& options, diagram_model::IntegrationList integrations);
    // Clears every buffer, stops pending polls and unregisters from the host.
    void teardown();
    bool is_set_up() const { return registry_ != nullptr; }

    // Renders the host's current buffer with the first matching integration.
    RenderOutcome render_diagrams();
    void render_buffer(diagram_model::BufferId buffer, diagram_model::WindowId window,
        const diagram_model::Integration& integration);
    // Defaults to the current buffer.
    void clear_buffer(std::optional<diagram_model::BufferId> buffer = std::nullopt);

    // Runs `action`, reporting a ConfigError through the log and the host.
    // Returns false when the action was aborted.
    bool run_guarded(const std::string& what, const std::function<void()>& action);

    std::filesystem::path cache_dir() const;
    const diagram_config::PluginOptions& options() const { return options_; }
    const diagram_model::IntegrationList& integrations() const { return integrations_; }
    const diagram_registry::DiagramRegistry* registry() const { return registry_.get(); }
    std::size_t pending_jobs() const { return poller_.pending(); }
    std::uint64_t generation(diagram_model::BufferId buffer) const;

private:
    struct PendingDiagram {
        diagram_model::Diagram diagram;
        std::string file_path;
        diagram_model::WindowId window = 0;
        std::string filetype;
        std::uint64_t generation = 0;
    };

    void register_commands();
    void install_clear_autocmd(diagram_model::BufferId buffer);
    void materialize(PendingDiagram& pending);
    std::uint64_t bump_generation(diagram_model::BufferId buffer);

    Host& host_;
    diagram_registry::ImageBackend* image_backend_ = nullptr;
    diagram_jobs::JobControl& jobs_;
    diagram_jobs::JobPoller poller_;

    diagram_config::PluginOptions options_;
    diagram_model::IntegrationList integrations_;
    std::unique_ptr<diagram_registry::ImageLifecycle> images_;
    std::unique_ptr<diagram_registry::DiagramRegistry> registry_;
    std::unordered_map<diagram_model::BufferId, std::uint64_t> generations_;
    std::unordered_set<diagram_model::BufferId> autocmd_buffers_;
};

} // namespace diagram_session
