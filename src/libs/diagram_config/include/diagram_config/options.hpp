#pragma once

#include <diagram_model/types.hpp>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace diagram_config {

// What happens to a job that completes after its buffer was rendered again or cleared.
enum class StaleCompletions {
    Preserve, // still materialized and recorded
    Discard   // dropped
};

struct PluginOptions {
    std::vector<std::string> integrations = { "markdown" };
    std::map<std::string, diagram_model::RendererOptions> renderer_options = {
        { "mermaid", {} },
        { "plantuml", {} },
    };
    // Empty disables clearing on buffer activity.
    std::vector<std::string> clear_buffer_events = { "InsertEnter", "CursorMoved" };
    StaleCompletions stale_completions = StaleCompletions::Preserve;
    // Empty means default_cache_dir().
    std::filesystem::path cache_dir;

    // Options for `renderer_id`, or empty options.
    diagram_model::RendererOptions options_for(const std::string& renderer_id) const;
};

// User options are deep-merged over the defaults (JSON merge patch: objects
// merge key by key, arrays and scalars replace, null resets to the default).
// Returns nullopt on malformed JSON or a value of the wrong type.
std::optional<PluginOptions> load_options_from_json(std::istream& in);
std::optional<PluginOptions> load_options_from_json_file(const std::string& path);

// $XDG_CACHE_HOME (or $HOME/.cache) / inline_diagrams / diagram-cache.
std::filesystem::path default_cache_dir();

const char* stale_completions_name(StaleCompletions policy);

} // namespace diagram_config
