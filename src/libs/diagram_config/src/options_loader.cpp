#include <diagram_config/options.hpp>
#include <diagram_log/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <fstream>

namespace diagram_config {

namespace {

nlohmann::json defaults_json() {
    return nlohmann::json{
        { "integrations", nlohmann::json::array({ "markdown" }) },
        { "renderer_options", {
            { "mermaid", nlohmann::json::object() },
            { "plantuml", nlohmann::json::object() },
        } },
        { "events", {
            { "clear_buffer", nlohmann::json::array({ "InsertEnter", "CursorMoved" }) },
        } },
        { "stale_completions", "preserve" },
    };
}

bool parse_string_list(const nlohmann::json& j, std::vector<std::string>& out) {
    if (!j.is_array()) return false;
    out.clear();
    for (const auto& item : j) {
        if (!item.is_string()) return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

// Positive integer that fits in an int.
std::optional<int> parse_pixel_size(const nlohmann::json& j) {
    if (!j.is_number_integer()) return std::nullopt;
    if (j.is_number_unsigned()) {
        const auto value = j.get<std::uint64_t>();
        if (value == 0 || value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(value);
    }
    const auto value = j.get<std::int64_t>();
    if (value <= 0 || value > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(value);
}

std::optional<diagram_model::RendererOptions> parse_renderer_options(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    diagram_model::RendererOptions o;
    if (j.contains("background")) {
        if (!j["background"].is_string()) return std::nullopt;
        o.background = j["background"].get<std::string>();
    }
    if (j.contains("theme")) {
        if (!j["theme"].is_string()) return std::nullopt;
        o.theme = j["theme"].get<std::string>();
    }
    if (j.contains("scale")) {
        if (!j["scale"].is_number()) return std::nullopt;
        const double scale = j["scale"].get<double>();
        if (!(scale > 0.0)) return std::nullopt;
        o.scale = scale;
    }
    if (j.contains("width")) {
        o.width = parse_pixel_size(j["width"]);
        if (!o.width) return std::nullopt;
    }
    if (j.contains("height")) {
        o.height = parse_pixel_size(j["height"]);
        if (!o.height) return std::nullopt;
    }
    return o;
}

std::optional<PluginOptions> parse_options(const nlohmann::json& j) {
    PluginOptions out;
    out.renderer_options.clear();

    if (j.contains("integrations") && !parse_string_list(j["integrations"], out.integrations))
        return std::nullopt;

    if (j.contains("renderer_options")) {
        const auto& ro = j["renderer_options"];
        if (!ro.is_object()) return std::nullopt;
        for (auto it = ro.begin(); it != ro.end(); ++it) {
            auto parsed = parse_renderer_options(it.value());
            if (!parsed) return std::nullopt;
            out.renderer_options[it.key()] = *parsed;
        }
    }

    if (j.contains("events")) {
        const auto& events = j["events"];
        if (!events.is_object()) return std::nullopt;
        if (events.contains("clear_buffer")) {
            const auto& clear = events["clear_buffer"];
            if (clear.is_boolean()) {
                if (clear.get<bool>()) return std::nullopt; // `true` names no events
                out.clear_buffer_events.clear();
            } else if (!parse_string_list(clear, out.clear_buffer_events)) {
                return std::nullopt;
            }
        }
    }

    if (j.contains("stale_completions")) {
        const auto& policy = j["stale_completions"];
        if (!policy.is_string()) return std::nullopt;
        const std::string name = policy.get<std::string>();
        if (name == "preserve") out.stale_completions = StaleCompletions::Preserve;
        else if (name == "discard") out.stale_completions = StaleCompletions::Discard;
        else return std::nullopt;
    }

    if (j.contains("cache_dir")) {
        if (!j["cache_dir"].is_string()) return std::nullopt;
        out.cache_dir = j["cache_dir"].get<std::string>();
    }

    return out;
}

} // namespace

diagram_model::RendererOptions PluginOptions::options_for(const std::string& renderer_id) const {
    auto it = renderer_options.find(renderer_id);
    if (it == renderer_options.end()) return {};
    return it->second;
}

std::optional<PluginOptions> load_options_from_json(std::istream& in) {
    try {
        nlohmann::json user = nlohmann::json::parse(in);
        if (!user.is_object()) return std::nullopt;
        nlohmann::json merged = defaults_json();
        merged.merge_patch(user);
        return parse_options(merged);
    } catch (const nlohmann::json::exception& e) {
        diagram_log::logger()->error("options_parse_failed what={}", e.what());
        return std::nullopt;
    }
}

std::optional<PluginOptions> load_options_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_options_from_json(f);
}

std::filesystem::path default_cache_dir() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".cache";
    } else {
        base = std::filesystem::temp_directory_path();
    }
    return base / "inline_diagrams" / "diagram-cache";
}

const char* stale_completions_name(StaleCompletions policy) {
    switch (policy) {
    case StaleCompletions::Preserve: return "preserve";
    case StaleCompletions::Discard: return "discard";
    }
    return "unknown";
}

} // namespace diagram_config
