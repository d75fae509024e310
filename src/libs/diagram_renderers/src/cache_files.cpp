#include <diagram_renderers/cache_files.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>

namespace diagram_renderers {

std::string cache_key(const std::string& renderer_id, const std::string& source,
    const diagram_model::RendererOptions& options)
{
    std::ostringstream key;
    key << renderer_id << '\n' << source << '\n';
    key << "background=" << options.background.value_or("") << '\n';
    key << "theme=" << options.theme.value_or("") << '\n';
    key << "scale=" << (options.scale ? fmt::format("{}", *options.scale) : std::string()) << '\n';
    key << "width=" << (options.width ? std::to_string(*options.width) : std::string()) << '\n';
    key << "height=" << (options.height ? std::to_string(*options.height) : std::string()) << '\n';

    const auto hash_value = std::hash<std::string>{}(key.str());
    return fmt::format("{}-{:016x}", renderer_id, static_cast<unsigned long long>(hash_value));
}

bool write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << text;
    return static_cast<bool>(f);
}

bool is_readable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) return false;
    std::ifstream f(path, std::ios::binary);
    return static_cast<bool>(f);
}

} // namespace diagram_renderers
