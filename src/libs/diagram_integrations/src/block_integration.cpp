#include <diagram_integrations/block_integration.hpp>
#include <diagram_integrations/line_text.hpp>
#include <utility>

namespace diagram_integrations {

std::size_t leading_blanks(const std::string& line) {
    std::size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    return i;
}

std::string trim_blanks(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

BlockIntegration::BlockIntegration(std::string name, std::vector<std::string> filetypes, RendererList renderers)
    : name_(std::move(name))
    , filetypes_(std::move(filetypes))
    , renderers_(std::move(renderers))
{
}

bool BlockIntegration::knows_renderer(const std::string& renderer_id) const {
    return find_renderer(renderer_id) != nullptr;
}

std::shared_ptr<diagram_model::Integration> make_builtin_integration(const std::string& name,
    RendererList renderers)
{
    if (name == "markdown") return std::make_shared<MarkdownIntegration>(std::move(renderers));
    if (name == "neorg") return std::make_shared<NeorgIntegration>(std::move(renderers));
    return nullptr;
}

const std::vector<std::string>& builtin_integration_names() {
    static const std::vector<std::string> names = { "markdown", "neorg" };
    return names;
}

} // namespace diagram_integrations
