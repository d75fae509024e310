#include <diagram_integrations/block_integration.hpp>
#include <diagram_integrations/line_text.hpp>
#include <cstddef>

namespace diagram_integrations {

namespace {

const std::string code_tag = "@code";
const std::string end_tag = "@end";

// "@code mermaid" -> "mermaid"; false if the line is not a code tag.
bool parse_code_tag(const std::string& line, std::string& language) {
    const std::string t = trim_blanks(line);
    if (t.compare(0, code_tag.size(), code_tag) != 0) return false;
    const std::string rest = t.substr(code_tag.size());
    if (!rest.empty() && rest[0] != ' ' && rest[0] != '\t') return false;
    const std::string lang = trim_blanks(rest);
    language = lang.substr(0, lang.find_first_of(" \t"));
    return true;
}

} // namespace

NeorgIntegration::NeorgIntegration(RendererList renderers)
    : BlockIntegration("neorg", { "norg" }, std::move(renderers))
{
}

std::vector<diagram_model::Diagram> NeorgIntegration::query_buffer_diagrams(
    const diagram_model::BufferSource& buffers, diagram_model::BufferId buffer) const
{
    std::vector<diagram_model::Diagram> out;
    const std::vector<std::string> lines = buffers.lines(buffer);

    std::size_t row = 0;
    while (row < lines.size()) {
        std::string language;
        if (!parse_code_tag(lines[row], language)) {
            ++row;
            continue;
        }

        std::size_t close = row + 1;
        while (close < lines.size() && trim_blanks(lines[close]) != end_tag) ++close;
        if (close >= lines.size()) break;

        if (knows_renderer(language)) {
            diagram_model::Diagram d;
            d.buffer_id = buffer;
            d.renderer_id = language;
            for (std::size_t i = row + 1; i < close; ++i) {
                d.source += lines[i];
                d.source += '\n';
            }
            d.range.start_row = static_cast<int>(row + 1);
            d.range.start_col = static_cast<int>(leading_blanks(lines[row]));
            d.range.end_row = static_cast<int>(close);
            d.range.end_col = static_cast<int>(lines[close].size());
            out.push_back(std::move(d));
        }
        row = close + 1;
    }
    return out;
}

} // namespace diagram_integrations
