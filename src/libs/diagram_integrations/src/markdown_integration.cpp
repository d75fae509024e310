#include <diagram_integrations/block_integration.hpp>
#include <diagram_integrations/line_text.hpp>
#include <cstddef>

namespace diagram_integrations {

namespace {

struct Fence {
    char marker = '`';
    std::size_t length = 0;
    std::size_t indent = 0;
    std::string info;
};

bool parse_opening_fence(const std::string& line, Fence& out) {
    const std::size_t indent = leading_blanks(line);
    if (indent >= line.size()) return false;
    const char marker = line[indent];
    if (marker != '`' && marker != '~') return false;

    std::size_t i = indent;
    while (i < line.size() && line[i] == marker) ++i;
    const std::size_t length = i - indent;
    if (length < 3) return false;

    const std::string info = trim_blanks(line.substr(i));
    // Backtick fences may not carry backticks in their info string.
    if (marker == '`' && info.find('`') != std::string::npos) return false;

    out.marker = marker;
    out.length = length;
    out.indent = indent;
    // Only the first word names the language ("mermaid {theme=dark}" -> "mermaid").
    out.info = info.substr(0, info.find_first_of(" \t{"));
    return true;
}

bool is_closing_fence(const std::string& line, const Fence& fence) {
    const std::size_t indent = leading_blanks(line);
    std::size_t i = indent;
    while (i < line.size() && line[i] == fence.marker) ++i;
    if (i - indent < fence.length) return false;
    return trim_blanks(line.substr(i)).empty();
}

} // namespace

MarkdownIntegration::MarkdownIntegration(RendererList renderers)
    : BlockIntegration("markdown", { "markdown" }, std::move(renderers))
{
}

std::vector<diagram_model::Diagram> MarkdownIntegration::query_buffer_diagrams(
    const diagram_model::BufferSource& buffers, diagram_model::BufferId buffer) const
{
    std::vector<diagram_model::Diagram> out;
    const std::vector<std::string> lines = buffers.lines(buffer);

    std::size_t row = 0;
    while (row < lines.size()) {
        Fence fence;
        if (!parse_opening_fence(lines[row], fence)) {
            ++row;
            continue;
        }

        std::size_t close = row + 1;
        while (close < lines.size() && !is_closing_fence(lines[close], fence)) ++close;
        if (close >= lines.size()) break; // unterminated block runs to end of buffer

        if (knows_renderer(fence.info)) {
            diagram_model::Diagram d;
            d.buffer_id = buffer;
            d.renderer_id = fence.info;
            for (std::size_t i = row + 1; i < close; ++i) {
                d.source += lines[i];
                d.source += '\n';
            }
            d.range.start_row = static_cast<int>(row);
            d.range.start_col = static_cast<int>(fence.indent);
            d.range.end_row = static_cast<int>(close);
            d.range.end_col = static_cast<int>(lines[close].size());
            out.push_back(std::move(d));
        }
        row = close + 1;
    }
    return out;
}

} // namespace diagram_integrations
