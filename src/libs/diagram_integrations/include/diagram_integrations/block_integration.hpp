#pragma once

#include <diagram_model/integration.hpp>
#include <memory>
#include <string>
#include <vector>

namespace diagram_integrations {

using RendererList = std::vector<std::shared_ptr<diagram_model::Renderer>>;

// Common storage for integrations that find diagrams as delimited blocks of lines.
class BlockIntegration : public diagram_model::Integration {
public:
    BlockIntegration(std::string name, std::vector<std::string> filetypes, RendererList renderers);

    const std::string& name() const override { return name_; }
    const std::vector<std::string>& filetypes() const override { return filetypes_; }
    const RendererList& renderers() const override { return renderers_; }

protected:
    bool knows_renderer(const std::string& renderer_id) const;

private:
    std::string name_;
    std::vector<std::string> filetypes_;
    RendererList renderers_;
};

// Fenced code blocks (``` or ~~~) whose info string names a renderer.
// The range starts at the opening fence.
class MarkdownIntegration : public BlockIntegration {
public:
    explicit MarkdownIntegration(RendererList renderers);

    std::vector<diagram_model::Diagram> query_buffer_diagrams(const diagram_model::BufferSource& buffers,
        diagram_model::BufferId buffer) const override;
};

// `@code <renderer>` ... `@end` tags. The range starts on the first content
// row, one row below the tag.
class NeorgIntegration : public BlockIntegration {
public:
    explicit NeorgIntegration(RendererList renderers);

    std::vector<diagram_model::Diagram> query_buffer_diagrams(const diagram_model::BufferSource& buffers,
        diagram_model::BufferId buffer) const override;
};

// Builtin integration by configuration name ("markdown", "neorg"); nullptr if unknown.
std::shared_ptr<diagram_model::Integration> make_builtin_integration(const std::string& name,
    RendererList renderers);
const std::vector<std::string>& builtin_integration_names();

} // namespace diagram_integrations
