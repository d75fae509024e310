#pragma once

#include <diagram_model/renderer.hpp>
#include <diagram_model/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace diagram_model {

// Read access to the host's text buffers.
class BufferSource {
public:
    virtual ~BufferSource() = default;

    virtual std::string filetype(BufferId buffer) const = 0;
    virtual std::vector<std::string> lines(BufferId buffer) const = 0;
};

class Integration {
public:
    virtual ~Integration() = default;

    virtual const std::string& name() const = 0;
    virtual const std::vector<std::string>& filetypes() const = 0;
    virtual const std::vector<std::shared_ptr<Renderer>>& renderers() const = 0;

    // Fresh snapshot of the diagrams currently in `buffer`, in document order.
    virtual std::vector<Diagram> query_buffer_diagrams(const BufferSource& buffers, BufferId buffer) const = 0;

    bool handles_filetype(const std::string& filetype) const;
    Renderer* find_renderer(const std::string& renderer_id) const;
};

using IntegrationList = std::vector<std::shared_ptr<Integration>>;

// First integration declaring `filetype`, or nullptr.
Integration* find_integration_for(const IntegrationList& integrations, const std::string& filetype);

} // namespace diagram_model
