#pragma once

#include <diagram_model/types.hpp>
#include <string>

namespace diagram_model {

class Renderer {
public:
    virtual ~Renderer() = default;

    virtual const std::string& id() const = 0;
    virtual RenderResult render(const std::string& source, const RendererOptions& options) = 0;
};

} // namespace diagram_model
