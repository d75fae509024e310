#include <diagram_model/integration.hpp>
#include <algorithm>

namespace diagram_model {

bool Integration::handles_filetype(const std::string& filetype) const {
    const auto& types = filetypes();
    return std::find(types.begin(), types.end(), filetype) != types.end();
}

Renderer* Integration::find_renderer(const std::string& renderer_id) const {
    for (const auto& r : renderers()) {
        if (r && r->id() == renderer_id) return r.get();
    }
    return nullptr;
}

Integration* find_integration_for(const IntegrationList& integrations, const std::string& filetype) {
    for (const auto& integration : integrations) {
        if (integration && integration->handles_filetype(filetype)) return integration.get();
    }
    return nullptr;
}

} // namespace diagram_model
