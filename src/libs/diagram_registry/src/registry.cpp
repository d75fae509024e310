#include <diagram_registry/registry.hpp>
#include <diagram_log/log.hpp>
#include <algorithm>
#include <utility>

namespace diagram_registry {

DiagramRegistry::DiagramRegistry(ImageLifecycle& images)
    : images_(images)
{
}

std::size_t DiagramRegistry::clear(diagram_model::BufferId buffer) {
    std::size_t removed = 0;
    auto it = diagrams_.begin();
    while (it != diagrams_.end()) {
        if (it->buffer_id != buffer) {
            ++it;
            continue;
        }
        images_.dispose(it->image);
        it = diagrams_.erase(it);
        ++removed;
    }
    if (removed > 0) {
        diagram_log::logger()->debug("registry_clear buffer={} removed={}", buffer, removed);
    }
    return removed;
}

std::size_t DiagramRegistry::clear_all() {
    const std::size_t removed = diagrams_.size();
    for (auto& d : diagrams_) {
        images_.dispose(d.image);
    }
    diagrams_.clear();
    return removed;
}

bool DiagramRegistry::record(diagram_model::Diagram diagram) {
    if (!diagram.image) {
        diagram_log::logger()->warn("registry_record_rejected buffer={} row={} reason=no_image",
            diagram.buffer_id, diagram.range.start_row);
        return false;
    }

    auto existing = std::find_if(diagrams_.begin(), diagrams_.end(), [&](const diagram_model::Diagram& d) {
        return d.buffer_id == diagram.buffer_id && d.range == diagram.range;
    });
    if (existing != diagrams_.end()) {
        if (existing->image != diagram.image) images_.dispose(existing->image);
        *existing = std::move(diagram);
        return true;
    }

    diagrams_.push_back(std::move(diagram));
    return true;
}

std::vector<const diagram_model::Diagram*> DiagramRegistry::for_buffer(diagram_model::BufferId buffer) const {
    std::vector<const diagram_model::Diagram*> out;
    for (const auto& d : diagrams_) {
        if (d.buffer_id == buffer) out.push_back(&d);
    }
    return out;
}

const diagram_model::Diagram* DiagramRegistry::find(diagram_model::BufferId buffer,
    const diagram_model::Range& range) const
{
    for (const auto& d : diagrams_) {
        if (d.buffer_id == buffer && d.range == range) return &d;
    }
    return nullptr;
}

} // namespace diagram_registry
