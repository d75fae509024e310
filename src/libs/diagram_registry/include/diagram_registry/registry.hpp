#pragma once

#include <diagram_model/types.hpp>
#include <diagram_registry/image_lifecycle.hpp>
#include <cstddef>
#include <vector>

namespace diagram_registry {

// Materialized diagrams across all buffers, in insertion order.
// Holds at most one record per (buffer, range).
class DiagramRegistry {
public:
    explicit DiagramRegistry(ImageLifecycle& images);

    // Disposes and removes every record of `buffer`. Idempotent.
    // Returns the number of records removed.
    std::size_t clear(diagram_model::BufferId buffer);
    std::size_t clear_all();

    // Rejects diagrams without an image. A record already present at the
    // same (buffer, range) is disposed and replaced in place.
    bool record(diagram_model::Diagram diagram);

    const std::vector<diagram_model::Diagram>& diagrams() const { return diagrams_; }
    std::vector<const diagram_model::Diagram*> for_buffer(diagram_model::BufferId buffer) const;
    const diagram_model::Diagram* find(diagram_model::BufferId buffer, const diagram_model::Range& range) const;
    std::size_t size() const { return diagrams_.size(); }
    bool empty() const { return diagrams_.empty(); }

private:
    ImageLifecycle& images_;
    std::vector<diagram_model::Diagram> diagrams_;
};

} // namespace diagram_registry
