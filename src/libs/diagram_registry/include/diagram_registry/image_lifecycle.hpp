#pragma once

#include <diagram_model/types.hpp>
#include <memory>
#include <string>

namespace diagram_registry {

struct ImageAnchor {
    int row = 0;
    int col = 0;
};

struct ImagePlacement {
    diagram_model::BufferId buffer = 0;
    diagram_model::WindowId window = 0;
    ImageAnchor anchor;
    bool with_virtual_padding = true;
    bool inline_image = true;
};

// Display library that paints an image file onto the host surface.
class ImageBackend {
public:
    virtual ~ImageBackend() = default;

    // Creates the image without painting it. May return nullptr.
    virtual std::shared_ptr<diagram_model::ImageHandle> from_file(const std::string& path,
        const ImagePlacement& placement) = 0;
};

class ImageLifecycle {
public:
    explicit ImageLifecycle(ImageBackend& backend);

    // Inline, padded image anchored at `anchor`. Painting is a separate
    // step (ImageHandle::render).
    std::shared_ptr<diagram_model::ImageHandle> materialize(const std::string& file_path,
        diagram_model::BufferId buffer, diagram_model::WindowId window, ImageAnchor anchor);

    // Releases the image's screen resources. Accepts null handles and
    // images that were never painted.
    void dispose(const std::shared_ptr<diagram_model::ImageHandle>& image);

    std::size_t live_images() const { return live_; }

private:
    ImageBackend& backend_;
    std::size_t live_ = 0;
};

} // namespace diagram_registry
