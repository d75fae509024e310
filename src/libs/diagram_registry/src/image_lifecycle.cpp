#include <diagram_registry/image_lifecycle.hpp>
#include <diagram_log/log.hpp>

namespace diagram_registry {

ImageLifecycle::ImageLifecycle(ImageBackend& backend)
    : backend_(backend)
{
}

std::shared_ptr<diagram_model::ImageHandle> ImageLifecycle::materialize(const std::string& file_path,
    diagram_model::BufferId buffer, diagram_model::WindowId window, ImageAnchor anchor)
{
    ImagePlacement placement;
    placement.buffer = buffer;
    placement.window = window;
    placement.anchor = anchor;
    placement.with_virtual_padding = true;
    placement.inline_image = true;

    auto image = backend_.from_file(file_path, placement);
    if (!image) {
        diagram_log::logger()->warn("image_create_failed path={} buffer={}", file_path, buffer);
        return nullptr;
    }
    ++live_;
    return image;
}

void ImageLifecycle::dispose(const std::shared_ptr<diagram_model::ImageHandle>& image) {
    if (!image) return;
    image->clear();
    if (live_ > 0) --live_;
}

} // namespace diagram_registry
