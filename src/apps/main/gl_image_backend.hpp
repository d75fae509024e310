#pragma once

#include <diagram_registry/image_lifecycle.hpp>
#include <memory>
#include <string>
#include <vector>

namespace viewer {

// Decoded image uploaded to a GL texture. Only painted after render().
class GlImage : public diagram_model::ImageHandle {
public:
    GlImage(unsigned int texture, int width, int height, const diagram_registry::ImagePlacement& placement);
    ~GlImage() override;

    GlImage(const GlImage&) = delete;
    GlImage& operator=(const GlImage&) = delete;

    void render() override;
    void clear() override;

    bool visible() const { return visible_; }
    unsigned int texture() const { return texture_; }
    int width() const { return width_; }
    int height() const { return height_; }
    const diagram_registry::ImagePlacement& placement() const { return placement_; }

private:
    unsigned int texture_ = 0;
    int width_ = 0;
    int height_ = 0;
    diagram_registry::ImagePlacement placement_;
    bool visible_ = false;
};

// Requires a current GL context on the calling thread.
class GlImageBackend : public diagram_registry::ImageBackend {
public:
    std::shared_ptr<diagram_model::ImageHandle> from_file(const std::string& path,
        const diagram_registry::ImagePlacement& placement) override;

    // Visible images of `buffer` shown in `window`, sorted by anchor row.
    std::vector<std::shared_ptr<GlImage>> visible_images(diagram_model::BufferId buffer,
        diagram_model::WindowId window);

private:
    std::vector<std::weak_ptr<GlImage>> images_;
};

} // namespace viewer
