#include "gl_image_backend.hpp"
#include <diagram_log/log.hpp>
#include <SDL3/SDL_opengl.h>
#include <algorithm>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace viewer {

GlImage::GlImage(unsigned int texture, int width, int height, const diagram_registry::ImagePlacement& placement)
    : texture_(texture)
    , width_(width)
    , height_(height)
    , placement_(placement)
{
}

GlImage::~GlImage() {
    clear();
}

void GlImage::render() {
    if (texture_ != 0) visible_ = true;
}

void GlImage::clear() {
    visible_ = false;
    if (texture_ != 0) {
        GLuint id = texture_;
        glDeleteTextures(1, &id);
        texture_ = 0;
    }
}

std::shared_ptr<diagram_model::ImageHandle> GlImageBackend::from_file(const std::string& path,
    const diagram_registry::ImagePlacement& placement)
{
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!pixels) {
        diagram_log::logger()->error("image_decode_failed path={} reason={}", path, stbi_failure_reason());
        return nullptr;
    }

    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, pixels);
    stbi_image_free(pixels);

    auto image = std::make_shared<GlImage>(texture, width, height, placement);
    images_.push_back(image);
    diagram_log::logger()->debug("image_loaded path={} size={}x{} row={} col={}",
        path, width, height, placement.anchor.row, placement.anchor.col);
    return image;
}

std::vector<std::shared_ptr<GlImage>> GlImageBackend::visible_images(diagram_model::BufferId buffer,
    diagram_model::WindowId window)
{
    std::vector<std::shared_ptr<GlImage>> out;
    images_.erase(std::remove_if(images_.begin(), images_.end(),
        [](const std::weak_ptr<GlImage>& w) { return w.expired(); }), images_.end());
    for (const auto& weak : images_) {
        auto image = weak.lock();
        if (!image || !image->visible()) continue;
        if (image->placement().buffer != buffer || image->placement().window != window) continue;
        out.push_back(std::move(image));
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a->placement().anchor.row < b->placement().anchor.row;
    });
    return out;
}

} // namespace viewer
