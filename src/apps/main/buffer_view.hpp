#pragma once

#include "gl_image_backend.hpp"
#include "viewer_host.hpp"

namespace viewer {

// Draws the current buffer as monospace-ish text rows. Visible images are
// painted below their anchor row and push the following rows down
// (virtual padding).
class BufferView {
public:
    void draw(const ViewerHost& host, GlImageBackend& images, float region_width, float region_height);

private:
    float scroll_y_ = 0.0f;
    float max_image_width_ = 900.0f;
};

} // namespace viewer
