#include "buffer_view.hpp"
#include "imgui.h"
#include <algorithm>
#include <cstdint>
#include <string>

namespace viewer {

namespace {

const float gutter_width = 48.0f;
const float image_gap = 4.0f;

} // namespace

void BufferView::draw(const ViewerHost& host, GlImageBackend& images, float region_width, float region_height) {
    const TextBuffer* buffer = host.current();
    if (!buffer || region_width <= 0 || region_height <= 0) return;

    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    ImGuiIO& io = ImGui::GetIO();
    if (ImGui::IsWindowHovered() && io.MouseWheel != 0.0f) {
        scroll_y_ -= io.MouseWheel * ImGui::GetTextLineHeightWithSpacing() * 3.0f;
        scroll_y_ = std::max(0.0f, scroll_y_);
    }

    const unsigned int text_color = IM_COL32(220, 220, 220, 255);
    const unsigned int gutter_color = IM_COL32(110, 110, 120, 255);
    const unsigned int cursor_color = IM_COL32(90, 140, 230, 160);
    const unsigned int image_border = IM_COL32(70, 70, 75, 255);

    const float line_height = ImGui::GetTextLineHeightWithSpacing();
    const float char_width = ImGui::CalcTextSize("M").x;
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const auto visible = images.visible_images(buffer->id, ViewerHost::window_id);

    float y = origin.y - scroll_y_;
    std::size_t next_image = 0;
    for (int row = 0; row < static_cast<int>(buffer->lines.size()); ++row) {
        const float text_x = origin.x + gutter_width;
        if (y + line_height >= origin.y && y <= origin.y + region_height) {
            const std::string number = std::to_string(row + 1);
            dl->AddText(ImVec2(origin.x + 4.0f, y), gutter_color, number.c_str());
            if (row == buffer->cursor_row) {
                const float cx = text_x + char_width * static_cast<float>(buffer->cursor_col);
                dl->AddRectFilled(ImVec2(cx, y), ImVec2(cx + char_width, y + line_height), cursor_color);
            }
            dl->AddText(ImVec2(text_x, y), text_color, buffer->lines[row].c_str());
        }
        y += line_height;

        while (next_image < visible.size() && visible[next_image]->placement().anchor.row <= row) {
            const auto& image = visible[next_image++];
            float w = static_cast<float>(image->width());
            float h = static_cast<float>(image->height());
            const float max_w = std::min(max_image_width_, region_width - gutter_width - 8.0f);
            if (w > max_w && w > 0.0f) {
                h *= max_w / w;
                w = max_w;
            }
            const float x = text_x + char_width * static_cast<float>(image->placement().anchor.col);
            const ImVec2 p_min(x, y + image_gap);
            const ImVec2 p_max(x + w, y + image_gap + h);
            dl->AddImage((ImTextureID)(intptr_t)image->texture(), p_min, p_max);
            dl->AddRect(p_min, p_max, image_border);
            if (image->placement().with_virtual_padding) {
                y += h + 2.0f * image_gap;
            }
        }
    }
}

} // namespace viewer
