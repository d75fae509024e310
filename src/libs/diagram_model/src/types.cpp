#include <diagram_model/types.hpp>

namespace diagram_model {

bool operator==(const Range& a, const Range& b) {
    return a.start_row == b.start_row && a.start_col == b.start_col
        && a.end_row == b.end_row && a.end_col == b.end_col;
}

bool operator!=(const Range& a, const Range& b) {
    return !(a == b);
}

bool RendererOptions::empty() const {
    return !background && !theme && !scale && !width && !height;
}

} // namespace diagram_model
