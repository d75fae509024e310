#pragma once

#include <diagram_model/types.hpp>
#include <filesystem>
#include <string>

namespace diagram_renderers {

// Stable name for a render of `source` with `options` by `renderer_id`.
std::string cache_key(const std::string& renderer_id, const std::string& source,
    const diagram_model::RendererOptions& options);

// Creates the parent directory as needed. Returns false on any I/O error.
bool write_text_file(const std::filesystem::path& path, const std::string& text);

bool is_readable_file(const std::filesystem::path& path);

} // namespace diagram_renderers
