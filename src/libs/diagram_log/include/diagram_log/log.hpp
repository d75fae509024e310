#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>

namespace diagram_log {

// Shared logger for every library. Created on first use; writes to
// <project root>/logs/inline_diagrams_latest.log, or to spdlog's default
// logger if the file sink cannot be opened.
std::shared_ptr<spdlog::logger> logger();

// Replaces the shared logger's destination. Used by the app to honour a
// user supplied log path and by tests to keep the tree clean.
void use_log_file(const std::filesystem::path& path);
void use_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace diagram_log
