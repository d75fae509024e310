#include <diagram_log/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <mutex>

namespace diagram_log {

namespace {

const char* const logger_name = "inline_diagrams";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> shared_logger;

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> make_file_logger(const std::filesystem::path& log_file) {
    try {
        if (log_file.has_parent_path()) {
            std::filesystem::create_directories(log_file.parent_path());
        }
        spdlog::drop(logger_name);
        auto created = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        created->set_level(spdlog::level::debug);
        created->flush_on(spdlog::level::info);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        created->info("Logger initialized. file={}", log_file.string());
        return created;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (shared_logger) return shared_logger;
    shared_logger = make_file_logger(find_project_root() / "logs" / "inline_diagrams_latest.log");
    return shared_logger;
}

void use_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    shared_logger = make_file_logger(path);
}

void use_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    shared_logger = replacement ? std::move(replacement) : spdlog::default_logger();
}

} // namespace diagram_log
