#pragma once

#include <diagram_session/host.hpp>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace viewer {

struct TextBuffer {
    diagram_model::BufferId id = 0;
    std::filesystem::path path;
    std::string filetype;
    std::vector<std::string> lines;
    int cursor_row = 0;
    int cursor_col = 0;
};

enum class Mode { Normal, Insert };

// Read-only multi-buffer editor model behind the viewer window.
class ViewerHost : public diagram_session::Host {
public:
    ViewerHost();

    // Loads a file as a new buffer, makes it current and fires FileType.
    std::optional<diagram_model::BufferId> open_file(const std::filesystem::path& path);
    void next_buffer();

    void move_cursor(int d_row, int d_col);
    void set_mode(Mode mode);
    Mode mode() const { return mode_; }

    // Runs a user command by name. Returns false if no such command exists.
    bool run_command(const std::string& name);
    // Fires `event` for autocommands attached to `buffer`.
    void fire_event(const std::string& event, diagram_model::BufferId buffer);

    const TextBuffer* buffer(diagram_model::BufferId id) const;
    const TextBuffer* current() const;
    const std::string& last_message() const { return last_message_; }

    // diagram_model::BufferSource
    std::string filetype(diagram_model::BufferId buffer) const override;
    std::vector<std::string> lines(diagram_model::BufferId buffer) const override;

    // diagram_session::Host
    diagram_model::BufferId current_buffer() const override { return current_; }
    diagram_model::WindowId current_window() const override { return window_id; }
    void notify(const std::string& message, diagram_session::NotifyLevel level) override;
    void create_user_command(const std::string& group, const std::string& name,
        const std::string& description, Callback callback) override;
    void create_buffer_autocmd(const std::string& group, const std::vector<std::string>& events,
        diagram_model::BufferId buffer, Callback callback) override;
    void create_filetype_autocmd(const std::string& group, const std::vector<std::string>& filetypes,
        BufferCallback callback) override;
    void clear_group(const std::string& group) override;

    static constexpr diagram_model::WindowId window_id = 1000;

private:
    struct UserCommand {
        std::string group;
        std::string description;
        Callback callback;
    };
    struct BufferAutocmd {
        std::string group;
        std::vector<std::string> events;
        diagram_model::BufferId buffer = 0;
        Callback callback;
    };
    struct FiletypeAutocmd {
        std::string group;
        std::vector<std::string> filetypes;
        BufferCallback callback;
    };

    TextBuffer* mutable_current();

    std::map<diagram_model::BufferId, TextBuffer> buffers_;
    diagram_model::BufferId current_ = 0;
    diagram_model::BufferId next_id_ = 1;
    Mode mode_ = Mode::Normal;
    std::map<std::string, UserCommand> commands_;
    std::vector<BufferAutocmd> buffer_autocmds_;
    std::vector<FiletypeAutocmd> filetype_autocmds_;
    std::string last_message_;
};

// Filetype from the file extension (".md" -> "markdown", ".norg" -> "norg").
std::string filetype_for_path(const std::filesystem::path& path);

} // namespace viewer
