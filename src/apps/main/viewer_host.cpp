#include "viewer_host.hpp"
#include <diagram_log/log.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace viewer {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

std::string filetype_for_path(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (ext == ".md" || ext == ".markdown") return "markdown";
    if (ext == ".norg") return "norg";
    if (ext == ".txt") return "text";
    return ext.empty() ? std::string() : ext.substr(1);
}

ViewerHost::ViewerHost() = default;

std::optional<diagram_model::BufferId> ViewerHost::open_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) {
        notify("Cannot open " + path.string(), diagram_session::NotifyLevel::Error);
        return std::nullopt;
    }

    TextBuffer b;
    b.id = next_id_++;
    b.path = path;
    b.filetype = filetype_for_path(path);
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        b.lines.push_back(std::move(line));
    }
    if (b.lines.empty()) b.lines.emplace_back();

    const diagram_model::BufferId id = b.id;
    const std::string filetype = b.filetype;
    buffers_.emplace(id, std::move(b));
    current_ = id;

    // Copy: a FileType callback may register further autocommands.
    const auto hooks = filetype_autocmds_;
    for (const auto& hook : hooks) {
        if (contains(hook.filetypes, filetype)) hook.callback(id);
    }
    fire_event("BufEnter", id);
    return id;
}

void ViewerHost::next_buffer() {
    if (buffers_.empty()) return;
    auto it = buffers_.upper_bound(current_);
    if (it == buffers_.end()) it = buffers_.begin();
    current_ = it->first;
    fire_event("BufEnter", current_);
}

TextBuffer* ViewerHost::mutable_current() {
    auto it = buffers_.find(current_);
    return it == buffers_.end() ? nullptr : &it->second;
}

const TextBuffer* ViewerHost::current() const {
    return buffer(current_);
}

const TextBuffer* ViewerHost::buffer(diagram_model::BufferId id) const {
    auto it = buffers_.find(id);
    return it == buffers_.end() ? nullptr : &it->second;
}

void ViewerHost::move_cursor(int d_row, int d_col) {
    TextBuffer* b = mutable_current();
    if (!b) return;
    const int max_row = static_cast<int>(b->lines.size()) - 1;
    const int row = std::clamp(b->cursor_row + d_row, 0, std::max(0, max_row));
    const int max_col = static_cast<int>(b->lines[row].size());
    const int col = std::clamp(b->cursor_col + d_col, 0, max_col);
    if (row == b->cursor_row && col == b->cursor_col) return;
    b->cursor_row = row;
    b->cursor_col = col;
    fire_event("CursorMoved", b->id);
}

void ViewerHost::set_mode(Mode mode) {
    if (mode == mode_) return;
    mode_ = mode;
    fire_event(mode == Mode::Insert ? "InsertEnter" : "InsertLeave", current_);
}

bool ViewerHost::run_command(const std::string& name) {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        notify("Not an editor command: " + name, diagram_session::NotifyLevel::Error);
        return false;
    }
    // Copy: the command may replace itself (setup/teardown).
    const Callback callback = it->second.callback;
    callback();
    return true;
}

void ViewerHost::fire_event(const std::string& event, diagram_model::BufferId buffer) {
    const auto hooks = buffer_autocmds_;
    for (const auto& hook : hooks) {
        if (hook.buffer == buffer && contains(hook.events, event)) hook.callback();
    }
}

std::string ViewerHost::filetype(diagram_model::BufferId buffer) const {
    const TextBuffer* b = this->buffer(buffer);
    return b ? b->filetype : std::string();
}

std::vector<std::string> ViewerHost::lines(diagram_model::BufferId buffer) const {
    const TextBuffer* b = this->buffer(buffer);
    return b ? b->lines : std::vector<std::string>{};
}

void ViewerHost::notify(const std::string& message, diagram_session::NotifyLevel level) {
    last_message_ = message;
    auto log = diagram_log::logger();
    switch (level) {
    case diagram_session::NotifyLevel::Info: log->info("notify {}", message); break;
    case diagram_session::NotifyLevel::Warn: log->warn("notify {}", message); break;
    case diagram_session::NotifyLevel::Error: log->error("notify {}", message); break;
    }
}

void ViewerHost::create_user_command(const std::string& group, const std::string& name,
    const std::string& description, Callback callback)
{
    commands_[name] = UserCommand{group, description, std::move(callback)};
}

void ViewerHost::create_buffer_autocmd(const std::string& group, const std::vector<std::string>& events,
    diagram_model::BufferId buffer, Callback callback)
{
    buffer_autocmds_.push_back(BufferAutocmd{group, events, buffer, std::move(callback)});
}

void ViewerHost::create_filetype_autocmd(const std::string& group, const std::vector<std::string>& filetypes,
    BufferCallback callback)
{
    filetype_autocmds_.push_back(FiletypeAutocmd{group, filetypes, std::move(callback)});
}

void ViewerHost::clear_group(const std::string& group) {
    for (auto it = commands_.begin(); it != commands_.end();) {
        if (it->second.group == group) it = commands_.erase(it);
        else ++it;
    }
    buffer_autocmds_.erase(std::remove_if(buffer_autocmds_.begin(), buffer_autocmds_.end(),
        [&](const BufferAutocmd& a) { return a.group == group; }), buffer_autocmds_.end());
    filetype_autocmds_.erase(std::remove_if(filetype_autocmds_.begin(), filetype_autocmds_.end(),
        [&](const FiletypeAutocmd& a) { return a.group == group; }), filetype_autocmds_.end());
}

} // namespace viewer
