#pragma once

#include <diagram_model/integration.hpp>
#include <diagram_model/types.hpp>
#include <functional>
#include <string>
#include <vector>

namespace diagram_session {

enum class NotifyLevel { Info, Warn, Error };

// The editor environment: buffers, the active window, user commands and
// buffer events. Every callback registered here is invoked on the host's
// serialized context.
class Host : public diagram_model::BufferSource {
public:
    using Callback = std::function<void()>;
    using BufferCallback = std::function<void(diagram_model::BufferId)>;

    virtual diagram_model::BufferId current_buffer() const = 0;
    virtual diagram_model::WindowId current_window() const = 0;

    virtual void notify(const std::string& message, NotifyLevel level) = 0;

    virtual void create_user_command(const std::string& group, const std::string& name,
        const std::string& description, Callback callback) = 0;

    // `callback` runs whenever one of `events` fires in `buffer`.
    virtual void create_buffer_autocmd(const std::string& group, const std::vector<std::string>& events,
        diagram_model::BufferId buffer, Callback callback) = 0;

    // `callback` runs with the buffer whose filetype is set to one of `filetypes`.
    virtual void create_filetype_autocmd(const std::string& group, const std::vector<std::string>& filetypes,
        BufferCallback callback) = 0;

    // Removes every command and autocommand registered under `group`.
    virtual void clear_group(const std::string& group) = 0;
};

} // namespace diagram_session
