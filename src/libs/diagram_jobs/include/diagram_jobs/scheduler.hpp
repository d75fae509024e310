#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace diagram_jobs {

// Timers owned by the host. Callbacks run one at a time on the host's
// serialized context, never concurrently with other host callbacks.
class Scheduler {
public:
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    // First call after `delay`, then every `repeat` (a zero repeat fires once).
    // Returns nullopt when the timer cannot be created.
    virtual std::optional<TimerId> start_timer(std::chrono::milliseconds delay,
        std::chrono::milliseconds repeat, Callback callback) = 0;

    // Returns false if the timer was not active.
    virtual bool stop_timer(TimerId id) = 0;
    virtual bool is_active(TimerId id) const = 0;
};

} // namespace diagram_jobs
