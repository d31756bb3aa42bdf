#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace cadenza::util {

// Coalesces bursts of trigger() calls into a single run of the task, executed
// on a dedicated worker thread once `delay` has passed without a new trigger.
// flush() runs a pending task immediately on the calling thread.
class Debouncer {
public:
    using Task = std::function<void()>;

    Debouncer(std::chrono::milliseconds delay, Task task);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void trigger();

    // Waits for an in-flight run, then runs the pending one (if any).
    // Returns true if a pending run was executed.
    bool flush();

    void cancel();

    [[nodiscard]] bool pending() const;

private:
    void worker_loop(std::stop_token stop_token);

    Task task_;
    std::chrono::milliseconds delay_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool running_ = false;

    // Declared last so the worker starts after everything above exists
    std::jthread worker_;
};

} // namespace cadenza::util
