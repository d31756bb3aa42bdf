#pragma once

#include "backend/PlaylistSource.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cadenza::backend {

struct HydrationResult {
    uint64_t generation = 0;
    std::string playlist_id;
    std::optional<std::vector<std::string>> members;  // nullopt: playlist does not exist
};

// Resolves a playlist's members on a background thread. Each start()
// supersedes the previous request: the older job is asked to stop and its
// result is discarded, never handed to the owner.
// PlaylistSource::members_in_order must be safe to call from a worker thread.
class ScopeHydrator {
public:
    explicit ScopeHydrator(PlaylistSource& source);
    ~ScopeHydrator();

    ScopeHydrator(const ScopeHydrator&) = delete;
    ScopeHydrator& operator=(const ScopeHydrator&) = delete;

    uint64_t start(const std::string& playlist_id);
    void cancel();

    // Result of the latest request, once; std::nullopt while pending or after cancel()
    std::optional<HydrationResult> take_result();

    // Blocks until the latest request finished. False on timeout or if nothing is pending.
    bool wait(std::chrono::milliseconds timeout);

    bool busy() const;
    uint64_t generation() const;

private:
    struct Job {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run(std::stop_token stop_token, uint64_t generation, std::string playlist_id);
    void retire_current_locked();
    void reap_finished_locked();

    PlaylistSource& source_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_ = 0;
    bool pending_ = false;
    std::optional<HydrationResult> result_;

    std::optional<Job> current_;
    std::vector<Job> retired_;  // superseded jobs still finishing their I/O
};

}  // namespace cadenza::backend
