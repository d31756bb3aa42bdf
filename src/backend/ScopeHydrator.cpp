#include "backend/ScopeHydrator.hpp"
#include "util/Logger.hpp"

namespace cadenza::backend {

using util::Logger;

ScopeHydrator::ScopeHydrator(PlaylistSource& source)
    : source_(source) {}

ScopeHydrator::~ScopeHydrator() {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        pending_ = false;
        retire_current_locked();
        jobs = std::move(retired_);
    }
    // jthread destructors request stop and join outside the lock
    jobs.clear();
}

uint64_t ScopeHydrator::start(const std::string& playlist_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    retire_current_locked();

    const uint64_t generation = ++generation_;
    pending_ = true;
    result_.reset();

    auto done = std::make_shared<std::atomic<bool>>(false);
    current_ = Job{
        std::jthread([this, generation, playlist_id, done](std::stop_token st) {
            run(st, generation, playlist_id);
            done->store(true);
        }),
        done,
    };

    Logger::info("ScopeHydrator: Resolving playlist " + playlist_id + " (request " + std::to_string(generation) + ")");
    return generation;
}

void ScopeHydrator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_ && !result_) {
        return;
    }
    ++generation_;
    pending_ = false;
    result_.reset();
    retire_current_locked();
    cv_.notify_all();
    Logger::info("ScopeHydrator: Pending playlist resolution cancelled");
}

std::optional<HydrationResult> ScopeHydrator::take_result() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!result_ || result_->generation != generation_) {
        return std::nullopt;
    }
    auto result = std::move(result_);
    result_.reset();
    return result;
}

bool ScopeHydrator::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!pending_ && !result_) {
        return false;
    }
    return cv_.wait_for(lock, timeout, [this]() { return !pending_; }) && result_.has_value();
}

bool ScopeHydrator::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

uint64_t ScopeHydrator::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

void ScopeHydrator::run(std::stop_token stop_token, uint64_t generation, std::string playlist_id) {
    auto members = source_.members_in_order(playlist_id);

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_token.stop_requested() || generation != generation_) {
        Logger::debug("ScopeHydrator: Discarding superseded result for " + playlist_id);
        return;
    }
    result_ = HydrationResult{generation, std::move(playlist_id), std::move(members)};
    pending_ = false;
    cv_.notify_all();
}

void ScopeHydrator::retire_current_locked() {
    if (!current_) {
        return;
    }
    current_->thread.request_stop();
    retired_.push_back(std::move(*current_));
    current_.reset();
}

void ScopeHydrator::reap_finished_locked() {
    std::erase_if(retired_, [](const Job& job) { return job.done->load(); });
}

}  // namespace cadenza::backend
