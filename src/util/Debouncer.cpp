#include "util/Debouncer.hpp"
#include "util/Logger.hpp"

namespace cadenza::util {

Debouncer::Debouncer(std::chrono::milliseconds delay, Task task)
    : task_(std::move(task)),
      delay_(delay),
      worker_([this](std::stop_token st) { worker_loop(st); }) {}

Debouncer::~Debouncer() {
    worker_.request_stop();
    cv_.notify_all();
    // jthread joins on destruction; pending work is the owner's to flush
}

void Debouncer::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = std::chrono::steady_clock::now() + delay_;
    }
    cv_.notify_all();
}

bool Debouncer::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !running_; });
    if (!deadline_) {
        return false;
    }
    deadline_.reset();
    running_ = true;
    lock.unlock();

    task_();

    lock.lock();
    running_ = false;
    lock.unlock();
    cv_.notify_all();
    return true;
}

void Debouncer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
    }
    cv_.notify_all();
}

bool Debouncer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value();
}

void Debouncer::worker_loop(std::stop_token stop_token) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_token.stop_requested()) {
        if (!deadline_ || running_) {
            cv_.wait(lock, stop_token, [this]() { return deadline_.has_value() && !running_; });
            continue;
        }

        auto deadline = *deadline_;
        bool rescheduled = cv_.wait_until(lock, stop_token, deadline, [this, deadline]() {
            return !deadline_ || *deadline_ != deadline || running_;
        });
        if (rescheduled || stop_token.stop_requested()) {
            continue;
        }

        deadline_.reset();
        running_ = true;
        lock.unlock();

        task_();

        lock.lock();
        running_ = false;
        cv_.notify_all();
    }

    Logger::debug("Debouncer: Worker stopped");
}

} // namespace cadenza::util
