#pragma once

#include "model/Track.hpp"
#include "util/Debouncer.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace cadenza::backend {

struct ScopeSelection {
    model::PlaybackScope scope;
    std::string current_key;  // Canonical key of the last selected track, may be empty

    bool operator==(const ScopeSelection&) const = default;
};

// Persists the active scope selector and the current-track pointer:
// {"kind":"queue"|"playlist","playlistID":"...","currentKey":"..."}
// Writes are debounced; flush() forces them.
class SessionStore {
public:
    using AlertSink = std::function<void(const model::Alert&)>;

    SessionStore(std::filesystem::path file,
                 std::chrono::milliseconds save_debounce = std::chrono::milliseconds(500),
                 AlertSink alert_sink = nullptr);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Missing or corrupt documents yield the default (queue scope, no track)
    ScopeSelection load();

    void save_scope(const model::PlaybackScope& scope);
    void save_current_key(const std::string& key);

    ScopeSelection selection() const;
    bool flush();

private:
    bool save_now();

    std::filesystem::path file_;
    AlertSink alert_sink_;

    mutable std::mutex mutex_;
    ScopeSelection selection_;

    std::mutex io_mutex_;
    bool last_save_ok_ = true;

    std::unique_ptr<util::Debouncer> save_debouncer_;
};

}  // namespace cadenza::backend
