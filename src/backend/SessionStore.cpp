#include "backend/SessionStore.hpp"
#include "util/AtomicFile.hpp"
#include "util/Logger.hpp"
#include <nlohmann/json.hpp>

namespace cadenza::backend {

using json = nlohmann::json;
using util::Logger;

SessionStore::SessionStore(std::filesystem::path file, std::chrono::milliseconds save_debounce, AlertSink alert_sink)
    : file_(std::move(file)),
      alert_sink_(std::move(alert_sink)),
      save_debouncer_(std::make_unique<util::Debouncer>(save_debounce, [this]() { save_now(); })) {}

SessionStore::~SessionStore() {
    flush();
}

ScopeSelection SessionStore::load() {
    ScopeSelection loaded;

    auto contents = util::read_file(file_);
    if (!contents) {
        Logger::info("SessionStore: No session file, starting in queue scope");
    } else {
        json doc = json::parse(*contents, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            Logger::warn("SessionStore: Corrupt session file " + file_.string() + ", using defaults");
        } else {
            auto kind = doc.find("kind");
            auto playlist_id = doc.find("playlistID");
            if (kind != doc.end() && kind->is_string() && kind->get<std::string>() == "playlist") {
                if (playlist_id != doc.end() && playlist_id->is_string() && !playlist_id->get<std::string>().empty()) {
                    loaded.scope = model::PlaybackScope::playlist(playlist_id->get<std::string>());
                } else {
                    Logger::warn("SessionStore: Playlist scope without playlistID, using queue scope");
                }
            }
            auto current = doc.find("currentKey");
            if (current != doc.end() && current->is_string()) {
                loaded.current_key = current->get<std::string>();
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    selection_ = loaded;
    return loaded;
}

void SessionStore::save_scope(const model::PlaybackScope& scope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (selection_.scope == scope) return;
        selection_.scope = scope;
    }
    save_debouncer_->trigger();
}

void SessionStore::save_current_key(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (selection_.current_key == key) return;
        selection_.current_key = key;
    }
    save_debouncer_->trigger();
}

ScopeSelection SessionStore::selection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selection_;
}

bool SessionStore::flush() {
    save_debouncer_->flush();
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    return last_save_ok_;
}

bool SessionStore::save_now() {
    std::lock_guard<std::mutex> io_lock(io_mutex_);

    json doc = json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (selection_.scope.is_playlist()) {
            doc["kind"] = "playlist";
            doc["playlistID"] = selection_.scope.playlist_id;
        } else {
            doc["kind"] = "queue";
        }
        if (!selection_.current_key.empty()) {
            doc["currentKey"] = selection_.current_key;
        }
    }

    std::string error;
    std::string contents;
    try {
        contents = doc.dump(2);
    } catch (const json::exception& e) {
        error = e.what();
    }

    if (error.empty() && util::write_file_atomically(file_, contents, error)) {
        last_save_ok_ = true;
        return true;
    }

    last_save_ok_ = false;
    Logger::error("SessionStore: Failed to save playback session: " + error);
    if (alert_sink_) {
        alert_sink_({"warn", "Failed to save playback position",
                     "Check disk permissions or free space (" + error + ")",
                     std::chrono::steady_clock::now()});
    }
    return false;
}

}  // namespace cadenza::backend
