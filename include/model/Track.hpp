#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace cadenza::model {

enum class PlaybackMode {
    Sequential,
    Random,
};

// Record owned by the physical collection. Selection never modifies it.
struct Track {
    std::string path;
    std::string title;
    std::string artist;
    std::string album;
    int duration_ms = 0;

    bool operator==(const Track&) const = default;
};

// Which logical collection navigation operates on. Also names the weight
// namespace: queue levels and each playlist's levels are isolated.
struct PlaybackScope {
    enum class Kind { Queue, Playlist };

    Kind kind = Kind::Queue;
    std::string playlist_id;  // Empty for Kind::Queue

    static PlaybackScope queue() { return {}; }
    static PlaybackScope playlist(std::string id) { return {Kind::Playlist, std::move(id)}; }

    bool is_queue() const { return kind == Kind::Queue; }
    bool is_playlist() const { return kind == Kind::Playlist; }

    std::string describe() const { return is_queue() ? "queue" : "playlist:" + playlist_id; }

    bool operator==(const PlaybackScope&) const = default;
};

// Advisory event surfaced to the UI layer (persistence failures)
struct Alert {
    std::string level;  // "info", "warn", "crit"
    std::string message;
    std::string detail;
    std::chrono::steady_clock::time_point timestamp;

    bool operator==(const Alert&) const = default;
};

}  // namespace cadenza::model
