#pragma once

#include "model/Track.hpp"
#include "util/Debouncer.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadenza::backend {

// Five discrete levels, shown as colored dots in weight editors.
enum class WeightLevel {
    Green = 0,   // default, never stored
    Blue = 1,
    Purple = 2,
    Gold = 3,
    Red = 4,
};

WeightLevel clamp_level(int raw);
double level_multiplier(WeightLevel level);

/**
 * Persistent per-track selection weights.
 *
 * Levels are stored sparsely per namespace: one map for the queue and one per
 * playlist, keyed by canonical path key. Absence means WeightLevel::Green.
 * Entries written under a legacy key format are found through
 * util::PathKey::lookup_keys() and rewritten to the canonical key on first read.
 *
 * Thread-safe. Persistence is debounced on a worker thread; flush() forces it.
 *
 * File: {"version":1,"queueLevels":{key:level},"playlistLevels":{id:{key:level}}}
 */
class WeightStore {
public:
    using LevelMap = std::unordered_map<std::string, int>;
    using AlertSink = std::function<void(const model::Alert&)>;

    // Returned by every mutation; `changed` means cached shuffles are stale
    struct Change {
        bool changed = false;
        uint64_t revision = 0;
    };

    struct SyncResult {
        size_t total = 0;    // overrides present in the playlist
        size_t changed = 0;  // queue entries actually rewritten
    };

    struct LookupHit {
        int level = 0;
        std::string matched_key;
    };

    static constexpr int FORMAT_VERSION = 1;

    WeightStore(std::filesystem::path file,
                std::chrono::milliseconds save_debounce = std::chrono::milliseconds(500),
                AlertSink alert_sink = nullptr);
    ~WeightStore();

    WeightStore(const WeightStore&) = delete;
    WeightStore& operator=(const WeightStore&) = delete;

    // Replaces in-memory state with the file contents. Missing, corrupt or
    // foreign-version files leave the store empty and return false.
    bool load();

    // `path` may be a raw path or an already derived key
    WeightLevel level(const std::string& path, const model::PlaybackScope& scope);
    double multiplier(const std::string& path, const model::PlaybackScope& scope);

    Change set_level(int raw_level, const std::string& path, const model::PlaybackScope& scope);
    Change set_level(WeightLevel level, const std::string& path, const model::PlaybackScope& scope);

    // Bulk deletions write through immediately instead of waiting for the debounce
    Change clear(const model::PlaybackScope& scope);
    Change clear_all();
    Change remove_track(const std::string& path, const std::string& playlist_id);
    Change remove_playlist(const std::string& playlist_id);

    // Copies non-default playlist levels into the queue namespace. Queue
    // entries the playlist leaves at default are not touched.
    SyncResult sync_overrides_to_queue(const std::string& playlist_id);

    uint64_t revision() const;
    size_t entry_count(const model::PlaybackScope& scope) const;
    bool has_entry(const std::string& path, const model::PlaybackScope& scope) const;
    LevelMap overrides(const model::PlaybackScope& scope) const;

    // Writes pending changes now. True if the store is clean on disk afterwards.
    bool flush();

    // Two-phase lookup: canonical key, then each legacy variant in order
    static std::optional<LookupHit> find_level(const LevelMap& map, const std::vector<std::string>& lookup_keys);
    // Moves a legacy hit to the canonical key. Returns true if the map changed.
    static bool migrate_entry(LevelMap& map, const LookupHit& hit, const std::string& canonical_key);

private:
    LevelMap* map_for(const model::PlaybackScope& scope, bool create);
    const LevelMap* map_for(const model::PlaybackScope& scope) const;
    static bool remove_key_variants(LevelMap& map, const std::string& path);
    static LevelMap normalize_level_map(const LevelMap& raw);

    Change bump_locked();
    bool save_now();
    void report_failure(const std::string& detail);

    std::filesystem::path file_;
    AlertSink alert_sink_;

    mutable std::mutex mutex_;
    LevelMap queue_levels_;
    std::unordered_map<std::string, LevelMap> playlist_levels_;  // playlist id -> levels
    uint64_t revision_ = 0;

    std::mutex io_mutex_;
    bool last_save_ok_ = true;

    // Destroyed first: joins the worker before the maps go away
    std::unique_ptr<util::Debouncer> save_debouncer_;
};

}  // namespace cadenza::backend
