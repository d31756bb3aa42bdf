#include "backend/WeightStore.hpp"
#include "util/AtomicFile.hpp"
#include "util/Logger.hpp"
#include "util/PathKey.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace cadenza::backend {

using json = nlohmann::json;
using util::Logger;
using util::PathKey;

namespace {

constexpr std::array<double, 5> LEVEL_MULTIPLIERS = {1.0, 1.6, 3.2, 4.8, 6.4};

int clamp_raw(int raw) {
    return std::clamp(raw, 0, 4);
}

// Reads one {key: level} object. Returns false if anything had to be skipped.
bool parse_level_object(const json& node, WeightStore::LevelMap& out) {
    if (!node.is_object()) {
        return false;
    }
    bool clean = true;
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it.value().is_number_integer()) {
            clean = false;
            continue;
        }
        const auto& value = it.value();
        // Clamp in 64-bit before narrowing; huge unsigned values land on the top level
        int64_t raw = value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)
                          ? INT64_MAX
                          : value.get<int64_t>();
        if (raw < 0 || raw > 4) {
            clean = false;
        }
        out[it.key()] = static_cast<int>(std::clamp<int64_t>(raw, 0, 4));
    }
    return clean;
}

}  // namespace

WeightLevel clamp_level(int raw) {
    return static_cast<WeightLevel>(clamp_raw(raw));
}

double level_multiplier(WeightLevel level) {
    return LEVEL_MULTIPLIERS[static_cast<size_t>(clamp_raw(static_cast<int>(level)))];
}

WeightStore::WeightStore(std::filesystem::path file, std::chrono::milliseconds save_debounce, AlertSink alert_sink)
    : file_(std::move(file)),
      alert_sink_(std::move(alert_sink)),
      save_debouncer_(std::make_unique<util::Debouncer>(save_debounce, [this]() { save_now(); })) {}

WeightStore::~WeightStore() {
    flush();
}

bool WeightStore::load() {
    auto contents = util::read_file(file_);
    if (!contents) {
        Logger::info("WeightStore: No weight file at " + file_.string() + ", using defaults");
        return false;
    }

    json doc = json::parse(*contents, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        Logger::warn("WeightStore: Corrupt weight file " + file_.string() + ", using defaults");
        return false;
    }

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer() || version->get<int>() != FORMAT_VERSION) {
        Logger::warn("WeightStore: Unsupported weight file version, using defaults");
        return false;
    }

    bool clean = true;
    LevelMap raw_queue;
    if (auto node = doc.find("queueLevels"); node != doc.end()) {
        clean &= parse_level_object(*node, raw_queue);
    }

    std::unordered_map<std::string, LevelMap> raw_playlists;
    if (auto node = doc.find("playlistLevels"); node != doc.end()) {
        if (node->is_object()) {
            for (auto it = node->begin(); it != node->end(); ++it) {
                LevelMap levels;
                clean &= parse_level_object(it.value(), levels);
                raw_playlists[it.key()] = std::move(levels);
            }
        } else {
            clean = false;
        }
    }

    LevelMap queue = normalize_level_map(raw_queue);
    if (queue != raw_queue) clean = false;

    std::unordered_map<std::string, LevelMap> playlists;
    for (const auto& [pid, levels] : raw_playlists) {
        LevelMap normalized = normalize_level_map(levels);
        if (normalized != levels) clean = false;
        if (!normalized.empty()) {
            playlists[pid] = std::move(normalized);
        } else {
            clean = false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_levels_ = std::move(queue);
        playlist_levels_ = std::move(playlists);
        Logger::info("WeightStore: Loaded " + std::to_string(queue_levels_.size()) + " queue overrides, " +
                     std::to_string(playlist_levels_.size()) + " playlist namespaces");
    }

    if (!clean) {
        Logger::info("WeightStore: Weight file normalized, scheduling rewrite");
        save_debouncer_->trigger();
    }
    return true;
}

WeightLevel WeightStore::level(const std::string& path, const model::PlaybackScope& scope) {
    auto lookup_keys = PathKey::lookup_keys(path);
    const std::string& canonical_key = lookup_keys.front();

    std::lock_guard<std::mutex> lock(mutex_);
    LevelMap* map = map_for(scope, false);
    if (!map) {
        return WeightLevel::Green;
    }

    auto hit = find_level(*map, lookup_keys);
    if (!hit) {
        return WeightLevel::Green;
    }

    if (migrate_entry(*map, *hit, canonical_key)) {
        // Same effective level, so no revision bump; only the file changes
        Logger::debug("WeightStore: Migrated legacy key to " + canonical_key);
        save_debouncer_->trigger();
    }
    return clamp_level(hit->level);
}

double WeightStore::multiplier(const std::string& path, const model::PlaybackScope& scope) {
    return level_multiplier(level(path, scope));
}

WeightStore::Change WeightStore::set_level(WeightLevel level, const std::string& path, const model::PlaybackScope& scope) {
    return set_level(static_cast<int>(level), path, scope);
}

WeightStore::Change WeightStore::set_level(int raw_level, const std::string& path, const model::PlaybackScope& scope) {
    const std::string key = PathKey::canonical(path);
    const int clamped = clamp_raw(raw_level);

    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = false;

    if (clamped == 0) {
        if (LevelMap* map = map_for(scope, false)) {
            changed = remove_key_variants(*map, key);
            if (scope.is_playlist() && map->empty()) {
                playlist_levels_.erase(scope.playlist_id);
            }
        }
    } else {
        LevelMap& map = *map_for(scope, true);
        auto it = map.find(key);
        if (it == map.end() || it->second != clamped) {
            // Drop legacy spellings first so the canonical entry is the only one
            remove_key_variants(map, key);
            map[key] = clamped;
            changed = true;
        }
    }

    if (!changed) {
        return {false, revision_};
    }
    Logger::debug("WeightStore: " + scope.describe() + " " + key + " -> level " + std::to_string(clamped));
    return bump_locked();
}

WeightStore::Change WeightStore::clear(const model::PlaybackScope& scope) {
    Change change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool changed = false;
        if (scope.is_queue()) {
            changed = !queue_levels_.empty();
            queue_levels_.clear();
        } else {
            changed = playlist_levels_.erase(scope.playlist_id) > 0;
        }
        if (!changed) {
            return {false, revision_};
        }
        Logger::info("WeightStore: Cleared " + scope.describe());
        change = bump_locked();
    }
    flush();
    return change;
}

WeightStore::Change WeightStore::clear_all() {
    Change change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_levels_.empty() && playlist_levels_.empty()) {
            return {false, revision_};
        }
        queue_levels_.clear();
        playlist_levels_.clear();
        Logger::info("WeightStore: Cleared all namespaces");
        change = bump_locked();
    }
    flush();
    return change;
}

WeightStore::Change WeightStore::remove_track(const std::string& path, const std::string& playlist_id) {
    Change change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = playlist_levels_.find(playlist_id);
        if (it == playlist_levels_.end() || !remove_key_variants(it->second, path)) {
            return {false, revision_};
        }
        if (it->second.empty()) {
            playlist_levels_.erase(it);
        }
        change = bump_locked();
    }
    flush();
    return change;
}

WeightStore::Change WeightStore::remove_playlist(const std::string& playlist_id) {
    Change change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (playlist_levels_.erase(playlist_id) == 0) {
            return {false, revision_};
        }
        Logger::info("WeightStore: Removed playlist namespace " + playlist_id);
        change = bump_locked();
    }
    flush();
    return change;
}

WeightStore::SyncResult WeightStore::sync_overrides_to_queue(const std::string& playlist_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto source = playlist_levels_.find(playlist_id);
    if (source == playlist_levels_.end() || source->second.empty()) {
        return {};
    }

    SyncResult result;
    result.total = source->second.size();
    for (const auto& [key, raw] : source->second) {
        int clamped = clamp_raw(raw);
        if (clamped == 0) continue;

        auto it = queue_levels_.find(key);
        if (it != queue_levels_.end() && it->second == clamped) continue;

        remove_key_variants(queue_levels_, key);
        queue_levels_[key] = clamped;
        result.changed++;
    }

    Logger::info("WeightStore: Synced playlist " + playlist_id + " to queue (" + std::to_string(result.changed) +
                 " of " + std::to_string(result.total) + " changed)");
    if (result.changed > 0) {
        bump_locked();
    }
    return result;
}

uint64_t WeightStore::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

size_t WeightStore::entry_count(const model::PlaybackScope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const LevelMap* map = map_for(scope);
    return map ? map->size() : 0;
}

bool WeightStore::has_entry(const std::string& path, const model::PlaybackScope& scope) const {
    auto lookup_keys = PathKey::lookup_keys(path);
    std::lock_guard<std::mutex> lock(mutex_);
    const LevelMap* map = map_for(scope);
    return map && find_level(*map, lookup_keys).has_value();
}

WeightStore::LevelMap WeightStore::overrides(const model::PlaybackScope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const LevelMap* map = map_for(scope);
    return map ? *map : LevelMap{};
}

bool WeightStore::flush() {
    save_debouncer_->flush();
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    return last_save_ok_;
}

std::optional<WeightStore::LookupHit> WeightStore::find_level(const LevelMap& map, const std::vector<std::string>& lookup_keys) {
    for (const auto& key : lookup_keys) {
        auto it = map.find(key);
        if (it != map.end()) {
            return LookupHit{it->second, key};
        }
    }
    return std::nullopt;
}

bool WeightStore::migrate_entry(LevelMap& map, const LookupHit& hit, const std::string& canonical_key) {
    if (hit.matched_key == canonical_key) {
        return false;
    }
    map[canonical_key] = hit.level;
    map.erase(hit.matched_key);
    return true;
}

WeightStore::LevelMap* WeightStore::map_for(const model::PlaybackScope& scope, bool create) {
    if (scope.is_queue()) {
        return &queue_levels_;
    }
    auto it = playlist_levels_.find(scope.playlist_id);
    if (it != playlist_levels_.end()) {
        return &it->second;
    }
    return create ? &playlist_levels_[scope.playlist_id] : nullptr;
}

const WeightStore::LevelMap* WeightStore::map_for(const model::PlaybackScope& scope) const {
    if (scope.is_queue()) {
        return &queue_levels_;
    }
    auto it = playlist_levels_.find(scope.playlist_id);
    return it != playlist_levels_.end() ? &it->second : nullptr;
}

bool WeightStore::remove_key_variants(LevelMap& map, const std::string& path) {
    bool removed = false;
    for (const auto& key : PathKey::lookup_keys(path)) {
        removed |= map.erase(key) > 0;
    }
    return removed;
}

WeightStore::LevelMap WeightStore::normalize_level_map(const LevelMap& raw) {
    LevelMap normalized;
    normalized.reserve(raw.size());
    for (const auto& [path, level] : raw) {
        int clamped = clamp_raw(level);
        if (clamped != 0) {
            normalized[PathKey::canonical(path)] = clamped;
        }
    }
    return normalized;
}

WeightStore::Change WeightStore::bump_locked() {
    ++revision_;
    save_debouncer_->trigger();
    return {true, revision_};
}

bool WeightStore::save_now() {
    std::lock_guard<std::mutex> io_lock(io_mutex_);

    json doc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doc["version"] = FORMAT_VERSION;
        doc["queueLevels"] = json::object();
        for (const auto& [key, level] : queue_levels_) {
            doc["queueLevels"][key] = level;
        }
        doc["playlistLevels"] = json::object();
        for (const auto& [pid, levels] : playlist_levels_) {
            json entry = json::object();
            for (const auto& [key, level] : levels) {
                entry[key] = level;
            }
            doc["playlistLevels"][pid] = std::move(entry);
        }
    }

    std::string error;
    std::string contents;
    try {
        contents = doc.dump(2);
    } catch (const json::exception& e) {
        // Invalid UTF-8 in a key
        error = e.what();
    }

    if (error.empty() && util::write_file_atomically(file_, contents, error)) {
        last_save_ok_ = true;
        Logger::debug("WeightStore: Saved " + file_.string());
        return true;
    }

    last_save_ok_ = false;
    report_failure(error);
    return false;
}

void WeightStore::report_failure(const std::string& detail) {
    Logger::error("WeightStore: Failed to save playback weights: " + detail);
    if (alert_sink_) {
        alert_sink_({"warn", "Failed to save playback weights",
                     "Check disk permissions or free space (" + detail + ")",
                     std::chrono::steady_clock::now()});
    }
}

}  // namespace cadenza::backend
