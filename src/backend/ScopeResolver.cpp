#include "backend/ScopeResolver.hpp"
#include "backend/TrackCollection.hpp"
#include "backend/UnplayableTracker.hpp"
#include "util/Logger.hpp"
#include "util/PathKey.hpp"
#include <algorithm>
#include <unordered_set>

namespace cadenza::backend {

using util::Logger;
using util::PathKey;

ScopeResolver::ScopeResolver(SessionStore* session)
    : session_(session) {}

void ScopeResolver::set_scope_queue() {
    if (!scope_.is_queue()) {
        Logger::info("ScopeResolver: Switching to queue scope");
    }
    scope_ = model::PlaybackScope::queue();
    track_keys_.clear();
    position_by_key_.clear();
    if (session_) {
        session_->save_scope(scope_);
    }
}

void ScopeResolver::set_scope_playlist(const std::string& playlist_id, const std::vector<std::string>& ordered_member_paths) {
    Logger::info("ScopeResolver: Switching to playlist " + playlist_id + " (" +
                 std::to_string(ordered_member_paths.size()) + " members)");
    scope_ = model::PlaybackScope::playlist(playlist_id);
    assign_members(ordered_member_paths);
    if (session_) {
        session_->save_scope(scope_);
    }
}

std::optional<MemberDelta> ScopeResolver::update_scope_members_if_active(const std::string& playlist_id,
                                                                         const std::vector<std::string>& ordered_member_paths) {
    if (!is_playlist_active(playlist_id)) {
        return std::nullopt;
    }

    std::unordered_set<std::string> old_keys(track_keys_.begin(), track_keys_.end());
    assign_members(ordered_member_paths);
    std::unordered_set<std::string> new_keys(track_keys_.begin(), track_keys_.end());

    MemberDelta delta;
    for (const auto& key : track_keys_) {
        if (!old_keys.count(key)) delta.added.push_back(key);
    }
    for (const auto& key : old_keys) {
        if (!new_keys.count(key)) delta.removed.push_back(key);
    }

    Logger::debug("ScopeResolver: Playlist " + playlist_id + " members updated (+" +
                  std::to_string(delta.added.size()) + ", -" + std::to_string(delta.removed.size()) + ")");
    return delta;
}

bool ScopeResolver::restore(const model::PlaybackScope& persisted, const std::optional<std::vector<std::string>>& members) {
    if (persisted.is_queue()) {
        set_scope_queue();
        return false;
    }
    if (!members) {
        Logger::warn("ScopeResolver: Playlist " + persisted.playlist_id + " no longer exists, using queue scope");
        set_scope_queue();
        return false;
    }
    if (members->empty()) {
        Logger::warn("ScopeResolver: Playlist " + persisted.playlist_id + " has no playable members, using queue scope");
        set_scope_queue();
        return false;
    }
    set_scope_playlist(persisted.playlist_id, *members);
    return true;
}

bool ScopeResolver::is_playlist_active(const std::string& playlist_id) const {
    return scope_.is_playlist() && scope_.playlist_id == playlist_id;
}

std::optional<size_t> ScopeResolver::current_position(const std::string& canonical_key) const {
    if (!scope_.is_playlist()) {
        return std::nullopt;
    }
    for (const auto& key : PathKey::lookup_keys(canonical_key)) {
        auto it = position_by_key_.find(key);
        if (it != position_by_key_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ScopeResolver::playable_keys(const TrackCollection& collection,
                                                      const UnplayableTracker& unplayable) const {
    std::vector<std::string> keys;
    std::unordered_set<std::string> seen;

    if (scope_.is_queue()) {
        keys.reserve(collection.size());
        for (size_t i = 0; i < collection.size(); ++i) {
            const auto& key = collection.key_at(i);
            if (unplayable.is_unplayable_key(key)) continue;
            if (seen.insert(key).second) keys.push_back(key);
        }
        return keys;
    }

    keys.reserve(track_keys_.size());
    for (const auto& key : track_keys_) {
        if (seen.count(key)) continue;
        auto index = collection.index_of(key);
        if (!index) continue;
        if (unplayable.is_unplayable_key(collection.key_at(*index))) continue;
        seen.insert(key);
        keys.push_back(key);
    }
    return keys;
}

size_t ScopeResolver::playable_count(const TrackCollection& collection, const UnplayableTracker& unplayable) const {
    return playable_keys(collection, unplayable).size();
}

void ScopeResolver::assign_members(const std::vector<std::string>& ordered_member_paths) {
    track_keys_.clear();
    track_keys_.reserve(ordered_member_paths.size());
    position_by_key_.clear();
    size_t duplicates = 0;
    for (const auto& path : ordered_member_paths) {
        auto keys = PathKey::lookup_keys(path);
        bool seen = std::any_of(keys.begin(), keys.end(),
                                [this](const std::string& key) { return position_by_key_.count(key) > 0; });
        if (seen) {
            ++duplicates;
            continue;
        }
        for (const auto& key : keys) {
            position_by_key_.emplace(key, track_keys_.size());
        }
        track_keys_.push_back(keys.front());
    }
    if (duplicates > 0) {
        Logger::debug("ScopeResolver: Dropped " + std::to_string(duplicates) + " duplicate playlist entries");
    }
}

}  // namespace cadenza::backend
