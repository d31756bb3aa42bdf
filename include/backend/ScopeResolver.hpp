#pragma once

#include "backend/SessionStore.hpp"
#include "model/Track.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadenza::backend {

class TrackCollection;
class UnplayableTracker;

// Key-set difference between two member lists of the active playlist
struct MemberDelta {
    std::vector<std::string> added;    // in new playlist order
    std::vector<std::string> removed;

    bool empty() const { return added.empty() && removed.empty(); }
};

/**
 * Holds the active playback scope. For a playlist scope it keeps the ordered
 * member keys and a key -> position index so sequential navigation never
 * needs the shuffle permutation.
 *
 * Scope changes are persisted through the optional SessionStore.
 */
class ScopeResolver {
public:
    explicit ScopeResolver(SessionStore* session = nullptr);

    void set_scope_queue();
    void set_scope_playlist(const std::string& playlist_id, const std::vector<std::string>& ordered_member_paths);

    // Replaces the member list if `playlist_id` is the active scope and
    // returns what changed; std::nullopt when another scope is active.
    std::optional<MemberDelta> update_scope_members_if_active(const std::string& playlist_id,
                                                              const std::vector<std::string>& ordered_member_paths);

    // Re-derives the scope from persisted state. `members` is the playlist's
    // member list as resolved by the playlist source (nullopt: playlist gone).
    // Falls back to the queue scope when there is nothing to play.
    // Returns true if a playlist scope was activated.
    bool restore(const model::PlaybackScope& persisted, const std::optional<std::vector<std::string>>& members);

    const model::PlaybackScope& scope() const { return scope_; }
    bool is_playlist_active(const std::string& playlist_id) const;

    // Ordered member keys, one per track even if the playlist lists it twice
    const std::vector<std::string>& track_keys() const { return track_keys_; }
    // Position of the member matching the key under any of its lookup variants
    std::optional<size_t> current_position(const std::string& canonical_key) const;

    // Members (or queue records) resolvable to a record and not marked unplayable, in scope order
    std::vector<std::string> playable_keys(const TrackCollection& collection, const UnplayableTracker& unplayable) const;
    size_t playable_count(const TrackCollection& collection, const UnplayableTracker& unplayable) const;

private:
    void assign_members(const std::vector<std::string>& ordered_member_paths);

    SessionStore* session_;
    model::PlaybackScope scope_;
    std::vector<std::string> track_keys_;
    // Every lookup key of each member maps to its position
    std::unordered_map<std::string, size_t> position_by_key_;
};

}  // namespace cadenza::backend
