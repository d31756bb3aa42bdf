#pragma once

#include "backend/PlaylistSource.hpp"
#include "backend/ScopeHydrator.hpp"
#include "backend/ScopeResolver.hpp"
#include "backend/SessionStore.hpp"
#include "backend/ShuffleEngine.hpp"
#include "backend/TrackCollection.hpp"
#include "backend/UnplayableTracker.hpp"
#include "backend/WeightStore.hpp"
#include "model/Track.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cadenza::backend {

/**
 * Decides which track plays next.
 *
 * Owns the scope resolver and the shuffle engine; borrows the collection,
 * the weight store, the unplayable tracker and (optionally) the session
 * store and playlist source from the application.
 *
 * Single-owner: every call must come from the same logical thread. Only
 * playlist hydration and persistence run in the background, and neither is
 * ever waited on by a selection.
 *
 * Selections return std::nullopt when no candidate exists; they never throw.
 */
class PlaybackScheduler {
public:
    PlaybackScheduler(TrackCollection& collection,
                      WeightStore& weights,
                      UnplayableTracker& unplayable,
                      SessionStore* session = nullptr,
                      PlaylistSource* playlist_source = nullptr,
                      std::optional<uint64_t> seed = std::nullopt);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // ---- Scope ----
    const model::PlaybackScope& current_scope() const { return resolver_.scope(); }
    void set_scope_queue();
    void set_scope_playlist(const std::string& playlist_id, const std::vector<std::string>& ordered_member_paths);

    // Resolves the playlist through the playlist source in the background;
    // the switch happens in poll(). A later scope request cancels it.
    bool request_playlist_scope(const std::string& playlist_id);

    // Reads the persisted session. A playlist scope is re-resolved via
    // request_playlist_scope(); everything else applies immediately.
    void restore_session();

    // Commits a finished hydration. Returns true if the scope changed.
    bool poll();
    bool wait_for_hydration(std::chrono::milliseconds timeout);

    size_t playable_count() const;
    const ScopeResolver& scope_resolver() const { return resolver_; }

    // ---- Navigation ----
    std::optional<model::Track> next(model::PlaybackMode mode);
    std::optional<model::Track> previous(model::PlaybackMode mode);
    std::optional<model::Track> peek_next(model::PlaybackMode mode);
    std::optional<model::Track> select_at(size_t index);
    std::optional<model::Track> random_first();
    std::optional<model::Track> random_excluding_current();

    std::optional<model::Track> current_track() const;
    std::optional<size_t> current_index() const;

    // ---- Weights ----
    WeightLevel weight_level(const std::string& path, const model::PlaybackScope& scope);
    bool set_weight_level(int level, const std::string& path, const model::PlaybackScope& scope);
    WeightStore::SyncResult sync_playlist_weights_to_queue(const std::string& playlist_id);
    bool clear_weights(const model::PlaybackScope& scope);

    // ---- Playback outcome reports ----
    void mark_unplayable(const std::string& path, const std::string& reason);
    void clear_unplayable(const std::string& path);
    void clear_all_unplayable();

    // ---- Collection mutations ----
    size_t add_tracks(const std::vector<model::Track>& tracks);
    std::optional<size_t> ensure_in_collection(const std::vector<model::Track>& tracks, const std::string& focus_path = "");
    bool remove_track(size_t index);
    void clear_tracks();

    // ---- Playlist lifecycle ----
    void update_playlist_members(const std::string& playlist_id, const std::vector<std::string>& ordered_member_paths);
    void remove_track_from_playlist(const std::string& playlist_id, const std::string& path,
                                    const std::vector<std::string>& remaining_member_paths);
    void remove_playlist(const std::string& playlist_id);

    // Cancels background work and forces pending writes to disk
    void shutdown();

    const ShuffleEngine& shuffle() const { return shuffle_; }

private:
    ShuffleEngine::Source make_shuffle_source();

    void invalidate_shuffle(const std::string& reason);
    void sync_weight_revision();
    void adopt_weight_change(const WeightStore::Change& change, bool affects_active_scope);
    void apply_hydration(HydrationResult result);
    void integrate_new_records(size_t old_size);

    bool is_playable_key(const std::string& key) const;
    std::optional<std::string> current_scope_key() const;
    std::optional<size_t> sequential_step(int direction) const;
    std::optional<model::Track> random_step(bool advance);
    std::optional<model::Track> commit(size_t index);

    TrackCollection& collection_;
    WeightStore& weights_;
    UnplayableTracker& unplayable_;
    SessionStore* session_;
    PlaylistSource* playlist_source_;

    ScopeResolver resolver_;
    ShuffleEngine shuffle_;
    uint64_t shuffle_weights_revision_ = 0;

    std::string current_key_;  // canonical key of the record last selected

    std::unique_ptr<ScopeHydrator> hydrator_;
};

}  // namespace cadenza::backend
