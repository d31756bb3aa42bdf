#include "backend/PlaybackScheduler.hpp"
#include "util/Logger.hpp"
#include "util/PathKey.hpp"
#include <filesystem>
#include <random>

namespace cadenza::backend {

using util::Logger;
using util::PathKey;

PlaybackScheduler::PlaybackScheduler(TrackCollection& collection,
                                     WeightStore& weights,
                                     UnplayableTracker& unplayable,
                                     SessionStore* session,
                                     PlaylistSource* playlist_source,
                                     std::optional<uint64_t> seed)
    : collection_(collection),
      weights_(weights),
      unplayable_(unplayable),
      session_(session),
      playlist_source_(playlist_source),
      resolver_(session),
      shuffle_(make_shuffle_source(), seed ? *seed : std::random_device{}()),
      shuffle_weights_revision_(weights.revision()) {
    if (playlist_source_) {
        hydrator_ = std::make_unique<ScopeHydrator>(*playlist_source_);
    }
}

PlaybackScheduler::~PlaybackScheduler() = default;

ShuffleEngine::Source PlaybackScheduler::make_shuffle_source() {
    return {
        [this]() { return resolver_.playable_keys(collection_, unplayable_); },
        [this](const std::string& key) { return weights_.multiplier(key, resolver_.scope()); },
        [this](const std::string& key) { return is_playable_key(key); },
    };
}

// ---- Scope ----

void PlaybackScheduler::set_scope_queue() {
    if (hydrator_) hydrator_->cancel();
    resolver_.set_scope_queue();
    invalidate_shuffle("scope changed");
}

void PlaybackScheduler::set_scope_playlist(const std::string& playlist_id, const std::vector<std::string>& ordered_member_paths) {
    if (hydrator_) hydrator_->cancel();
    resolver_.set_scope_playlist(playlist_id, ordered_member_paths);
    invalidate_shuffle("scope changed");
}

bool PlaybackScheduler::request_playlist_scope(const std::string& playlist_id) {
    if (!hydrator_) {
        Logger::warn("PlaybackScheduler: No playlist source, cannot activate " + playlist_id);
        return false;
    }
    hydrator_->start(playlist_id);
    return true;
}

void PlaybackScheduler::restore_session() {
    if (!session_) {
        return;
    }
    ScopeSelection selection = session_->load();
    current_key_ = selection.current_key;

    if (selection.scope.is_playlist()) {
        if (request_playlist_scope(selection.scope.playlist_id)) {
            // Queue scope stays in effect (unpersisted) until poll() commits
            invalidate_shuffle("session restore");
            return;
        }
    }
    resolver_.restore(model::PlaybackScope::queue(), std::nullopt);
    invalidate_shuffle("session restore");
}

bool PlaybackScheduler::poll() {
    if (!hydrator_) {
        return false;
    }
    auto result = hydrator_->take_result();
    if (!result) {
        return false;
    }
    apply_hydration(std::move(*result));
    return true;
}

bool PlaybackScheduler::wait_for_hydration(std::chrono::milliseconds timeout) {
    if (!hydrator_) {
        return false;
    }
    hydrator_->wait(timeout);
    return poll();
}

void PlaybackScheduler::apply_hydration(HydrationResult result) {
    if (result.members && !result.members->empty()) {
        // Members missing from the collection get a placeholder record
        std::vector<model::Track> placeholders;
        for (const auto& path : *result.members) {
            if (collection_.contains(path)) continue;
            model::Track track;
            track.path = path;
            track.title = std::filesystem::path(path).stem().string();
            if (track.title.empty()) track.title = "Unknown Title";
            placeholders.push_back(std::move(track));
        }
        if (!placeholders.empty()) {
            size_t old_size = collection_.size();
            collection_.add_tracks(placeholders);
            integrate_new_records(old_size);
        }
    }

    resolver_.restore(model::PlaybackScope::playlist(result.playlist_id), result.members);
    invalidate_shuffle("scope changed");
}

size_t PlaybackScheduler::playable_count() const {
    return resolver_.playable_count(collection_, unplayable_);
}

// ---- Navigation ----

std::optional<model::Track> PlaybackScheduler::next(model::PlaybackMode mode) {
    if (collection_.empty()) {
        return std::nullopt;
    }
    if (mode == model::PlaybackMode::Random) {
        return random_step(true);
    }
    auto index = sequential_step(+1);
    return index ? commit(*index) : std::nullopt;
}

std::optional<model::Track> PlaybackScheduler::previous(model::PlaybackMode mode) {
    if (collection_.empty()) {
        return std::nullopt;
    }
    if (mode == model::PlaybackMode::Random) {
        sync_weight_revision();
        auto key = shuffle_.previous();
        if (!key) return std::nullopt;
        auto index = collection_.index_of(*key);
        return index ? commit(*index) : std::nullopt;
    }
    auto index = sequential_step(-1);
    return index ? commit(*index) : std::nullopt;
}

std::optional<model::Track> PlaybackScheduler::peek_next(model::PlaybackMode mode) {
    if (collection_.empty()) {
        return std::nullopt;
    }
    if (mode == model::PlaybackMode::Random) {
        return random_step(false);
    }
    auto index = sequential_step(+1);
    if (!index) return std::nullopt;
    return collection_.at(*index);
}

std::optional<model::Track> PlaybackScheduler::select_at(size_t index) {
    if (index >= collection_.size()) {
        return std::nullopt;
    }
    return commit(index);
}

std::optional<model::Track> PlaybackScheduler::random_first() {
    if (collection_.empty()) {
        return std::nullopt;
    }
    sync_weight_revision();
    auto key = shuffle_.random_start();
    if (!key) return std::nullopt;
    auto index = collection_.index_of(*key);
    return index ? commit(*index) : std::nullopt;
}

std::optional<model::Track> PlaybackScheduler::random_excluding_current() {
    auto candidates = resolver_.playable_keys(collection_, unplayable_);
    if (candidates.size() < 2) {
        return std::nullopt;
    }
    auto exclude = current_scope_key().value_or(current_key_);
    auto key = shuffle_.random_excluding(exclude, candidates);
    if (!key) return std::nullopt;
    auto index = collection_.index_of(*key);
    return index ? commit(*index) : std::nullopt;
}

std::optional<model::Track> PlaybackScheduler::current_track() const {
    auto index = current_index();
    if (!index) return std::nullopt;
    return collection_.at(*index);
}

std::optional<size_t> PlaybackScheduler::current_index() const {
    if (current_key_.empty()) {
        return std::nullopt;
    }
    return collection_.index_of(current_key_);
}

std::optional<size_t> PlaybackScheduler::sequential_step(int direction) const {
    if (resolver_.scope().is_queue()) {
        const auto total = static_cast<long>(collection_.size());
        if (total == 0) return std::nullopt;

        auto current = current_index();
        long index = current ? static_cast<long>(*current) : (direction > 0 ? -1 : 0);
        for (long attempts = 0; attempts < total; ++attempts) {
            index = (index + direction + total) % total;
            if (!unplayable_.is_unplayable_key(collection_.key_at(static_cast<size_t>(index)))) {
                return static_cast<size_t>(index);
            }
        }
        return std::nullopt;
    }

    const auto& members = resolver_.track_keys();
    const auto total = static_cast<long>(members.size());
    if (total == 0) return std::nullopt;

    auto position = current_key_.empty() ? std::nullopt : resolver_.current_position(current_key_);
    long pos = position ? static_cast<long>(*position) : (direction > 0 ? -1 : 0);
    for (long attempts = 0; attempts < total; ++attempts) {
        pos = (pos + direction + total) % total;
        auto index = collection_.index_of(members[static_cast<size_t>(pos)]);
        if (!index) continue;
        if (unplayable_.is_unplayable_key(collection_.key_at(*index))) continue;
        return index;
    }
    return std::nullopt;
}

std::optional<model::Track> PlaybackScheduler::random_step(bool advance) {
    sync_weight_revision();

    if (!shuffle_.built()) {
        // Entering random mode mid-playback: keep the current track as history
        if (auto current = current_scope_key(); current && is_playable_key(*current)) {
            shuffle_.create_shuffle_after(*current);
        }
    }

    auto key = advance ? shuffle_.next() : shuffle_.peek();
    if (!key) return std::nullopt;

    auto index = collection_.index_of(*key);
    if (!index) return std::nullopt;
    if (!advance) return collection_.at(*index);
    return commit(*index);
}

std::optional<model::Track> PlaybackScheduler::commit(size_t index) {
    current_key_ = collection_.key_at(index);
    if (session_) {
        session_->save_current_key(current_key_);
    }
    Logger::debug("PlaybackScheduler: Selected " + current_key_);
    return collection_.at(index);
}

bool PlaybackScheduler::is_playable_key(const std::string& key) const {
    auto index = collection_.index_of(key);
    return index && !unplayable_.is_unplayable_key(collection_.key_at(*index));
}

std::optional<std::string> PlaybackScheduler::current_scope_key() const {
    if (current_key_.empty()) {
        return std::nullopt;
    }
    if (resolver_.scope().is_queue()) {
        if (!collection_.contains(current_key_)) return std::nullopt;
        return current_key_;
    }
    auto position = resolver_.current_position(current_key_);
    if (!position) return std::nullopt;
    return resolver_.track_keys()[*position];
}

// ---- Weights ----

WeightLevel PlaybackScheduler::weight_level(const std::string& path, const model::PlaybackScope& scope) {
    return weights_.level(path, scope);
}

bool PlaybackScheduler::set_weight_level(int level, const std::string& path, const model::PlaybackScope& scope) {
    auto change = weights_.set_level(level, path, scope);
    adopt_weight_change(change, scope == resolver_.scope());
    return change.changed;
}

WeightStore::SyncResult PlaybackScheduler::sync_playlist_weights_to_queue(const std::string& playlist_id) {
    auto result = weights_.sync_overrides_to_queue(playlist_id);
    if (result.changed > 0) {
        // The sync bumps the revision once
        adopt_weight_change({true, weights_.revision()}, resolver_.scope().is_queue());
    }
    return result;
}

bool PlaybackScheduler::clear_weights(const model::PlaybackScope& scope) {
    auto change = weights_.clear(scope);
    adopt_weight_change(change, scope == resolver_.scope());
    return change.changed;
}

void PlaybackScheduler::adopt_weight_change(const WeightStore::Change& change, bool affects_active_scope) {
    if (!change.changed) {
        return;
    }
    // A gap in revisions means someone else edited the store too
    bool unseen_changes = shuffle_weights_revision_ + 1 != change.revision;
    if (affects_active_scope || unseen_changes) {
        invalidate_shuffle("weights changed");
    }
    shuffle_weights_revision_ = change.revision;
}

void PlaybackScheduler::sync_weight_revision() {
    uint64_t revision = weights_.revision();
    if (revision != shuffle_weights_revision_) {
        invalidate_shuffle("weights changed");
        shuffle_weights_revision_ = revision;
    }
}

// ---- Playback outcome reports ----

void PlaybackScheduler::mark_unplayable(const std::string& path, const std::string& reason) {
    if (unplayable_.mark(path, reason)) {
        invalidate_shuffle("unplayable set changed");
    }
}

void PlaybackScheduler::clear_unplayable(const std::string& path) {
    if (unplayable_.clear(path)) {
        invalidate_shuffle("unplayable set changed");
    }
}

void PlaybackScheduler::clear_all_unplayable() {
    if (unplayable_.clear_all()) {
        invalidate_shuffle("unplayable set changed");
    }
}

// ---- Collection mutations ----

size_t PlaybackScheduler::add_tracks(const std::vector<model::Track>& tracks) {
    size_t old_size = collection_.size();
    size_t added = collection_.add_tracks(tracks);
    if (added > 0) {
        integrate_new_records(old_size);
    }
    return added;
}

std::optional<size_t> PlaybackScheduler::ensure_in_collection(const std::vector<model::Track>& tracks,
                                                              const std::string& focus_path) {
    add_tracks(tracks);
    if (focus_path.empty()) {
        return std::nullopt;
    }
    return collection_.index_of(focus_path);
}

void PlaybackScheduler::integrate_new_records(size_t old_size) {
    if (!shuffle_.built() || old_size >= collection_.size()) {
        return;
    }

    std::vector<std::string> added;
    if (resolver_.scope().is_queue()) {
        for (size_t i = old_size; i < collection_.size(); ++i) {
            added.push_back(collection_.key_at(i));
        }
    } else {
        // Playlist members that only now resolve to a record
        for (const auto& key : resolver_.track_keys()) {
            auto index = collection_.index_of(key);
            if (index && *index >= old_size) added.push_back(key);
        }
    }
    shuffle_.integrate(added, {});
}

bool PlaybackScheduler::remove_track(size_t index) {
    auto removed = collection_.remove_track(index);
    if (!removed) {
        return false;
    }
    const std::string removed_key = PathKey::canonical(removed->path);

    // Mark goes with the record, and shuffle patching covers its effect
    unplayable_.clear(removed->path);

    if (collection_.empty()) {
        current_key_.clear();
        if (session_) {
            session_->save_current_key(current_key_);
        }
        set_scope_queue();
        return true;
    }

    if (current_key_ == removed_key) {
        // Sequential next() continues with the record that took its place
        current_key_ = index > 0 ? collection_.key_at(index - 1) : std::string();
        if (session_) {
            session_->save_current_key(current_key_);
        }
    }

    std::vector<std::string> gone;
    if (resolver_.scope().is_queue()) {
        gone.push_back(removed_key);
    } else {
        for (const auto& key : resolver_.track_keys()) {
            if (!collection_.contains(key)) gone.push_back(key);
        }
    }
    shuffle_.integrate({}, gone);
    return true;
}

void PlaybackScheduler::clear_tracks() {
    collection_.clear();
    unplayable_.clear_all();
    current_key_.clear();
    if (session_) {
        session_->save_current_key(current_key_);
    }
    set_scope_queue();
}

// ---- Playlist lifecycle ----

void PlaybackScheduler::update_playlist_members(const std::string& playlist_id,
                                                const std::vector<std::string>& ordered_member_paths) {
    auto delta = resolver_.update_scope_members_if_active(playlist_id, ordered_member_paths);
    if (delta && !delta->empty()) {
        shuffle_.integrate(delta->added, delta->removed);
    }
}

void PlaybackScheduler::remove_track_from_playlist(const std::string& playlist_id, const std::string& path,
                                                   const std::vector<std::string>& remaining_member_paths) {
    auto change = weights_.remove_track(path, playlist_id);
    // The key leaves the population below, so its weight needs no rebuild
    adopt_weight_change(change, false);
    update_playlist_members(playlist_id, remaining_member_paths);
}

void PlaybackScheduler::remove_playlist(const std::string& playlist_id) {
    auto change = weights_.remove_playlist(playlist_id);
    adopt_weight_change(change, false);
    if (resolver_.is_playlist_active(playlist_id)) {
        set_scope_queue();
    }
}

void PlaybackScheduler::shutdown() {
    if (hydrator_) hydrator_->cancel();
    if (!weights_.flush()) {
        Logger::error("PlaybackScheduler: Weights could not be saved on shutdown");
    }
    if (session_ && !session_->flush()) {
        Logger::error("PlaybackScheduler: Session could not be saved on shutdown");
    }
}

void PlaybackScheduler::invalidate_shuffle(const std::string& reason) {
    if (shuffle_.built()) {
        Logger::debug("PlaybackScheduler: Shuffle invalidated (" + reason + ")");
    }
    shuffle_.reset();
}

}  // namespace cadenza::backend
