#include "backend/TrackCollection.hpp"
#include "util/Logger.hpp"
#include "util/PathKey.hpp"

namespace cadenza::backend {

using util::Logger;
using util::PathKey;

bool TrackCollection::add_track(const model::Track& track) {
    if (contains(track.path)) {
        return false;
    }
    tracks_.push_back(track);
    keys_.push_back(PathKey::canonical(track.path));
    index_track(tracks_.size() - 1);
    return true;
}

size_t TrackCollection::add_tracks(const std::vector<model::Track>& tracks) {
    size_t added = 0;
    for (const auto& track : tracks) {
        if (add_track(track)) added++;
    }
    Logger::info("TrackCollection: Added " + std::to_string(added) + " of " + std::to_string(tracks.size()) + " tracks");
    return added;
}

std::optional<size_t> TrackCollection::ensure_in_collection(const std::vector<model::Track>& tracks,
                                                            const std::string& focus_path) {
    add_tracks(tracks);
    if (focus_path.empty()) {
        return std::nullopt;
    }
    return index_of(focus_path);
}

std::optional<model::Track> TrackCollection::remove_track(size_t index) {
    if (index >= tracks_.size()) {
        return std::nullopt;
    }
    Logger::info("TrackCollection: Removing track at index " + std::to_string(index));

    model::Track removed = std::move(tracks_[index]);
    tracks_.erase(tracks_.begin() + static_cast<std::ptrdiff_t>(index));
    keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(index));
    rebuild_index();
    return removed;
}

void TrackCollection::clear() {
    Logger::info("TrackCollection: Clearing collection");
    tracks_.clear();
    keys_.clear();
    index_by_key_.clear();
}

std::optional<size_t> TrackCollection::index_of(const std::string& path) const {
    if (tracks_.empty()) {
        return std::nullopt;
    }
    for (const auto& key : PathKey::lookup_keys(path)) {
        auto it = index_by_key_.find(key);
        if (it != index_by_key_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

void TrackCollection::index_track(size_t index) {
    for (auto& key : PathKey::lookup_keys(tracks_[index].path)) {
        index_by_key_.emplace(std::move(key), index);
    }
}

void TrackCollection::rebuild_index() {
    index_by_key_.clear();
    for (size_t i = 0; i < tracks_.size(); ++i) {
        index_track(i);
    }
}

}  // namespace cadenza::backend
