#pragma once

#include "model/Track.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadenza::backend {

// The physical, ordered store of track records (the "queue" population).
// Records are unique by path identity: a track is a duplicate if any of its
// lookup keys matches a lookup key of a record already present.
class TrackCollection {
public:
    TrackCollection() = default;

    bool add_track(const model::Track& track);
    size_t add_tracks(const std::vector<model::Track>& tracks);

    // Appends the missing tracks and returns the index of `focus_path`, if given and present
    std::optional<size_t> ensure_in_collection(const std::vector<model::Track>& tracks,
                                               const std::string& focus_path = "");

    std::optional<model::Track> remove_track(size_t index);
    void clear();

    const std::vector<model::Track>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }

    const model::Track& at(size_t index) const { return tracks_.at(index); }
    const std::string& key_at(size_t index) const { return keys_.at(index); }

    // Accepts a path or a key in any supported format
    std::optional<size_t> index_of(const std::string& path) const;
    bool contains(const std::string& path) const { return index_of(path).has_value(); }

private:
    void index_track(size_t index);
    void rebuild_index();

    std::vector<model::Track> tracks_;
    std::vector<std::string> keys_;                          // canonical key per record
    std::unordered_map<std::string, size_t> index_by_key_;   // every lookup key -> first record
};

}  // namespace cadenza::backend
