#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cadenza::backend {

// Authoritative member order of named playlists.
class PlaylistSource {
public:
    virtual ~PlaylistSource() = default;

    // Member paths in playlist order, limited to files that exist on disk.
    // std::nullopt if no playlist has this id.
    virtual std::optional<std::vector<std::string>> members_in_order(const std::string& playlist_id) = 0;
};

// Playlists stored as <directory>/<id>.m3u or <id>.m3u8.
// Comment/#EXT lines are ignored; relative entries resolve against the directory.
class M3uPlaylistSource : public PlaylistSource {
public:
    explicit M3uPlaylistSource(std::filesystem::path directory);

    std::optional<std::vector<std::string>> members_in_order(const std::string& playlist_id) override;

    std::vector<std::string> list_playlists() const;

private:
    std::optional<std::filesystem::path> find_playlist_file(const std::string& playlist_id) const;

    std::filesystem::path directory_;
};

}  // namespace cadenza::backend
