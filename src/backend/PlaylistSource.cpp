#include "backend/PlaylistSource.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace cadenza::backend {

using util::Logger;
namespace fs = std::filesystem;

M3uPlaylistSource::M3uPlaylistSource(fs::path directory)
    : directory_(std::move(directory)) {}

std::optional<fs::path> M3uPlaylistSource::find_playlist_file(const std::string& playlist_id) const {
    // Ids are file stems; anything that could escape the directory is rejected
    if (playlist_id.empty() || playlist_id.find('/') != std::string::npos || playlist_id == "." || playlist_id == "..") {
        return std::nullopt;
    }
    std::error_code ec;
    for (const char* ext : {".m3u", ".m3u8"}) {
        auto candidate = directory_ / (playlist_id + ext);
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> M3uPlaylistSource::members_in_order(const std::string& playlist_id) {
    auto file_path = find_playlist_file(playlist_id);
    if (!file_path) {
        Logger::warn("M3uPlaylistSource: No playlist named " + playlist_id);
        return std::nullopt;
    }

    std::ifstream file(*file_path);
    if (!file) {
        Logger::error("M3uPlaylistSource: Failed to open " + file_path->string());
        return std::nullopt;
    }

    std::vector<std::string> members;
    size_t missing = 0;
    std::string line;
    std::error_code ec;
    while (std::getline(file, line)) {
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (line.empty() || line[0] == '#') continue;

        fs::path track_path(line);
        if (track_path.is_relative()) {
            track_path = file_path->parent_path() / track_path;
        }
        if (!fs::exists(track_path, ec)) {
            missing++;
            continue;
        }
        members.push_back(track_path.lexically_normal().string());
    }

    Logger::info("M3uPlaylistSource: " + playlist_id + " has " + std::to_string(members.size()) +
                 " members (" + std::to_string(missing) + " missing on disk)");
    return members;
}

std::vector<std::string> M3uPlaylistSource::list_playlists() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && util::Platform::is_playlist_file(it->path())) {
            ids.push_back(it->path().stem().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace cadenza::backend
