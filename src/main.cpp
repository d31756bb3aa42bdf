#include "backend/Config.hpp"
#include "backend/PlaybackScheduler.hpp"
#include "backend/PlaylistSource.hpp"
#include "backend/SessionStore.hpp"
#include "backend/TrackCollection.hpp"
#include "backend/UnplayableTracker.hpp"
#include "backend/WeightStore.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

using cadenza::util::Logger;
using namespace cadenza;

namespace {

constexpr const char* USAGE =
    "usage: cadenza <command> [args]\n"
    "\n"
    "  play [--random] [--count N] [--playlist ID] [paths...]\n"
    "      Print the next N selections over the given files/directories\n"
    "      (default: the configured music directory).\n"
    "  weight get <path> [--playlist ID]\n"
    "  weight set <level 0-4> <path> [--playlist ID]\n"
    "  weight clear [--playlist ID | --all]\n"
    "  weight sync <playlistID>\n"
    "      Inspect or edit selection weights (queue namespace unless --playlist).\n"
    "  scope [queue | <playlistID>]\n"
    "      Show or set the persisted playback scope.\n";

const char* level_name(backend::WeightLevel level) {
    switch (level) {
        case backend::WeightLevel::Green: return "green";
        case backend::WeightLevel::Blue: return "blue";
        case backend::WeightLevel::Purple: return "purple";
        case backend::WeightLevel::Gold: return "gold";
        case backend::WeightLevel::Red: return "red";
    }
    return "green";
}

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

// Removes "--name value" from args; returns the value
std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name) {
    auto it = std::find(args.begin(), args.end(), name);
    if (it == args.end() || std::next(it) == args.end()) return std::nullopt;
    std::string value = *std::next(it);
    args.erase(it, std::next(it, 2));
    return value;
}

bool take_flag(std::vector<std::string>& args, const std::string& name) {
    auto it = std::find(args.begin(), args.end(), name);
    if (it == args.end()) return false;
    args.erase(it);
    return true;
}

model::Track track_for(const fs::path& path) {
    model::Track track;
    track.path = path.string();
    track.title = path.stem().string();
    track.album = path.parent_path().filename().string();
    return track;
}

std::vector<model::Track> collect_tracks(const std::vector<std::string>& inputs) {
    std::vector<model::Track> tracks;
    for (const auto& input : inputs) {
        fs::path root(input);
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            if (util::Platform::is_audio_file(root)) tracks.push_back(track_for(fs::absolute(root, ec)));
            continue;
        }
        if (!fs::is_directory(root, ec)) {
            Logger::warn("Main: Skipping missing path " + input);
            std::cerr << "cadenza: no such file or directory: " << input << "\n";
            continue;
        }

        std::vector<fs::path> found;
        for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && util::Platform::is_audio_file(it->path())) {
                found.push_back(fs::absolute(it->path(), ec));
            }
        }
        if (ec) {
            Logger::warn("Main: Scan of " + input + " stopped early: " + ec.message());
        }
        // Directory iteration order is unspecified
        std::sort(found.begin(), found.end());
        for (const auto& path : found) tracks.push_back(track_for(path));
    }
    return tracks;
}

void print_alert(const model::Alert& alert) {
    std::cerr << "cadenza [" << alert.level << "] " << alert.message;
    if (!alert.detail.empty()) std::cerr << ": " << alert.detail;
    std::cerr << "\n";
}

int run_play(const backend::Config& config, std::vector<std::string> args) {
    auto mode = take_flag(args, "--random") ? model::PlaybackMode::Random : config.mode;
    auto playlist = take_option(args, "--playlist");
    int count = 10;
    if (auto raw = take_option(args, "--count")) {
        auto parsed = parse_int(*raw);
        if (!parsed || *parsed < 0) {
            std::cerr << "cadenza: invalid --count " << *raw << "\n";
            return 2;
        }
        count = *parsed;
    }
    if (args.empty()) args.push_back(config.music_directory.string());

    backend::TrackCollection collection;
    backend::WeightStore weights(config.weights_file(), config.weights_save_debounce, print_alert);
    backend::UnplayableTracker unplayable;
    backend::SessionStore session(config.session_file(), config.session_save_debounce, print_alert);
    backend::M3uPlaylistSource playlists(config.playlist_directory);
    weights.load();

    backend::PlaybackScheduler scheduler(collection, weights, unplayable, &session, &playlists);
    size_t added = scheduler.add_tracks(collect_tracks(args));
    Logger::info("Main: Collected " + std::to_string(added) + " tracks");

    if (playlist) {
        scheduler.request_playlist_scope(*playlist);
    } else {
        scheduler.restore_session();
    }
    if (!scheduler.wait_for_hydration(5s) && playlist) {
        std::cerr << "cadenza: playlist " << *playlist << " could not be resolved in time\n";
    }
    if (playlist && !scheduler.scope_resolver().is_playlist_active(*playlist)) {
        std::cerr << "cadenza: playlist " << *playlist << " is missing or empty, playing the queue\n";
    }

    std::cout << "scope: " << scheduler.current_scope().describe() << " ("
              << scheduler.playable_count() << " playable)\n";

    for (int i = 0; i < count; ++i) {
        auto track = scheduler.next(mode);
        if (!track) {
            std::cout << "(nothing to play)\n";
            break;
        }
        auto level = scheduler.weight_level(track->path, scheduler.current_scope());
        std::cout << (i + 1) << ". " << track->title << " [" << level_name(level) << "]  " << track->path << "\n";
    }

    scheduler.shutdown();
    return 0;
}

int run_weight(const backend::Config& config, std::vector<std::string> args) {
    backend::WeightStore weights(config.weights_file(), config.weights_save_debounce, print_alert);
    weights.load();

    auto playlist = take_option(args, "--playlist");
    auto scope = playlist ? model::PlaybackScope::playlist(*playlist) : model::PlaybackScope::queue();
    if (args.empty()) {
        std::cerr << USAGE;
        return 2;
    }

    const std::string sub = args[0];
    if (sub == "get" && args.size() == 2) {
        auto level = weights.level(args[1], scope);
        std::cout << static_cast<int>(level) << " " << level_name(level)
                  << " x" << backend::level_multiplier(level) << "\n";
    } else if (sub == "set" && args.size() == 3) {
        auto level = parse_int(args[1]);
        if (!level) {
            std::cerr << "cadenza: invalid level " << args[1] << "\n";
            return 2;
        }
        auto change = weights.set_level(*level, args[2], scope);
        std::cout << (change.changed ? "updated" : "unchanged") << " (" << scope.describe() << ")\n";
    } else if (sub == "clear" && args.size() <= 2) {
        bool all = args.size() == 2 && args[1] == "--all";
        if (args.size() == 2 && !all) {
            std::cerr << USAGE;
            return 2;
        }
        auto change = all ? weights.clear_all() : weights.clear(scope);
        std::cout << (change.changed ? "cleared" : "nothing to clear") << "\n";
    } else if (sub == "sync" && args.size() == 2) {
        auto result = weights.sync_overrides_to_queue(args[1]);
        std::cout << "synced " << result.changed << " of " << result.total << " overrides to the queue\n";
    } else {
        std::cerr << USAGE;
        return 2;
    }

    return weights.flush() ? 0 : 1;
}

int run_scope(const backend::Config& config, const std::vector<std::string>& args) {
    backend::SessionStore session(config.session_file(), config.session_save_debounce, print_alert);
    auto selection = session.load();

    if (args.empty()) {
        std::cout << "scope: " << selection.scope.describe() << "\n";
        if (!selection.current_key.empty()) std::cout << "current: " << selection.current_key << "\n";
        backend::M3uPlaylistSource playlists(config.playlist_directory);
        for (const auto& id : playlists.list_playlists()) {
            std::cout << "  playlist " << id << "\n";
        }
        return 0;
    }

    session.save_scope(args[0] == "queue" ? model::PlaybackScope::queue()
                                          : model::PlaybackScope::playlist(args[0]));
    return session.flush() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        auto config = backend::ConfigLoader::load_config();

        Logger::init(config.log_file.string());
        Logger::set_level(config.log_level);
        Logger::info("cadenza starting...");

        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.empty() || args[0] == "-h" || args[0] == "--help") {
            std::cout << USAGE;
            return args.empty() ? 2 : 0;
        }

        const std::string command = args[0];
        args.erase(args.begin());

        int status = 2;
        if (command == "play") status = run_play(config, std::move(args));
        else if (command == "weight") status = run_weight(config, std::move(args));
        else if (command == "scope") status = run_scope(config, args);
        else std::cerr << USAGE;

        Logger::info("cadenza shutdown");
        return status;
    } catch (const std::exception& e) {
        Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
