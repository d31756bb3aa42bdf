#pragma once

#include "model/Track.hpp"
#include "util/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace cadenza::backend {

struct Config {
    // Playback settings
    model::PlaybackMode mode = model::PlaybackMode::Sequential;

    // Persistence settings
    std::chrono::milliseconds weights_save_debounce{500};
    std::chrono::milliseconds session_save_debounce{500};

    // Directory settings
    std::filesystem::path state_directory;
    std::filesystem::path music_directory;
    std::filesystem::path playlist_directory;

    // Logging
    util::Logger::Level log_level = util::Logger::Level::Info;
    std::filesystem::path log_file = "/tmp/cadenza_debug.log";

    std::filesystem::path weights_file() const { return state_directory / "playback-weights.json"; }
    std::filesystem::path session_file() const { return state_directory / "playback-session.json"; }
};

class ConfigLoader {
public:
    static constexpr int MAX_DEBOUNCE_MS = 60000;

    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

}  // namespace cadenza::backend
