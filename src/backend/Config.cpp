#include "backend/Config.hpp"
#include "util/AtomicFile.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace cadenza::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Unparsable values keep the current setting
void parse_debounce(const std::string& value, std::chrono::milliseconds& out) {
    int ms = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        util::Logger::warn("Config: Ignoring invalid save_debounce_ms: " + value);
        return;
    }
    out = std::chrono::milliseconds(std::clamp(ms, 0, ConfigLoader::MAX_DEBOUNCE_MS));
}

std::filesystem::path expand_home(const std::string& value) {
    if (value.size() >= 1 && value[0] == '~') {
        if (auto home = std::getenv("HOME")) {
            return std::filesystem::path(home) / value.substr(value.size() > 1 && value[1] == '/' ? 2 : 1);
        }
    }
    return value;
}

const char* level_name(util::Logger::Level level) {
    switch (level) {
        case util::Logger::Level::Debug: return "debug";
        case util::Logger::Level::Info: return "info";
        case util::Logger::Level::Warn: return "warn";
        case util::Logger::Level::Error: return "error";
    }
    return "info";
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) return cfg;

    bool playlist_dir_set = false;
    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "mode") {
                if (value == "random") cfg.mode = model::PlaybackMode::Random;
                else if (value == "sequential") cfg.mode = model::PlaybackMode::Sequential;
                else util::Logger::warn("Config: Unknown playback mode: " + value);
            }
        }
        else if (current_section == "weights") {
            if (key == "save_debounce_ms") parse_debounce(value, cfg.weights_save_debounce);
        }
        else if (current_section == "session") {
            if (key == "save_debounce_ms") parse_debounce(value, cfg.session_save_debounce);
        }
        else if (current_section == "paths") {
            if (key == "state_directory") cfg.state_directory = expand_home(value);
            else if (key == "music_directory") cfg.music_directory = expand_home(value);
            else if (key == "playlist_directory") {
                cfg.playlist_directory = expand_home(value);
                playlist_dir_set = true;
            }
        }
        else if (current_section == "logging") {
            if (key == "level") cfg.log_level = util::Logger::parse_level(value, cfg.log_level);
            else if (key == "file") cfg.log_file = expand_home(value);
        }
    }

    // Follows a relocated state directory unless given explicitly
    if (!playlist_dir_set) {
        cfg.playlist_directory = cfg.state_directory / "playlists";
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration");

    std::ostringstream file;
    file << "# cadenza config\n\n";

    file << "[playback]\n";
    file << "# Navigation mode: \"sequential\", \"random\"\n";
    file << "mode = \"" << (cfg.mode == model::PlaybackMode::Random ? "random" : "sequential") << "\"\n\n";

    file << "[weights]\n";
    file << "# Delay before weight edits are written to disk (0-60000)\n";
    file << "save_debounce_ms = " << cfg.weights_save_debounce.count() << "\n\n";

    file << "[session]\n";
    file << "save_debounce_ms = " << cfg.session_save_debounce.count() << "\n\n";

    file << "[paths]\n";
    file << "state_directory = \"" << cfg.state_directory.string() << "\"\n";
    if (!cfg.music_directory.empty()) {
        file << "music_directory = \"" << cfg.music_directory.string() << "\"\n";
    } else {
        file << "# music_directory = \"~/Music\"\n";
    }
    file << "playlist_directory = \"" << cfg.playlist_directory.string() << "\"\n\n";

    file << "[logging]\n";
    file << "# Level: \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << level_name(cfg.log_level) << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";

    std::string error;
    if (!util::write_file_atomically(path, file.str(), error)) {
        util::Logger::error("Config: Failed to save " + path.string() + ": " + error);
        return false;
    }
    return true;
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.state_directory = util::Platform::get_state_directory();
    cfg.music_directory = util::Platform::get_music_directory();
    cfg.playlist_directory = cfg.state_directory / "playlists";
    return cfg;
}

}  // namespace cadenza::backend
