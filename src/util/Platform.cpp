#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>

namespace cadenza::util {

namespace {

std::string lowercase_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

}  // namespace

std::filesystem::path Platform::get_music_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / "Music";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: ./Music");
    return "./Music";
}

std::filesystem::path Platform::get_config_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "cadenza";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/cadenza");
    return ".config/cadenza";
}

std::filesystem::path Platform::get_state_directory() {
    if (auto xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "cadenza";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share" / "cadenza";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .local/share/cadenza");
    return ".local/share/cadenza";
}

bool Platform::is_audio_file(const std::filesystem::path& path) {
    static const std::string extensions[] = {
        ".mp3", ".flac", ".ogg", ".opus", ".wav", ".m4a", ".aac", ".aiff", ".aif", ".alac"
    };

    auto ext = lowercase_extension(path);
    for (const auto& e : extensions) {
        if (ext == e) return true;
    }
    return false;
}

bool Platform::is_playlist_file(const std::filesystem::path& path) {
    auto ext = lowercase_extension(path);
    return ext == ".m3u" || ext == ".m3u8";
}

}  // namespace cadenza::util
