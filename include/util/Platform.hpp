#pragma once

#include <filesystem>
#include <string>

namespace cadenza::util {

class Platform {
public:
    static std::filesystem::path get_music_directory();
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_state_directory();

    static bool is_audio_file(const std::filesystem::path& path);
    static bool is_playlist_file(const std::filesystem::path& path);
};

}  // namespace cadenza::util
