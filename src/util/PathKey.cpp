#include "util/PathKey.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <filesystem>

namespace cadenza::util {

std::string PathKey::standardize(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    std::string normal = std::filesystem::path(path).lexically_normal().generic_string();

    // "/Music/Album/" and "/Music/Album" are the same file
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

std::string PathKey::canonical(const std::string& path) {
    return compose_nfc(standardize(path));
}

std::vector<std::string> PathKey::legacy(const std::string& path) {
    std::string key = canonical(path);
    return {to_lower(key), decompose_nfd(key)};
}

std::vector<std::string> PathKey::lookup_keys(const std::string& path) {
    std::vector<std::string> keys;
    keys.reserve(3);
    keys.push_back(canonical(path));
    for (auto& variant : legacy(path)) {
        if (std::find(keys.begin(), keys.end(), variant) == keys.end()) {
            keys.push_back(std::move(variant));
        }
    }
    return keys;
}

}  // namespace cadenza::util
