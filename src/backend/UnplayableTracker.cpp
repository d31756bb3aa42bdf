#include "backend/UnplayableTracker.hpp"
#include "util/Logger.hpp"
#include "util/PathKey.hpp"

namespace cadenza::backend {

using util::Logger;
using util::PathKey;

bool UnplayableTracker::mark(const std::string& path, const std::string& reason) {
    const std::string key = PathKey::canonical(path);
    std::string normalized = normalize_reason(reason);

    auto it = reasons_.find(key);
    if (it != reasons_.end() && it->second == normalized) {
        return false;
    }
    Logger::warn("UnplayableTracker: " + key + " marked unplayable: " + normalized);
    reasons_[key] = std::move(normalized);
    return true;
}

bool UnplayableTracker::clear(const std::string& path) {
    if (reasons_.erase(PathKey::canonical(path)) == 0) {
        return false;
    }
    Logger::info("UnplayableTracker: Cleared mark for " + PathKey::canonical(path));
    return true;
}

bool UnplayableTracker::clear_all() {
    if (reasons_.empty()) {
        return false;
    }
    reasons_.clear();
    Logger::info("UnplayableTracker: Cleared all marks");
    return true;
}

std::optional<std::string> UnplayableTracker::reason(const std::string& path) const {
    auto it = reasons_.find(PathKey::canonical(path));
    if (it == reasons_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UnplayableTracker::is_unplayable(const std::string& path) const {
    return is_unplayable_key(PathKey::canonical(path));
}

bool UnplayableTracker::is_unplayable_key(const std::string& canonical_key) const {
    return !reasons_.empty() && reasons_.count(canonical_key) > 0;
}

std::string UnplayableTracker::normalize_reason(const std::string& raw) {
    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t end = raw.find('\n', pos);
        if (end == std::string::npos) end = raw.size();

        std::string line = raw.substr(pos, end - pos);
        auto start = line.find_first_not_of(" \t\r");
        if (start != std::string::npos) {
            auto last = line.find_last_not_of(" \t\r");
            return line.substr(start, last - start + 1);
        }
        pos = end + 1;
    }
    return "Playback failed";
}

}  // namespace cadenza::backend
