#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace cadenza::backend {

// Tracks whose last playback attempt failed, keyed by canonical path key.
// Scope-independent. Mutators return true when the set changed, which
// invalidates any cached shuffle.
class UnplayableTracker {
public:
    bool mark(const std::string& path, const std::string& reason);
    bool clear(const std::string& path);
    bool clear_all();

    std::optional<std::string> reason(const std::string& path) const;
    bool is_unplayable(const std::string& path) const;
    bool is_unplayable_key(const std::string& canonical_key) const;

    size_t size() const { return reasons_.size(); }

    // First non-empty line of a decoder error, or a generic message
    static std::string normalize_reason(const std::string& raw);

private:
    std::unordered_map<std::string, std::string> reasons_;
};

}  // namespace cadenza::backend
