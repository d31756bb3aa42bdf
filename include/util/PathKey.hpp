#pragma once

#include <string>
#include <vector>

namespace cadenza::util {

/// Track identity derived from a file path.
///
/// The canonical key is the lexically normalized path in Unicode NFC,
/// case preserved. It is what every fresh write uses.
///
/// Lookup keys are the canonical key followed by the legacy formats older
/// state files may contain, most likely first:
///   1. the canonical key lowercased (case-folded key format)
///   2. the canonical key decomposed to NFD (keys taken verbatim from HFS+)
/// Duplicates are removed, so a plain ASCII lowercase path yields one key.
class PathKey {
public:
    static std::string canonical(const std::string& path);
    static std::vector<std::string> legacy(const std::string& path);
    static std::vector<std::string> lookup_keys(const std::string& path);

    /// Standardized path form only (no Unicode processing)
    static std::string standardize(const std::string& path);
};

}  // namespace cadenza::util
