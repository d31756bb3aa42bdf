#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace cadenza::backend {

// A precomputed weighted permutation of keys plus a traversal cursor.
// order[0, cursor) has been consumed; order[cursor - 1] is the current entry.
struct ShuffleState {
    std::vector<std::string> order;
    size_t cursor = 0;
};

/**
 * Weighted random traversal over a population of track keys.
 *
 * Fresh builds use Efraimidis-Spirakis sampling: each key gets the sort key
 * -ln(u) / w with u ~ U(0,1], and the permutation is the ascending order of
 * those keys. Every prefix is then a weighted draw without replacement.
 *
 * Additions are patched into the unconsumed suffix without a rebuild; the
 * offset is floor(u^w * (remaining + 1)), so heavier keys land earlier.
 *
 * Population, weights and playability come from the bound Source so the
 * engine always sees the owner's latest committed state. Not thread-safe:
 * the owning scheduler serializes all calls.
 */
class ShuffleEngine {
public:
    using PopulationFn = std::function<std::vector<std::string>()>;
    using WeightFn = std::function<double(const std::string&)>;
    using PlayableFn = std::function<bool(const std::string&)>;

    struct Source {
        PopulationFn population;  // playable keys of the active scope, in scope order
        WeightFn weight;          // selection multiplier
        PlayableFn playable;      // resolvable and not marked unplayable
    };

    static constexpr double MIN_WEIGHT = 1e-6;

    explicit ShuffleEngine(Source source);
    ShuffleEngine(Source source, uint64_t seed);

    void create_shuffle();
    void create_shuffle(const std::vector<std::string>& population);

    // Current key first with the cursor after it, the rest weighted-shuffled.
    // Falls back to a plain build if `current_key` is not in the population.
    void create_shuffle_after(const std::string& current_key);

    void integrate(const std::vector<std::string>& added, const std::vector<std::string>& removed);

    void reset();

    std::optional<std::string> next();
    std::optional<std::string> previous();
    std::optional<std::string> peek();
    std::optional<std::string> random_start();

    // One-shot cumulative-weight draw over `candidates` minus `current_key`.
    // Leaves the permutation and cursor untouched.
    std::optional<std::string> random_excluding(const std::string& current_key,
                                                const std::vector<std::string>& candidates);

    bool built() const { return built_; }
    const ShuffleState& state() const { return state_; }

    std::vector<std::string> weighted_permutation(const std::vector<std::string>& keys);
    std::optional<std::string> weighted_pick(const std::vector<std::string>& keys);

private:
    double weight_of(const std::string& key) const;
    double uniform();
    std::optional<std::string> scan_forward(bool advance);

    Source source_;
    std::mt19937_64 rng_;
    ShuffleState state_;
    bool built_ = false;
};

}  // namespace cadenza::backend
