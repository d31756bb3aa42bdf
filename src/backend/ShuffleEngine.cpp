#include "backend/ShuffleEngine.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace cadenza::backend {

using util::Logger;

namespace {

std::vector<std::string> dedup_in_order(const std::vector<std::string>& keys) {
    std::vector<std::string> unique;
    unique.reserve(keys.size());
    std::unordered_set<std::string> seen;
    for (const auto& key : keys) {
        if (seen.insert(key).second) {
            unique.push_back(key);
        }
    }
    return unique;
}

}  // namespace

ShuffleEngine::ShuffleEngine(Source source)
    : ShuffleEngine(std::move(source), std::random_device{}()) {}

ShuffleEngine::ShuffleEngine(Source source, uint64_t seed)
    : source_(std::move(source)), rng_(seed) {}

void ShuffleEngine::create_shuffle() {
    create_shuffle(source_.population ? source_.population() : std::vector<std::string>{});
}

void ShuffleEngine::create_shuffle(const std::vector<std::string>& population) {
    state_.order = weighted_permutation(dedup_in_order(population));
    state_.cursor = 0;
    built_ = true;
    Logger::debug("ShuffleEngine: Built permutation of " + std::to_string(state_.order.size()) + " keys");
}

void ShuffleEngine::create_shuffle_after(const std::string& current_key) {
    auto population = dedup_in_order(source_.population ? source_.population() : std::vector<std::string>{});
    auto it = std::find(population.begin(), population.end(), current_key);
    if (it == population.end()) {
        create_shuffle(population);
        return;
    }
    population.erase(it);

    state_.order.clear();
    state_.order.reserve(population.size() + 1);
    state_.order.push_back(current_key);
    for (auto& key : weighted_permutation(population)) {
        state_.order.push_back(std::move(key));
    }
    state_.cursor = 1;
    built_ = true;
    Logger::debug("ShuffleEngine: Built permutation of " + std::to_string(state_.order.size()) +
                  " keys after current track");
}

void ShuffleEngine::integrate(const std::vector<std::string>& added, const std::vector<std::string>& removed) {
    if (!built_) {
        return;
    }
    auto& order = state_.order;

    if (!removed.empty()) {
        std::unordered_set<std::string> removed_set(removed.begin(), removed.end());
        size_t consumed_removed = 0;
        for (size_t i = 0; i < std::min(state_.cursor, order.size()); ++i) {
            if (removed_set.count(order[i])) consumed_removed++;
        }
        std::erase_if(order, [&removed_set](const std::string& key) { return removed_set.count(key) > 0; });
        state_.cursor = std::min(state_.cursor - consumed_removed, order.size());
    }

    if (added.empty()) {
        return;
    }

    std::unordered_set<std::string> present(order.begin(), order.end());
    size_t inserted = 0;
    for (const auto& key : added) {
        if (present.count(key)) continue;
        if (source_.playable && !source_.playable(key)) continue;

        const size_t remaining = order.size() - state_.cursor;
        const double fraction = std::pow(uniform(), weight_of(key));
        size_t offset = static_cast<size_t>(std::floor(fraction * static_cast<double>(remaining + 1)));
        offset = std::min(offset, remaining);

        order.insert(order.begin() + static_cast<std::ptrdiff_t>(state_.cursor + offset), key);
        present.insert(key);
        inserted++;
    }
    if (inserted > 0 || !removed.empty()) {
        Logger::debug("ShuffleEngine: Patched permutation (+" + std::to_string(inserted) + ", -" +
                      std::to_string(removed.size()) + "), cursor " + std::to_string(state_.cursor));
    }
}

void ShuffleEngine::reset() {
    state_.order.clear();
    state_.cursor = 0;
    built_ = false;
}

std::optional<std::string> ShuffleEngine::next() {
    return scan_forward(true);
}

std::optional<std::string> ShuffleEngine::peek() {
    return scan_forward(false);
}

std::optional<std::string> ShuffleEngine::scan_forward(bool advance) {
    bool fresh = false;
    if (!built_ || state_.cursor >= state_.order.size()) {
        create_shuffle();
        fresh = true;
    }

    // At most two passes: the unconsumed suffix, then one fresh permutation
    for (;;) {
        for (size_t i = state_.cursor; i < state_.order.size(); ++i) {
            const auto& key = state_.order[i];
            if (!source_.playable || source_.playable(key)) {
                if (advance) state_.cursor = i + 1;
                return key;
            }
        }
        if (advance) state_.cursor = state_.order.size();
        if (fresh) {
            return std::nullopt;
        }
        create_shuffle();
        fresh = true;
        if (state_.order.empty()) {
            return std::nullopt;
        }
    }
}

std::optional<std::string> ShuffleEngine::previous() {
    if (!built_) {
        return std::nullopt;
    }
    const size_t saved = std::min(state_.cursor, state_.order.size());
    size_t cursor = saved;
    while (cursor > 1) {
        --cursor;
        const auto& key = state_.order[cursor - 1];
        if (!source_.playable || source_.playable(key)) {
            state_.cursor = cursor;
            return key;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ShuffleEngine::random_start() {
    create_shuffle();
    for (size_t i = 0; i < state_.order.size(); ++i) {
        if (!source_.playable || source_.playable(state_.order[i])) {
            state_.cursor = i + 1;
            return state_.order[i];
        }
    }
    state_.cursor = state_.order.size();
    return std::nullopt;
}

std::optional<std::string> ShuffleEngine::random_excluding(const std::string& current_key,
                                                           const std::vector<std::string>& candidates) {
    std::vector<std::string> pool;
    pool.reserve(candidates.size());
    for (const auto& key : candidates) {
        if (key != current_key) pool.push_back(key);
    }
    return weighted_pick(pool);
}

std::vector<std::string> ShuffleEngine::weighted_permutation(const std::vector<std::string>& keys) {
    if (keys.size() < 2) {
        return keys;
    }

    std::vector<std::pair<double, std::string>> keyed;
    keyed.reserve(keys.size());
    for (const auto& key : keys) {
        // u in (0, 1] so -ln(u) stays finite
        const double u = std::max(std::numeric_limits<double>::min(), 1.0 - uniform());
        keyed.emplace_back(-std::log(u) / weight_of(key), key);
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> order;
    order.reserve(keyed.size());
    for (auto& [sort_key, key] : keyed) {
        order.push_back(std::move(key));
    }
    return order;
}

std::optional<std::string> ShuffleEngine::weighted_pick(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return std::nullopt;
    }

    std::vector<double> weights;
    weights.reserve(keys.size());
    double total = 0.0;
    for (const auto& key : keys) {
        weights.push_back(weight_of(key));
        total += weights.back();
    }

    if (!std::isfinite(total) || total <= 0.0) {
        std::uniform_int_distribution<size_t> pick(0, keys.size() - 1);
        return keys[pick(rng_)];
    }

    double r = uniform() * total;
    for (size_t i = 0; i < keys.size(); ++i) {
        r -= weights[i];
        if (r <= 0.0) return keys[i];
    }
    return keys.back();
}

double ShuffleEngine::weight_of(const std::string& key) const {
    double w = source_.weight ? source_.weight(key) : 1.0;
    if (!std::isfinite(w)) {
        w = 1.0;
    }
    return std::max(MIN_WEIGHT, w);
}

double ShuffleEngine::uniform() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

}  // namespace cadenza::backend
