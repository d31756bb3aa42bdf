#include "../framework/SimpleTest.hpp"
#include "backend/ShuffleEngine.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

using namespace cadenza::backend;

namespace {

// Mutable population the engine reads through its Source callbacks
struct FakeScope {
    std::vector<std::string> keys;
    std::unordered_map<std::string, double> weights;
    std::unordered_set<std::string> unplayable;

    ShuffleEngine::Source source() {
        return {
            [this]() {
                std::vector<std::string> playable;
                for (const auto& key : keys) {
                    if (!unplayable.count(key)) playable.push_back(key);
                }
                return playable;
            },
            [this](const std::string& key) {
                auto it = weights.find(key);
                return it == weights.end() ? 1.0 : it->second;
            },
            [this](const std::string& key) {
                return std::find(keys.begin(), keys.end(), key) != keys.end() && !unplayable.count(key);
            },
        };
    }
};

std::vector<std::string> make_keys(size_t count) {
    std::vector<std::string> keys;
    for (size_t i = 0; i < count; ++i) keys.push_back("/Music/t" + std::to_string(i) + ".mp3");
    return keys;
}

}  // namespace

TEST_CASE(test_traversal_visits_each_key_once) {
    FakeScope scope{make_keys(12), {}, {}};
    scope.weights[scope.keys[3]] = 6.4;
    ShuffleEngine engine(scope.source(), 42);

    std::set<std::string> seen;
    for (size_t i = 0; i < scope.keys.size(); ++i) {
        auto key = engine.next();
        ASSERT_TRUE(key.has_value());
        ASSERT_TRUE(seen.insert(*key).second);
    }
    ASSERT_EQ(seen.size(), scope.keys.size());

    // Exhausted: the next call starts a fresh permutation
    ASSERT_TRUE(engine.next().has_value());
    ASSERT_EQ(engine.state().cursor, 1u);
}

TEST_CASE(test_uniform_weights_are_fair) {
    FakeScope scope{make_keys(5), {}, {}};
    ShuffleEngine engine(scope.source(), 7);

    const int trials = 50000;
    std::map<std::string, int> first_counts;
    for (int i = 0; i < trials; ++i) {
        engine.create_shuffle();
        first_counts[engine.state().order.front()]++;
    }

    // Chi-square with 4 degrees of freedom; 25.0 is past the 0.01% critical value
    const double expected = trials / 5.0;
    double chi_square = 0.0;
    for (const auto& key : scope.keys) {
        double diff = first_counts[key] - expected;
        chi_square += diff * diff / expected;
    }
    ASSERT_LE(chi_square, 25.0);
}

TEST_CASE(test_first_draw_proportional_to_weight) {
    FakeScope scope{{"a", "b", "c"}, {{"a", 1.0}, {"b", 6.4}, {"c", 1.6}}, {}};
    ShuffleEngine engine(scope.source(), 1234);

    const int trials = 40000;
    std::map<std::string, int> first_counts;
    for (int i = 0; i < trials; ++i) {
        engine.create_shuffle();
        first_counts[engine.state().order.front()]++;
    }

    const double total = 1.0 + 6.4 + 1.6;
    ASSERT_NEAR(first_counts["a"] / double(trials), 1.0 / total, 0.015);
    ASSERT_NEAR(first_counts["b"] / double(trials), 6.4 / total, 0.015);
    ASSERT_NEAR(first_counts["c"] / double(trials), 1.6 / total, 0.015);
}

TEST_CASE(test_duplicate_population_entries_collapse) {
    ShuffleEngine engine(ShuffleEngine::Source{}, 3);
    engine.create_shuffle({"a", "b", "a", "c", "b"});
    ASSERT_EQ(engine.state().order.size(), 3u);
}

TEST_CASE(test_peek_matches_next) {
    FakeScope scope{make_keys(6), {}, {}};
    ShuffleEngine engine(scope.source(), 99);

    for (int i = 0; i < 10; ++i) {
        auto peeked = engine.peek();
        auto peeked_again = engine.peek();
        auto taken = engine.next();
        ASSERT_TRUE(peeked.has_value());
        ASSERT_EQ(*peeked, *peeked_again);
        ASSERT_EQ(*peeked, *taken);
    }
}

TEST_CASE(test_unplayable_keys_are_skipped) {
    FakeScope scope{make_keys(6), {}, {}};
    ShuffleEngine engine(scope.source(), 5);
    engine.create_shuffle();

    // Marked after the build: the permutation still holds them
    scope.unplayable.insert(scope.keys[0]);
    scope.unplayable.insert(scope.keys[4]);

    std::set<std::string> seen;
    for (int i = 0; i < 4; ++i) {
        auto key = engine.next();
        ASSERT_TRUE(key.has_value());
        ASSERT_FALSE(scope.unplayable.count(*key) > 0);
        seen.insert(*key);
    }
    ASSERT_EQ(seen.size(), 4u);
}

TEST_CASE(test_all_unplayable_yields_nothing) {
    FakeScope scope{make_keys(3), {}, {}};
    ShuffleEngine engine(scope.source(), 5);
    engine.create_shuffle();
    for (const auto& key : scope.keys) scope.unplayable.insert(key);

    ASSERT_FALSE(engine.next().has_value());
    ASSERT_FALSE(engine.peek().has_value());
    ASSERT_FALSE(engine.random_start().has_value());
}

TEST_CASE(test_empty_population_yields_nothing) {
    FakeScope scope;
    ShuffleEngine engine(scope.source(), 5);
    ASSERT_FALSE(engine.next().has_value());
    ASSERT_FALSE(engine.previous().has_value());
}

TEST_CASE(test_previous_walks_history) {
    FakeScope scope{make_keys(5), {}, {}};
    ShuffleEngine engine(scope.source(), 11);

    auto first = engine.next();
    auto second = engine.next();
    auto third = engine.next();
    ASSERT_TRUE(third.has_value());

    ASSERT_EQ(*engine.previous(), *second);
    ASSERT_EQ(*engine.previous(), *first);
    // Nothing before the first entry; the cursor stays put
    ASSERT_FALSE(engine.previous().has_value());
    ASSERT_EQ(engine.state().cursor, 1u);

    ASSERT_EQ(*engine.next(), *second);
}

TEST_CASE(test_previous_skips_unplayable) {
    FakeScope scope{make_keys(5), {}, {}};
    ShuffleEngine engine(scope.source(), 13);

    auto first = engine.next();
    auto second = engine.next();
    engine.next();
    scope.unplayable.insert(*second);

    ASSERT_EQ(*engine.previous(), *first);
}

TEST_CASE(test_create_shuffle_after_current) {
    FakeScope scope{make_keys(8), {}, {}};
    ShuffleEngine engine(scope.source(), 17);

    engine.create_shuffle_after(scope.keys[5]);
    ASSERT_EQ(engine.state().order.front(), scope.keys[5]);
    ASSERT_EQ(engine.state().cursor, 1u);
    ASSERT_EQ(engine.state().order.size(), 8u);

    auto following = engine.next();
    ASSERT_FALSE(*following == scope.keys[5]);
    ASSERT_EQ(*engine.previous(), scope.keys[5]);
}

TEST_CASE(test_create_shuffle_after_unknown_key) {
    FakeScope scope{make_keys(4), {}, {}};
    ShuffleEngine engine(scope.source(), 17);

    engine.create_shuffle_after("/Music/not-here.mp3");
    ASSERT_TRUE(engine.built());
    ASSERT_EQ(engine.state().cursor, 0u);
    ASSERT_EQ(engine.state().order.size(), 4u);
}

TEST_CASE(test_integrate_preserves_relative_order) {
    FakeScope scope{make_keys(10), {}, {}};
    ShuffleEngine engine(scope.source(), 21);
    engine.create_shuffle();
    engine.next();
    engine.next();
    engine.next();

    const auto before = engine.state().order;
    scope.keys.push_back("/Music/new1.mp3");
    scope.keys.push_back("/Music/new2.mp3");
    engine.integrate({"/Music/new1.mp3", "/Music/new2.mp3"}, {});

    const auto& after = engine.state();
    ASSERT_EQ(after.cursor, 3u);
    ASSERT_EQ(after.order.size(), 12u);

    std::vector<std::string> without_new;
    for (const auto& key : after.order) {
        if (key.find("new") == std::string::npos) without_new.push_back(key);
    }
    ASSERT_TRUE(without_new == before);

    // Additions only land in the unconsumed suffix
    for (size_t i = 0; i < after.cursor; ++i) {
        ASSERT_EQ(after.order[i], before[i]);
    }
}

TEST_CASE(test_integrate_ignores_present_and_unplayable) {
    FakeScope scope{make_keys(4), {}, {}};
    ShuffleEngine engine(scope.source(), 23);
    engine.create_shuffle();

    scope.keys.push_back("/Music/broken.mp3");
    scope.unplayable.insert("/Music/broken.mp3");
    engine.integrate({scope.keys[0], "/Music/broken.mp3"}, {});
    ASSERT_EQ(engine.state().order.size(), 4u);
}

TEST_CASE(test_integrate_before_build_is_noop) {
    FakeScope scope{make_keys(4), {}, {}};
    ShuffleEngine engine(scope.source(), 23);
    engine.integrate({"/Music/x.mp3"}, {scope.keys[0]});
    ASSERT_FALSE(engine.built());
    ASSERT_TRUE(engine.state().order.empty());
}

TEST_CASE(test_integrate_removal_adjusts_cursor) {
    FakeScope scope{make_keys(10), {}, {}};
    ShuffleEngine engine(scope.source(), 29);
    engine.create_shuffle();
    for (int i = 0; i < 4; ++i) engine.next();

    const auto before = engine.state().order;
    // One consumed entry and one pending entry
    engine.integrate({}, {before[1], before[6]});

    const auto& after = engine.state();
    ASSERT_EQ(after.order.size(), 8u);
    ASSERT_EQ(after.cursor, 3u);
    ASSERT_EQ(after.order[2], before[3]);

    // The next pick is the entry that followed the cursor before removal
    ASSERT_EQ(*engine.next(), before[4]);
}

TEST_CASE(test_heavier_additions_land_earlier) {
    FakeScope scope{make_keys(50), {}, {}};
    scope.weights["/Music/heavy.mp3"] = 6.4;
    scope.weights["/Music/light.mp3"] = 1.0;
    scope.keys.push_back("/Music/heavy.mp3");
    scope.keys.push_back("/Music/light.mp3");
    ShuffleEngine engine(scope.source(), 31);

    const std::vector<std::string> base(scope.keys.begin(), scope.keys.begin() + 50);
    double heavy_total = 0.0;
    double light_total = 0.0;
    const int trials = 2000;
    for (int t = 0; t < trials; ++t) {
        engine.create_shuffle(base);
        engine.integrate({"/Music/heavy.mp3"}, {});
        engine.integrate({"/Music/light.mp3"}, {});
        const auto& order = engine.state().order;
        heavy_total += std::find(order.begin(), order.end(), "/Music/heavy.mp3") - order.begin();
        light_total += std::find(order.begin(), order.end(), "/Music/light.mp3") - order.begin();
    }
    ASSERT_LE(heavy_total / trials, light_total / trials);
    // E[u^6.4] = 1/7.4 of the remaining span
    ASSERT_LE(heavy_total / trials, 12.0);
}

TEST_CASE(test_random_excluding_never_returns_current) {
    FakeScope scope{{"A", "B"}, {{"A", 1.0}, {"B", 6.4}}, {}};
    ShuffleEngine engine(scope.source(), 37);

    for (int i = 0; i < 10000; ++i) {
        auto pick = engine.random_excluding("A", {"A", "B"});
        ASSERT_TRUE(pick.has_value());
        ASSERT_EQ(*pick, std::string("B"));
    }
    ASSERT_FALSE(engine.built());
    ASSERT_FALSE(engine.random_excluding("A", {"A"}).has_value());
}

TEST_CASE(test_weighted_pick_proportional) {
    FakeScope scope{{"a", "b"}, {{"a", 1.6}, {"b", 4.8}}, {}};
    ShuffleEngine engine(scope.source(), 41);

    const int trials = 30000;
    int b_count = 0;
    for (int i = 0; i < trials; ++i) {
        if (*engine.weighted_pick({"a", "b"}) == "b") b_count++;
    }
    ASSERT_NEAR(b_count / double(trials), 0.75, 0.015);
}

TEST_CASE(test_non_positive_weights_still_selectable) {
    FakeScope scope{{"a", "b"}, {{"a", 0.0}, {"b", -3.0}}, {}};
    ShuffleEngine engine(scope.source(), 43);

    std::set<std::string> seen;
    for (int i = 0; i < 2; ++i) seen.insert(*engine.next());
    ASSERT_EQ(seen.size(), 2u);
}

TEST_CASE(test_reset_forgets_permutation) {
    FakeScope scope{make_keys(3), {}, {}};
    ShuffleEngine engine(scope.source(), 47);
    engine.next();
    ASSERT_TRUE(engine.built());
    engine.reset();
    ASSERT_FALSE(engine.built());
    ASSERT_EQ(engine.state().cursor, 0u);
}

int main() {
    return cadenza::test::TestRunner::instance().run_all();
}
