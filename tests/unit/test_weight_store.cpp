#include "../framework/SimpleTest.hpp"
#include "../framework/TempDir.hpp"
#include "backend/WeightStore.hpp"
#include "util/AtomicFile.hpp"
#include <fstream>
#include <thread>
#include <nlohmann/json.hpp>

using namespace cadenza::backend;
using cadenza::model::Alert;
using cadenza::model::PlaybackScope;
using cadenza::test::TempDir;
using json = nlohmann::json;

namespace {

// Long enough that nothing is written unless a test flushes
constexpr std::chrono::milliseconds MANUAL_SAVE{60000};

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

json read_json(const std::filesystem::path& path) {
    auto contents = cadenza::util::read_file(path);
    if (!contents) return json();
    return json::parse(*contents, nullptr, false);
}

}  // namespace

TEST_CASE(test_level_multipliers) {
    ASSERT_NEAR(level_multiplier(WeightLevel::Green), 1.0, 1e-12);
    ASSERT_NEAR(level_multiplier(WeightLevel::Blue), 1.6, 1e-12);
    ASSERT_NEAR(level_multiplier(WeightLevel::Purple), 3.2, 1e-12);
    ASSERT_NEAR(level_multiplier(WeightLevel::Gold), 4.8, 1e-12);
    ASSERT_NEAR(level_multiplier(WeightLevel::Red), 6.4, 1e-12);
    ASSERT_TRUE(clamp_level(9) == WeightLevel::Red);
    ASSERT_TRUE(clamp_level(-2) == WeightLevel::Green);
}

TEST_CASE(test_default_level_is_green) {
    TempDir dir("weights_default");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    ASSERT_TRUE(store.level("/Music/a.mp3", PlaybackScope::queue()) == WeightLevel::Green);
    ASSERT_NEAR(store.multiplier("/Music/a.mp3", PlaybackScope::queue()), 1.0, 1e-12);
}

TEST_CASE(test_set_level_is_sparse) {
    TempDir dir("weights_sparse");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    auto queue = PlaybackScope::queue();

    auto change = store.set_level(WeightLevel::Red, "/Music/a.mp3", queue);
    ASSERT_TRUE(change.changed);
    ASSERT_EQ(store.entry_count(queue), 1u);
    ASSERT_NEAR(store.multiplier("/Music/a.mp3", queue), 6.4, 1e-12);

    // Setting the default removes the entry instead of storing 0
    change = store.set_level(0, "/Music/a.mp3", queue);
    ASSERT_TRUE(change.changed);
    ASSERT_EQ(store.entry_count(queue), 0u);
    ASSERT_FALSE(store.has_entry("/Music/a.mp3", queue));
}

TEST_CASE(test_set_level_clamps) {
    TempDir dir("weights_clamp");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    auto queue = PlaybackScope::queue();

    store.set_level(17, "/Music/a.mp3", queue);
    ASSERT_TRUE(store.level("/Music/a.mp3", queue) == WeightLevel::Red);

    store.set_level(-5, "/Music/b.mp3", queue);
    ASSERT_TRUE(store.level("/Music/b.mp3", queue) == WeightLevel::Green);
    ASSERT_FALSE(store.has_entry("/Music/b.mp3", queue));
}

TEST_CASE(test_revision_bumps_only_on_effective_change) {
    TempDir dir("weights_revision");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    auto queue = PlaybackScope::queue();

    ASSERT_EQ(store.revision(), 0u);
    auto first = store.set_level(3, "/Music/a.mp3", queue);
    ASSERT_EQ(first.revision, 1u);

    auto same = store.set_level(3, "/Music/a.mp3", queue);
    ASSERT_FALSE(same.changed);
    ASSERT_EQ(same.revision, 1u);

    auto noop = store.set_level(0, "/Music/never-set.mp3", queue);
    ASSERT_FALSE(noop.changed);
    ASSERT_EQ(store.revision(), 1u);
}

TEST_CASE(test_namespaces_are_isolated) {
    TempDir dir("weights_isolation");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    auto queue = PlaybackScope::queue();
    auto mix = PlaybackScope::playlist("mix");
    auto other = PlaybackScope::playlist("other");

    store.set_level(4, "/Music/a.mp3", mix);
    ASSERT_TRUE(store.level("/Music/a.mp3", mix) == WeightLevel::Red);
    ASSERT_TRUE(store.level("/Music/a.mp3", queue) == WeightLevel::Green);
    ASSERT_TRUE(store.level("/Music/a.mp3", other) == WeightLevel::Green);

    store.set_level(1, "/Music/a.mp3", queue);
    ASSERT_TRUE(store.level("/Music/a.mp3", mix) == WeightLevel::Red);
}

TEST_CASE(test_legacy_key_migrates_on_read) {
    TempDir dir("weights_migrate");
    auto file = dir / "weights.json";
    write_text(file, R"({"version":1,"queueLevels":{"/music/song.mp3":3},"playlistLevels":{}})");

    WeightStore store(file, MANUAL_SAVE);
    ASSERT_TRUE(store.load());
    const uint64_t before = store.revision();

    ASSERT_TRUE(store.level("/Music/Song.mp3", PlaybackScope::queue()) == WeightLevel::Gold);

    auto entries = store.overrides(PlaybackScope::queue());
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_TRUE(entries.count("/Music/Song.mp3") == 1);
    ASSERT_TRUE(entries.count("/music/song.mp3") == 0);

    // Same effective level: caches stay valid
    ASSERT_EQ(store.revision(), before);

    // The rewrite reaches disk on the next flush
    ASSERT_TRUE(store.flush());
    auto doc = read_json(file);
    ASSERT_EQ(doc["queueLevels"]["/Music/Song.mp3"].get<int>(), 3);
    ASSERT_FALSE(doc["queueLevels"].contains("/music/song.mp3"));
}

TEST_CASE(test_find_level_prefers_canonical) {
    WeightStore::LevelMap map = {{"/Music/Song.mp3", 2}, {"/music/song.mp3", 4}};
    auto hit = WeightStore::find_level(map, {"/Music/Song.mp3", "/music/song.mp3"});
    ASSERT_TRUE(hit.has_value());
    ASSERT_EQ(hit->level, 2);
    ASSERT_EQ(hit->matched_key, std::string("/Music/Song.mp3"));

    ASSERT_FALSE(WeightStore::migrate_entry(map, *hit, "/Music/Song.mp3"));
}

TEST_CASE(test_load_normalizes_entries) {
    TempDir dir("weights_normalize");
    auto file = dir / "weights.json";
    write_text(file, R"({
        "version": 1,
        "queueLevels": {"/Music/./a.mp3": 2, "/Music/b.mp3": 0, "/Music/c.mp3": 9, "/Music/d.mp3": "loud"},
        "playlistLevels": {"mix": {"/Music/a.mp3": 1}, "empty": {}, "broken": 3}
    })");

    WeightStore store(file, MANUAL_SAVE);
    ASSERT_TRUE(store.load());

    auto queue = PlaybackScope::queue();
    ASSERT_EQ(store.entry_count(queue), 2u);
    ASSERT_TRUE(store.level("/Music/a.mp3", queue) == WeightLevel::Purple);
    ASSERT_TRUE(store.level("/Music/c.mp3", queue) == WeightLevel::Red);
    ASSERT_TRUE(store.level("/Music/d.mp3", queue) == WeightLevel::Green);
    ASSERT_TRUE(store.level("/Music/a.mp3", PlaybackScope::playlist("mix")) == WeightLevel::Blue);
    ASSERT_EQ(store.entry_count(PlaybackScope::playlist("empty")), 0u);
}

TEST_CASE(test_load_clamps_levels_beyond_int_range) {
    TempDir dir("weights_wide");
    auto file = dir / "weights.json";
    write_text(file, R"({
        "version": 1,
        "queueLevels": {
            "/Music/a.mp3": 4294967297,
            "/Music/b.mp3": 18446744073709551615,
            "/Music/c.mp3": -4294967295
        },
        "playlistLevels": {}
    })");

    WeightStore store(file, MANUAL_SAVE);
    ASSERT_TRUE(store.load());

    auto queue = PlaybackScope::queue();
    ASSERT_TRUE(store.level("/Music/a.mp3", queue) == WeightLevel::Red);
    ASSERT_TRUE(store.level("/Music/b.mp3", queue) == WeightLevel::Red);
    ASSERT_TRUE(store.level("/Music/c.mp3", queue) == WeightLevel::Green);
    ASSERT_EQ(store.entry_count(queue), 2u);

    // Out-of-range values are rewritten in range
    ASSERT_TRUE(store.flush());
    auto doc = read_json(file);
    ASSERT_EQ(doc["queueLevels"]["/Music/a.mp3"].get<int>(), 4);
    ASSERT_EQ(doc["queueLevels"]["/Music/b.mp3"].get<int>(), 4);
    ASSERT_FALSE(doc["queueLevels"].contains("/Music/c.mp3"));
}

TEST_CASE(test_corrupt_file_falls_back_to_defaults) {
    TempDir dir("weights_corrupt");
    auto file = dir / "weights.json";
    write_text(file, "{ not json");

    WeightStore store(file, MANUAL_SAVE);
    ASSERT_FALSE(store.load());
    ASSERT_EQ(store.entry_count(PlaybackScope::queue()), 0u);

    // Still usable, and the next save replaces the corrupt document
    store.set_level(2, "/Music/a.mp3", PlaybackScope::queue());
    ASSERT_TRUE(store.flush());
    auto doc = read_json(file);
    ASSERT_FALSE(doc.is_discarded());
    ASSERT_EQ(doc["version"].get<int>(), WeightStore::FORMAT_VERSION);
}

TEST_CASE(test_foreign_version_is_ignored) {
    TempDir dir("weights_version");
    auto file = dir / "weights.json";
    write_text(file, R"({"version":2,"queueLevels":{"/Music/a.mp3":4}})");

    WeightStore store(file, MANUAL_SAVE);
    ASSERT_FALSE(store.load());
    ASSERT_TRUE(store.level("/Music/a.mp3", PlaybackScope::queue()) == WeightLevel::Green);
}

TEST_CASE(test_missing_file_loads_empty) {
    TempDir dir("weights_missing");
    WeightStore store(dir / "absent.json", MANUAL_SAVE);
    ASSERT_FALSE(store.load());
    ASSERT_EQ(store.entry_count(PlaybackScope::queue()), 0u);
}

TEST_CASE(test_persistence_round_trip) {
    TempDir dir("weights_round_trip");
    auto file = dir / "weights.json";
    {
        WeightStore store(file, MANUAL_SAVE);
        store.set_level(4, "/Music/a.mp3", PlaybackScope::queue());
        store.set_level(2, "/Music/b.mp3", PlaybackScope::playlist("mix"));
        ASSERT_TRUE(store.flush());
    }

    WeightStore reloaded(file, MANUAL_SAVE);
    ASSERT_TRUE(reloaded.load());
    ASSERT_TRUE(reloaded.level("/Music/a.mp3", PlaybackScope::queue()) == WeightLevel::Red);
    ASSERT_TRUE(reloaded.level("/Music/b.mp3", PlaybackScope::playlist("mix")) == WeightLevel::Purple);
}

TEST_CASE(test_destructor_flushes_pending_writes) {
    TempDir dir("weights_dtor");
    auto file = dir / "weights.json";
    {
        WeightStore store(file, MANUAL_SAVE);
        store.set_level(3, "/Music/a.mp3", PlaybackScope::queue());
    }
    auto doc = read_json(file);
    ASSERT_EQ(doc["queueLevels"]["/Music/a.mp3"].get<int>(), 3);
}

TEST_CASE(test_debounced_save_reaches_disk) {
    TempDir dir("weights_debounce");
    auto file = dir / "weights.json";
    WeightStore store(file, std::chrono::milliseconds(10));
    store.set_level(1, "/Music/a.mp3", PlaybackScope::queue());

    for (int i = 0; i < 200 && !std::filesystem::exists(file); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(std::filesystem::exists(file));
}

TEST_CASE(test_clear_writes_immediately) {
    TempDir dir("weights_clear");
    auto file = dir / "weights.json";
    WeightStore store(file, MANUAL_SAVE);
    store.set_level(3, "/Music/a.mp3", PlaybackScope::queue());
    store.set_level(3, "/Music/a.mp3", PlaybackScope::playlist("mix"));
    ASSERT_TRUE(store.flush());

    ASSERT_TRUE(store.clear(PlaybackScope::queue()).changed);
    auto doc = read_json(file);
    ASSERT_TRUE(doc["queueLevels"].empty());
    ASSERT_TRUE(doc["playlistLevels"].contains("mix"));

    ASSERT_TRUE(store.clear_all().changed);
    doc = read_json(file);
    ASSERT_TRUE(doc["playlistLevels"].empty());
    ASSERT_FALSE(store.clear_all().changed);
}

TEST_CASE(test_sync_overrides_to_queue) {
    TempDir dir("weights_sync");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    auto queue = PlaybackScope::queue();
    auto mix = PlaybackScope::playlist("mix");

    store.set_level(3, "/Music/a.mp3", mix);
    store.set_level(2, "/Music/c.mp3", mix);
    store.set_level(1, "/Music/a.mp3", queue);
    store.set_level(2, "/Music/b.mp3", queue);
    store.set_level(2, "/Music/c.mp3", queue);

    auto result = store.sync_overrides_to_queue("mix");
    ASSERT_EQ(result.total, 2u);
    ASSERT_EQ(result.changed, 1u);
    ASSERT_TRUE(store.level("/Music/a.mp3", queue) == WeightLevel::Gold);
    // Default in the playlist: queue value untouched
    ASSERT_TRUE(store.level("/Music/b.mp3", queue) == WeightLevel::Purple);

    auto again = store.sync_overrides_to_queue("mix");
    ASSERT_EQ(again.changed, 0u);

    auto missing = store.sync_overrides_to_queue("nope");
    ASSERT_EQ(missing.total, 0u);
}

TEST_CASE(test_remove_track_and_playlist) {
    TempDir dir("weights_remove");
    WeightStore store(dir / "weights.json", MANUAL_SAVE);
    auto mix = PlaybackScope::playlist("mix");

    store.set_level(3, "/Music/a.mp3", mix);
    store.set_level(3, "/Music/b.mp3", mix);
    store.set_level(3, "/Music/a.mp3", PlaybackScope::queue());

    ASSERT_TRUE(store.remove_track("/Music/a.mp3", "mix").changed);
    ASSERT_FALSE(store.remove_track("/Music/a.mp3", "mix").changed);
    ASSERT_EQ(store.entry_count(mix), 1u);
    ASSERT_TRUE(store.level("/Music/a.mp3", PlaybackScope::queue()) == WeightLevel::Gold);

    ASSERT_TRUE(store.remove_playlist("mix").changed);
    ASSERT_EQ(store.entry_count(mix), 0u);
    ASSERT_FALSE(store.remove_playlist("mix").changed);
}

TEST_CASE(test_save_failure_raises_alert) {
    TempDir dir("weights_failure");
    // A regular file where the parent directory should be
    write_text(dir / "blocker", "x");

    std::vector<Alert> alerts;
    WeightStore store(dir / "blocker" / "weights.json", MANUAL_SAVE,
                      [&alerts](const Alert& alert) { alerts.push_back(alert); });

    store.set_level(4, "/Music/a.mp3", PlaybackScope::queue());
    ASSERT_FALSE(store.flush());
    ASSERT_EQ(alerts.size(), 1u);
    ASSERT_EQ(alerts[0].level, std::string("warn"));
    ASSERT_EQ(alerts[0].message, std::string("Failed to save playback weights"));

    // In-memory state stays authoritative
    ASSERT_TRUE(store.level("/Music/a.mp3", PlaybackScope::queue()) == WeightLevel::Red);
}

int main() {
    return cadenza::test::TestRunner::instance().run_all();
}
