/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SettingsManagerTests
// First include, so the header has to compile on its own
#include "managers/SettingsManager.hpp"
#include <boost/test/unit_test.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace TickGuard;

struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_tickguard_settings.json";
    SettingsManager settings;

    SettingsTestFixture() {
        std::filesystem::create_directories("tests/test_data");
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    settings.set("redstone", "soft_threshold", 80);
    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "soft_threshold", 0), 80);

    // Default when the key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetDouble) {
    settings.set("explosions", "group_radius", 1.5);
    BOOST_CHECK_CLOSE(settings.get<double>("explosions", "group_radius", 0.0), 1.5, 0.001);

    BOOST_CHECK_CLOSE(settings.get<double>("explosions", "nonexistent", 2.0), 2.0, 0.001);
}

BOOST_AUTO_TEST_CASE(TestIntSatisfiesDoubleRequest) {
    settings.set("entity_ai", "dab_start_distance", 12);
    BOOST_CHECK_CLOSE(settings.get<double>("entity_ai", "dab_start_distance", 0.0), 12.0, 0.001);
}

BOOST_AUTO_TEST_CASE(TestGetSetBool) {
    settings.set("coalescer", "enabled", true);
    BOOST_CHECK_EQUAL(settings.get<bool>("coalescer", "enabled", false), true);

    settings.set("coalescer", "enabled", false);
    BOOST_CHECK_EQUAL(settings.get<bool>("coalescer", "enabled", true), false);
}

BOOST_AUTO_TEST_CASE(TestGetSetString) {
    settings.set("demo", "world", std::string("flat"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "world", ""), "flat");

    settings.set("demo", "seed", "abc");
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "seed", ""), "abc");

    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "nonexistent", "default"), "default");
}

BOOST_AUTO_TEST_CASE(TestHasLooksAtCategoryAndKey) {
    settings.set("observer", "min_interval_ticks", 4);

    BOOST_CHECK(settings.has("observer", "min_interval_ticks"));
    BOOST_CHECK(!settings.has("observer", "stale_window_ticks"));
    BOOST_CHECK(!settings.has("redstone", "min_interval_ticks"));
}

BOOST_AUTO_TEST_CASE(TestRemoveDropsEmptyCategory) {
    settings.set("mob_spawning", "threads", 2);
    settings.set("mob_spawning", "max_per_chunk", 30);

    BOOST_CHECK(settings.remove("mob_spawning", "threads"));
    BOOST_CHECK(!settings.has("mob_spawning", "threads"));
    BOOST_CHECK(settings.has("mob_spawning", "max_per_chunk"));
    BOOST_CHECK(!settings.remove("mob_spawning", "queue_capacity"));

    BOOST_CHECK(settings.remove("mob_spawning", "max_per_chunk"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestClearAllForgetsEverything) {
    BOOST_REQUIRE(settings.loadFromFile("res/tickguard.json"));
    BOOST_CHECK(!settings.getCategories().empty());

    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "soft_threshold", -1), -1);
}

BOOST_AUTO_TEST_CASE(TestGetCategoriesAndKeys) {
    settings.set("redstone", "enabled", true);
    settings.set("observer", "enabled", true);
    settings.set("hopper", "capacity", 4096);
    settings.set("hopper", "max_age_ticks", 6000);

    auto categories = settings.getCategories();
    std::sort(categories.begin(), categories.end());
    BOOST_REQUIRE_EQUAL(categories.size(), 3);
    BOOST_CHECK_EQUAL(categories[0], "hopper");
    BOOST_CHECK_EQUAL(categories[1], "observer");
    BOOST_CHECK_EQUAL(categories[2], "redstone");

    BOOST_CHECK_EQUAL(settings.getKeys("hopper").size(), 2);
    BOOST_CHECK_EQUAL(settings.getKeys("nonexistent").size(), 0);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
  "redstone": {
    "soft_threshold": 70,
    "alert_admins": false
  },
  "explosions": {
    "group_radius": 2.5
  },
  "demo": {
    "world": "flat"
  }
})");

    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "soft_threshold", 0), 70);
    BOOST_CHECK_EQUAL(settings.get<bool>("redstone", "alert_admins", true), false);
    BOOST_CHECK_CLOSE(settings.get<double>("explosions", "group_radius", 0.0), 2.5, 0.001);
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "world", ""), "flat");
}

BOOST_AUTO_TEST_CASE(TestLoadMergesOverExisting) {
    settings.set("redstone", "hard_threshold", 150);
    BOOST_CHECK(settings.loadFromString(R"({"redstone": {"soft_threshold": 10}})"));

    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "soft_threshold", 0), 10);
    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "hard_threshold", 0), 150);
}

BOOST_AUTO_TEST_CASE(TestNestedValuesSkipped) {
    BOOST_CHECK(settings.loadFromString(
        R"({"redstone": {"enabled": true, "nested": {"a": 1}, "list": [1, 2]}, "bare": 5})"));

    BOOST_CHECK(settings.has("redstone", "enabled"));
    BOOST_CHECK(!settings.has("redstone", "nested"));
    BOOST_CHECK(!settings.has("redstone", "list"));
    BOOST_CHECK(settings.getKeys("bare").empty());
}

BOOST_AUTO_TEST_CASE(TestShippedConfigLoads) {
    // Tests run from the source tree
    BOOST_REQUIRE(settings.loadFromFile("res/tickguard.json"));
    BOOST_CHECK_EQUAL(settings.get<int>("redstone", "critical_threshold", 0), 300);
    BOOST_CHECK_EQUAL(settings.get<int>("monitoring", "report_interval_ticks", 0), 6000);
    BOOST_CHECK_CLOSE(settings.get<double>("explosions", "group_radius", 0.0), 1.0, 0.001);
}

BOOST_AUTO_TEST_CASE(TestConcurrentWriters) {
    const int numThreads = 10;
    const int operationsPerThread = 100;

    std::vector<std::thread> threads;
    std::atomic<int> missing{0};

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([this, t, &missing, count = operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                std::string category = "pool" + std::to_string(t);
                std::string key = "chunk_" + std::to_string(i);

                settings.set(category, key, i * t);
                if (settings.get<int>(category, key, -1) == -1 || !settings.has(category, key)) {
                    missing.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(missing.load(), 0);
    for (int t = 0; t < numThreads; ++t) {
        BOOST_CHECK_EQUAL(settings.getKeys("pool" + std::to_string(t)).size(),
                          static_cast<size_t>(operationsPerThread));
    }
}

BOOST_AUTO_TEST_CASE(TestRejectedDocuments) {
    BOOST_CHECK(!settings.loadFromFile("res/missing_tickguard.json"));

    createTestFile(R"({ redstone: { "enabled": true } })");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    // Valid JSON whose root isn't an object
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
}

BOOST_AUTO_TEST_CASE(TestTryGetSeparatesMissingFromMistyped) {
    settings.set("redstone", "soft_threshold", 64);
    settings.set("redstone", "label", "lots");

    BOOST_CHECK_EQUAL(settings.tryGet<int>("redstone", "soft_threshold").value_or(-1), 64);
    BOOST_CHECK_CLOSE(settings.tryGet<double>("redstone", "soft_threshold").value_or(-1.0), 64.0, 0.001);
    BOOST_CHECK(!settings.tryGet<int>("redstone", "label").has_value());
    BOOST_CHECK(settings.has("redstone", "label"));
    BOOST_CHECK(!settings.tryGet<int>("redstone", "hard_threshold").has_value());
    BOOST_CHECK(!settings.has("redstone", "hard_threshold"));
}

BOOST_AUTO_TEST_CASE(TestWrongTypeFallsBackToDefault) {
    settings.set("entity_tracker", "queue_capacity", 4096);

    BOOST_CHECK_EQUAL(settings.get<bool>("entity_tracker", "queue_capacity", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("entity_tracker", "queue_capacity", "none"), "none");

    // A double never narrows to int
    settings.set("entity_tracker", "threads", 2.5);
    BOOST_CHECK_EQUAL(settings.get<int>("entity_tracker", "threads", 7), 7);
}

BOOST_AUTO_TEST_SUITE_END()
