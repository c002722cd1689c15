#include <gtest/gtest.h>
#include "engine/scan_cache.hpp"
#include "engine/serialize.hpp"
#include "test_support.hpp"

using namespace reclaim::engine;
using reclaim::test::TempDir;
using reclaim::test::write_text;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
    ScanResult sample_result() {
        ScanResult result;
        result.items = {
            make_item("/home/u/.cache/thumbnails", Category::SystemCache, 4096, true, "Cache directory: thumbnails"),
            make_item("/home/u/app/node_modules", Category::NodeModules, 8192, true, "node_modules directory"),
        };
        result.total_size_bytes = 12288;
        result.duplicate_groups["abc123"] = {"/home/u/a.iso", "/home/u/b.iso"};
        result.generated_at = Clock::now();
        result.speed = ScanSpeed::Quick;
        result.warnings = {"Cannot read directory /home/u/secret: Permission denied"};
        return result;
    }

    CacheEntry entry_at(Clock::time_point created_at, std::string key = {}) {
        CacheEntry entry;
        entry.scan_result = sample_result();
        entry.created_at = created_at;
        entry.config_key = std::move(key);
        return entry;
    }
}

TEST(ScanCache, FreshEntryIsServed) {
    TempDir tmp("cache_fresh");
    ScanCache cache(tmp / "last-scan.json");
    const auto now = Clock::now();
    ASSERT_TRUE(cache.save(entry_at(now - 59min)));

    auto loaded = cache.load({}, now);
    ASSERT_TRUE(loaded.has_value());

    const auto& result = loaded->scan_result;
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[1].path, fs::path("/home/u/app/node_modules"));
    EXPECT_EQ(result.items[1].category, Category::NodeModules);
    EXPECT_EQ(result.items[1].risk, Risk::Moderate);
    EXPECT_EQ(result.total_size_bytes, 12288u);
    EXPECT_EQ(result.speed, ScanSpeed::Quick);
    EXPECT_EQ(result.duplicate_groups.at("abc123").size(), 2u);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(ScanCache, StaleEntryIsAMiss) {
    TempDir tmp("cache_stale");
    ScanCache cache(tmp / "last-scan.json");
    const auto now = Clock::now();
    ASSERT_TRUE(cache.save(entry_at(now - 61min)));

    EXPECT_FALSE(cache.load({}, now).has_value());
    // The entry is still on disk and its age readable.
    auto age = cache.age(now);
    ASSERT_TRUE(age.has_value());
    EXPECT_GE(age->count(), 61 * 60);
}

TEST(ScanCache, FarFutureEntryIsAMiss) {
    TempDir tmp("cache_future");
    ScanCache cache(tmp / "last-scan.json");
    const auto now = Clock::now();
    ASSERT_TRUE(cache.save(entry_at(now + 10min)));

    EXPECT_FALSE(cache.load({}, now).has_value());
}

TEST(ScanCache, MissingOrCorruptFileIsAMiss) {
    TempDir tmp("cache_corrupt");
    ScanCache cache(tmp / "last-scan.json");
    EXPECT_FALSE(cache.load().has_value());
    EXPECT_FALSE(cache.age().has_value());

    write_text(cache.file(), "{\"version\": 1, \"created_at\": ");
    EXPECT_FALSE(cache.load().has_value());

    write_text(cache.file(), "[1, 2, 3]");
    EXPECT_FALSE(cache.load().has_value());
}

TEST(ScanCache, UnknownCategoryIsAMiss) {
    TempDir tmp("cache_unknown");
    ScanCache cache(tmp / "last-scan.json");
    const auto created = to_unix_seconds(Clock::now());
    write_text(cache.file(),
               "{\"version\":1,\"created_at\":" + std::to_string(created) +
               ",\"config_key\":\"\",\"scan_result\":{\"items\":[{\"path\":\"/x\",\"category\":\"mystery\","
               "\"risk\":\"safe\",\"size_bytes\":1}],\"total_size_bytes\":1,\"generated_at\":" +
               std::to_string(created) + "}}");

    EXPECT_FALSE(cache.load().has_value());
}

TEST(ScanCache, ReaderToleratesExtraFieldsAndRederivesRisk) {
    TempDir tmp("cache_extra");
    ScanCache cache(tmp / "last-scan.json");
    const auto created = to_unix_seconds(Clock::now());
    write_text(cache.file(),
               "{\"version\":2,\"host\":\"box\",\"created_at\":" + std::to_string(created) +
               ",\"config_key\":\"k\",\"scan_result\":{\"items\":[{\"path\":\"/x/.cache\",\"category\":\"system_cache\","
               "\"risk\":\"risky\",\"size_bytes\":7,\"owner\":\"me\"}],\"total_size_bytes\":7,\"generated_at\":" +
               std::to_string(created) + "}}");

    auto loaded = cache.load("k");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->scan_result.items.size(), 1u);
    EXPECT_EQ(loaded->scan_result.items[0].risk, Risk::Safe);
}

TEST(ScanCache, GatedItemWithoutValidatedFlagIsAMiss) {
    TempDir tmp("cache_validated");
    ScanCache cache(tmp / "last-scan.json");
    const auto created = std::to_string(to_unix_seconds(Clock::now()));
    const auto entry_with = [&created](const std::string& item) {
        return "{\"version\":1,\"created_at\":" + created +
               ",\"config_key\":\"\",\"scan_result\":{\"items\":[" + item +
               "],\"total_size_bytes\":9,\"generated_at\":" + created + "}}";
    };

    write_text(cache.file(), entry_with("{\"path\":\"/p/node_modules\",\"category\":\"node_modules\",\"size_bytes\":9}"));
    EXPECT_FALSE(cache.load().has_value());

    write_text(cache.file(), entry_with("{\"path\":\"/p/node_modules\",\"category\":\"node_modules\","
                                        "\"size_bytes\":9,\"validated\":false}"));
    EXPECT_FALSE(cache.load().has_value());

    write_text(cache.file(), entry_with("{\"path\":\"/p/.cache\",\"category\":\"system_cache\",\"size_bytes\":9}"));
    auto loaded = cache.load();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->scan_result.items.size(), 1u);
    EXPECT_TRUE(loaded->scan_result.items[0].validated);
}

TEST(ScanCache, DifferentConfigKeyIsAMiss) {
    TempDir tmp("cache_key");
    ScanCache cache(tmp / "last-scan.json");

    ScanConfig quick;
    quick.roots = {"/home/u"};
    quick.speed = ScanSpeed::Quick;
    ScanConfig thorough = quick;
    thorough.speed = ScanSpeed::Thorough;

    const auto quick_key = ScanCache::config_key(quick);
    EXPECT_NE(quick_key, ScanCache::config_key(thorough));
    EXPECT_EQ(quick_key, ScanCache::config_key(quick));

    ASSERT_TRUE(cache.save(sample_result(), quick_key));
    EXPECT_TRUE(cache.load(quick_key).has_value());
    EXPECT_FALSE(cache.load(ScanCache::config_key(thorough)).has_value());
    // An empty key accepts any entry.
    EXPECT_TRUE(cache.load().has_value());
}

TEST(ScanCache, ConfigKeyIgnoresRootSpellingAndOrder) {
    ScanConfig a;
    a.roots = {"/home/u/projects/", "/home/u/Downloads"};
    ScanConfig b;
    b.roots = {"/home/u/Downloads", "/home/u/./projects"};

    EXPECT_EQ(ScanCache::config_key(a), ScanCache::config_key(b));
}

TEST(ScanCache, SaveReplacesAtomically) {
    TempDir tmp("cache_atomic");
    ScanCache cache(tmp / "nested" / "last-scan.json");
    ASSERT_TRUE(cache.save(sample_result(), "first"));
    ASSERT_TRUE(cache.save(sample_result(), "second"));

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(tmp / "nested")) {
        EXPECT_EQ(entry.path().filename(), "last-scan.json");
        ++entries;
    }
    EXPECT_EQ(entries, 1u);

    auto loaded = cache.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->config_key, "second");
}

TEST(ScanCache, InvalidateRemovesEntry) {
    TempDir tmp("cache_invalidate");
    ScanCache cache(tmp / "last-scan.json");
    ASSERT_TRUE(cache.save(sample_result()));
    ASSERT_TRUE(cache.load().has_value());

    EXPECT_TRUE(cache.invalidate());
    EXPECT_FALSE(fs::exists(cache.file()));
    EXPECT_FALSE(cache.load().has_value());
    // Removing an absent entry is not an error.
    EXPECT_TRUE(cache.invalidate());
}

TEST(CleanReportJson, SummarizesOutcomes) {
    CleanReport report;
    report.attempted.push_back({make_item("/a", Category::TempFile, 5, true), {CleanOutcome::Status::Cleaned, {}}});
    report.attempted.push_back({make_item("/b", Category::LogFile, 9, true),
                                {CleanOutcome::Status::Failed, "path no longer exists"}});
    report.bytes_freed = 5;

    nlohmann::json j = report;
    EXPECT_EQ(j.at("bytes_freed").get<std::uintmax_t>(), 5u);
    EXPECT_EQ(j.at("cleaned").get<std::size_t>(), 1u);
    EXPECT_EQ(j.at("failed").get<std::size_t>(), 1u);
    ASSERT_EQ(j.at("attempted").size(), 2u);
    EXPECT_EQ(j.at("attempted")[1].at("outcome").get<std::string>(), "failed");
    EXPECT_EQ(j.at("attempted")[1].at("reason").get<std::string>(), "path no longer exists");
}
