#include <gtest/gtest.h>
#include <algorithm>
#include "engine/scan_engine.hpp"
#include "test_support.hpp"

using namespace reclaim::engine;
using reclaim::test::TempDir;
using reclaim::test::write_file;
using reclaim::test::write_text;
namespace fs = std::filesystem;

namespace {
    const ScanItem* find_item(const ScanResult& result, const fs::path& path) {
        auto it = std::find_if(result.items.begin(), result.items.end(),
                               [&](const ScanItem& item) { return item.path == path; });
        return it == result.items.end() ? nullptr : &*it;
    }
}

TEST(ScanEngine, ReportsNodeModulesOnceWithFullSize) {
    TempDir tmp("engine_scenario");
    const fs::path project = tmp / "project";
    write_text(project / "package.json", "{\"name\": \"demo\"}");

    // 50 files, 10 MiB in total, spread over a few subdirectories.
    const std::uintmax_t total = 10ull * 1024 * 1024;
    const std::uintmax_t each = total / 50;
    for (int i = 0; i < 50; ++i) {
        const std::uintmax_t size = i == 49 ? total - each * 49 : each;
        write_file(project / "node_modules" / ("pkg" + std::to_string(i % 5)) / ("f" + std::to_string(i) + ".js"), size);
    }
    write_file(project / "src" / "a.log", 1024);

    ScanConfig config;
    config.roots = {project};
    config.workers = 4;

    ScanEngine engine;
    auto result = engine.scan(config);

    ASSERT_EQ(result.items.size(), 1u);
    const auto& item = result.items.front();
    EXPECT_EQ(item.path, project / "node_modules");
    EXPECT_EQ(item.category, Category::NodeModules);
    EXPECT_EQ(item.risk, Risk::Moderate);
    EXPECT_TRUE(item.validated);
    EXPECT_EQ(item.size_bytes, total);
    EXPECT_EQ(result.total_size_bytes, total);
    EXPECT_EQ(engine.state(), ScanEngine::State::Complete);
}

TEST(ScanEngine, NestedRootsAreNotCountedTwice) {
    TempDir tmp("engine_nested");
    write_file(tmp / "work" / "old_cache" / "blob", 4000);
    write_file(tmp / "work" / "old_cache" / "inner_cache" / "more", 1000);

    // Walking old_cache as its own root surfaces inner_cache, which already counts toward old_cache.
    ScanConfig config;
    config.roots = {tmp / "work", tmp / "work" / "old_cache"};
    config.min_candidate_size = 0;
    config.workers = 2;

    ScanEngine engine;
    auto result = engine.scan(config);

    ASSERT_NE(find_item(result, tmp / "work" / "old_cache"), nullptr);
    EXPECT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.total_size_bytes, 5000u);
}

TEST(ScanEngine, TotalIsSumOfItems) {
    TempDir tmp("engine_total");
    write_file(tmp / "a_cache" / "x", 300);
    write_file(tmp / "b" / "trace.log", 200);
    write_file(tmp / "b" / "scratch.tmp", 100);

    ScanConfig config;
    config.roots = {tmp.path()};
    config.min_candidate_size = 0;
    config.min_log_size = 1;
    config.workers = 2;

    auto result = ScanEngine().scan(config);

    EXPECT_EQ(result.items.size(), 3u);
    EXPECT_EQ(result.total_size_bytes, 600u);
    EXPECT_EQ(result.speed, ScanSpeed::Normal);
    EXPECT_GT(result.generated_at.time_since_epoch().count(), 0);
}

TEST(ScanEngine, SurfacesDuplicateCopies) {
    TempDir tmp("engine_dupes");
    write_file(tmp / "a" / "photo.jpg", 3000, 'p');
    write_file(tmp / "b" / "photo.jpg", 3000, 'p');
    write_file(tmp / "c" / "photo copy.jpg", 3000, 'p');
    write_file(tmp / "c" / "other.jpg", 3000, 'o');

    ScanConfig config;
    config.roots = {tmp.path()};
    config.find_duplicates = true;
    config.min_duplicate_size = 1;
    config.workers = 3;

    auto result = ScanEngine().scan(config);

    ASSERT_EQ(result.duplicate_groups.size(), 1u);
    const auto& group = result.duplicate_groups.begin()->second;
    ASSERT_EQ(group.size(), 3u);
    EXPECT_EQ(group.front(), tmp / "a" / "photo.jpg");

    // The first copy is kept; the others become Risky items.
    EXPECT_EQ(find_item(result, tmp / "a" / "photo.jpg"), nullptr);
    const auto* second = find_item(result, tmp / "b" / "photo.jpg");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->category, Category::DuplicateFile);
    EXPECT_EQ(second->risk, Risk::Risky);
    EXPECT_EQ(second->size_bytes, 3000u);
    EXPECT_NE(find_item(result, tmp / "c" / "photo copy.jpg"), nullptr);
    EXPECT_EQ(find_item(result, tmp / "c" / "other.jpg"), nullptr);
    EXPECT_EQ(result.total_size_bytes, 6000u);
}

TEST(ScanEngine, DuplicatesAreOffByDefault) {
    TempDir tmp("engine_nodupes");
    write_file(tmp / "a.bin", 2048, 'd');
    write_file(tmp / "b.bin", 2048, 'd');

    ScanConfig config;
    config.roots = {tmp.path()};
    config.min_duplicate_size = 1;
    config.workers = 2;

    auto result = ScanEngine().scan(config);
    EXPECT_TRUE(result.duplicate_groups.empty());
    EXPECT_TRUE(result.items.empty());
}

TEST(ScanEngine, ThrowsWhenNoRootIsAccessible) {
    TempDir tmp("engine_noroot");
    ScanConfig config;
    config.roots = {tmp / "does-not-exist", "/proc"};
    config.workers = 1;

    ScanEngine engine;
    EXPECT_THROW(engine.scan(config), ScanError);
    EXPECT_EQ(engine.state(), ScanEngine::State::Idle);
}

TEST(ScanEngine, InaccessibleRootIsAWarningWhenAnotherWorks) {
    TempDir tmp("engine_partial");
    write_file(tmp / "ok" / "junk_cache" / "f", 10);

    ScanConfig config;
    config.roots = {tmp / "ok", tmp / "missing"};
    config.min_candidate_size = 0;
    config.workers = 2;

    auto result = ScanEngine().scan(config);
    EXPECT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(ScanEngine, StateNames) {
    EXPECT_STREQ(to_string(ScanEngine::State::Idle), "idle");
    EXPECT_STREQ(to_string(ScanEngine::State::Hashing), "hashing");
    EXPECT_STREQ(to_string(ScanEngine::State::Complete), "complete");
}
