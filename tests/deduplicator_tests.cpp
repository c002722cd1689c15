#include <gtest/gtest.h>
#include <algorithm>
#include "engine/deduplicator.hpp"

using namespace reclaim::engine;

namespace {
    bool contains_path(const std::vector<ScanItem>& items, const std::filesystem::path& path) {
        return std::any_of(items.begin(), items.end(),
                           [&](const ScanItem& item) { return item.path == path; });
    }
}

TEST(Deduplicator, KeepsShallowestOfNestedCandidates) {
    std::vector<ScanItem> candidates = {
        make_item("/home/u/app/node_modules/pkg/.cache", Category::SystemCache, 100, true),
        make_item("/home/u/app/node_modules", Category::NodeModules, 5000, true),
        make_item("/home/u/.cache", Category::SystemCache, 700, true),
    };

    auto items = Deduplicator::dedupe(candidates);

    ASSERT_EQ(items.size(), 2u);
    EXPECT_TRUE(contains_path(items, "/home/u/app/node_modules"));
    EXPECT_TRUE(contains_path(items, "/home/u/.cache"));
    EXPECT_EQ(Deduplicator::total_size(items), 5700u);
}

TEST(Deduplicator, SiblingsWithSharedPrefixAreNotNested) {
    std::vector<ScanItem> candidates = {
        make_item("/data/build", Category::BuildOutput, 10, true),
        make_item("/data/build-old/x.log", Category::LogFile, 20, true),
    };

    auto items = Deduplicator::dedupe(candidates);
    EXPECT_EQ(items.size(), 2u);
}

TEST(Deduplicator, DropsExactDuplicatesAndTrailingSeparators) {
    std::vector<ScanItem> candidates = {
        make_item("/srv/cache/", Category::SystemCache, 10, true),
        make_item("/srv/cache", Category::SystemCache, 10, true),
    };

    auto items = Deduplicator::dedupe(candidates);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(Deduplicator::total_size(items), 10u);
}

TEST(Deduplicator, IsIdempotent) {
    std::vector<ScanItem> candidates = {
        make_item("/a/b/c", Category::TempFile, 1, true),
        make_item("/a/b", Category::BuildOutput, 2, true),
        make_item("/a/d", Category::LogFile, 3, true),
        make_item("/e", Category::SystemCache, 4, true),
    };

    auto once = Deduplicator::dedupe(candidates);
    auto twice = Deduplicator::dedupe(once);

    ASSERT_EQ(once.size(), twice.size());
    for (const auto& item : once) {
        EXPECT_TRUE(contains_path(twice, item.path)) << item.path;
    }
}

TEST(Deduplicator, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(Deduplicator::dedupe({}).empty());
    EXPECT_EQ(Deduplicator::total_size({}), 0u);
}
