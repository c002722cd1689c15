#include <gtest/gtest.h>
#include "engine/config.hpp"
#include "test_support.hpp"

using namespace reclaim::engine;
using reclaim::test::TempDir;
using reclaim::test::write_text;

TEST(Config, MissingFileGivesDefaults) {
    TempDir tmp("config_missing");
    auto cfg = Config::load(tmp / "config.json");

    EXPECT_EQ(cfg.speed, ScanSpeed::Normal);
    EXPECT_EQ(cfg.min_large_file_mb, 100u);
    EXPECT_EQ(cfg.min_candidate_kb, 1024u);
    EXPECT_TRUE(cfg.skip_system);
    EXPECT_TRUE(cfg.use_digest_index);
    EXPECT_TRUE(cfg.digest_index_path.empty());
    EXPECT_TRUE(cfg.extra_protected_paths.empty());
}

TEST(Config, ReadsPartialFile) {
    TempDir tmp("config_partial");
    write_text(tmp / "config.json",
               "{\"speed\": \"thorough\", \"min_large_file_mb\": 0, \"workers\": 3,"
               " \"extra_protected_paths\": [\"/home/u/keep\"]}");

    auto cfg = Config::load(tmp / "config.json");
    EXPECT_EQ(cfg.speed, ScanSpeed::Thorough);
    EXPECT_EQ(cfg.min_large_file_mb, 0u);
    EXPECT_EQ(cfg.workers, 3u);
    EXPECT_EQ(cfg.min_log_mb, 10u);
    ASSERT_EQ(cfg.extra_protected_paths.size(), 1u);
    EXPECT_EQ(cfg.extra_protected_paths[0], "/home/u/keep");
}

TEST(Config, MalformedFileGivesDefaults) {
    TempDir tmp("config_bad");
    write_text(tmp / "config.json", "{\"speed\": ");
    EXPECT_EQ(Config::load(tmp / "config.json").speed, ScanSpeed::Normal);

    write_text(tmp / "config.json", "{\"workers\": \"many\"}");
    EXPECT_EQ(Config::load(tmp / "config.json").workers, 0u);
}

TEST(Config, SaveThenLoadKeepsValues) {
    TempDir tmp("config_save");
    Config cfg;
    cfg.speed = ScanSpeed::Quick;
    cfg.min_duplicate_kb = 64;
    cfg.skip_system = false;
    cfg.use_digest_index = false;
    cfg.digest_index_path = "/var/tmp/digests.db";
    cfg.extra_protected_paths = {"/srv/data"};
    ASSERT_TRUE(cfg.save(tmp / "config.json"));

    auto loaded = Config::load(tmp / "config.json");
    EXPECT_EQ(loaded.speed, ScanSpeed::Quick);
    EXPECT_EQ(loaded.min_duplicate_kb, 64u);
    EXPECT_FALSE(loaded.skip_system);
    EXPECT_FALSE(loaded.use_digest_index);
    EXPECT_EQ(loaded.digest_index_path, "/var/tmp/digests.db");
    EXPECT_EQ(loaded.extra_protected_paths, cfg.extra_protected_paths);
}

TEST(Config, BuildsScanConfigInBytes) {
    Config cfg;
    cfg.speed = ScanSpeed::Quick;
    cfg.min_large_file_mb = 2;
    cfg.min_candidate_kb = 3;
    cfg.min_log_mb = 4;
    cfg.min_duplicate_kb = 5;
    cfg.workers = 6;
    cfg.extra_protected_paths = {"/srv/data"};

    auto sc = cfg.to_scan_config({"/home/u/projects"}, true);
    ASSERT_EQ(sc.roots.size(), 1u);
    EXPECT_EQ(sc.roots[0], std::filesystem::path("/home/u/projects"));
    EXPECT_EQ(sc.effective_depth(), std::optional<std::uint32_t>(3));
    EXPECT_EQ(sc.min_large_file_size, 2u * 1024 * 1024);
    EXPECT_EQ(sc.min_candidate_size, 3u * 1024);
    EXPECT_EQ(sc.min_log_size, 4u * 1024 * 1024);
    EXPECT_EQ(sc.min_duplicate_size, 5u * 1024);
    EXPECT_EQ(sc.workers, 6u);
    EXPECT_TRUE(sc.find_duplicates);
    ASSERT_EQ(sc.extra_protected_paths.size(), 1u);
}

TEST(Config, EffectiveDepthFollowsSpeedUnlessOverridden) {
    ScanConfig sc;
    sc.speed = ScanSpeed::Normal;
    EXPECT_EQ(sc.effective_depth(), std::optional<std::uint32_t>(6));
    sc.speed = ScanSpeed::Thorough;
    EXPECT_FALSE(sc.effective_depth().has_value());
    sc.max_depth = 2;
    EXPECT_EQ(sc.effective_depth(), std::optional<std::uint32_t>(2));
}
