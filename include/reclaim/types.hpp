#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reclaim::engine {

    using Clock = std::chrono::system_clock;

    enum class Category {
        SystemCache,
        BrowserCache,
        PackageCache,
        LogFile,
        TempFile,
        PythonArtifact,
        NodeModules,
        BuildOutput,
        RustTarget,
        JavaBuildCache,
        FrameworkCache,
        LargeFile,
        DuplicateFile
    };

    // Ordered: Safe < Moderate < Risky.
    enum class Risk {
        Safe = 0,
        Moderate = 1,
        Risky = 2
    };

    enum class ScanSpeed {
        Quick,    // depth 3
        Normal,   // depth 6
        Thorough  // unlimited
    };

    /**
     * @brief Static category -> risk mapping. Never overridden per item.
     */
    Risk risk_of(Category category);

    /**
     * @brief Categories whose generic directory names need a manifest check.
     */
    bool requires_validation(Category category);

    /**
     * @brief Default traversal depth for a speed; nullopt means unlimited.
     */
    std::optional<std::uint32_t> depth_for(ScanSpeed speed);

    const char* to_string(Category category);
    const char* to_string(Risk risk);
    const char* to_string(ScanSpeed speed);

    std::optional<Category> parse_category(const std::string& text);
    std::optional<Risk> parse_risk(const std::string& text);
    std::optional<ScanSpeed> parse_speed(const std::string& text);

    struct ScanItem {
        std::filesystem::path path;
        Category category = Category::SystemCache;
        Risk risk = Risk::Safe;
        std::uintmax_t size_bytes = 0;
        bool validated = false;
        std::string description;
    };

    /**
     * @brief Builds an item with its risk derived from the category.
     */
    ScanItem make_item(const std::filesystem::path& path, Category category,
                       std::uintmax_t size_bytes, bool validated, std::string description = {});

    using DuplicateGroups = std::map<std::string, std::vector<std::filesystem::path>>;

    struct ScanResult {
        std::vector<ScanItem> items;            // pairwise non-overlapping paths
        std::uintmax_t total_size_bytes = 0;
        DuplicateGroups duplicate_groups;       // digest -> paths (>= 2 each)
        Clock::time_point generated_at{};
        ScanSpeed speed = ScanSpeed::Normal;
        std::vector<std::string> warnings;      // soft traversal / hashing failures
    };

    struct CacheEntry {
        ScanResult scan_result;
        Clock::time_point created_at{};
        std::string config_key;
    };

    struct ScanConfig {
        std::vector<std::filesystem::path> roots;
        ScanSpeed speed = ScanSpeed::Normal;
        std::optional<std::uint32_t> max_depth;             // overrides speed
        std::uintmax_t min_large_file_size = 100ull * 1024 * 1024; // 0 disables
        bool find_duplicates = false;
        bool skip_system = true;
        std::uintmax_t min_candidate_size = 1024ull * 1024;
        std::uintmax_t min_log_size = 10ull * 1024 * 1024;
        std::uintmax_t min_duplicate_size = 1024ull * 1024;
        unsigned workers = 0;                               // 0 = host parallelism
        std::vector<std::filesystem::path> extra_protected_paths;

        std::optional<std::uint32_t> effective_depth() const {
            return max_depth ? max_depth : depth_for(speed);
        }
    };

    struct CleanOutcome {
        enum class Status {
            Cleaned,
            Failed,
            SkippedDryRun
        };

        Status status = Status::Failed;
        std::string reason; // only set for Failed
    };

    const char* to_string(CleanOutcome::Status status);

    struct CleanAttempt {
        ScanItem item;
        CleanOutcome outcome;
    };

    struct CleanReport {
        std::vector<CleanAttempt> attempted;
        std::uintmax_t bytes_freed = 0;

        std::size_t count(CleanOutcome::Status status) const;
    };

}
