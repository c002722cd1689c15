#include "reclaim/types.hpp"
#include <utility>

namespace reclaim::engine {

    namespace {
        struct CategoryName {
            Category category;
            const char* name;
        };

        constexpr CategoryName kCategoryNames[] = {
            {Category::SystemCache, "system_cache"},
            {Category::BrowserCache, "browser_cache"},
            {Category::PackageCache, "package_cache"},
            {Category::LogFile, "log_file"},
            {Category::TempFile, "temp_file"},
            {Category::PythonArtifact, "python_artifact"},
            {Category::NodeModules, "node_modules"},
            {Category::BuildOutput, "build_output"},
            {Category::RustTarget, "rust_target"},
            {Category::JavaBuildCache, "java_build_cache"},
            {Category::FrameworkCache, "framework_cache"},
            {Category::LargeFile, "large_file"},
            {Category::DuplicateFile, "duplicate_file"},
        };
    }

    Risk risk_of(Category category) {
        switch (category) {
            case Category::SystemCache:
            case Category::BrowserCache:
            case Category::PackageCache:
            case Category::LogFile:
            case Category::TempFile:
            case Category::PythonArtifact:
                return Risk::Safe;
            case Category::NodeModules:
            case Category::BuildOutput:
            case Category::RustTarget:
            case Category::JavaBuildCache:
            case Category::FrameworkCache:
                return Risk::Moderate;
            case Category::LargeFile:
            case Category::DuplicateFile:
                return Risk::Risky;
        }
        return Risk::Risky;
    }

    bool requires_validation(Category category) {
        return category == Category::NodeModules ||
               category == Category::BuildOutput ||
               category == Category::RustTarget;
    }

    std::optional<std::uint32_t> depth_for(ScanSpeed speed) {
        switch (speed) {
            case ScanSpeed::Quick: return 3;
            case ScanSpeed::Normal: return 6;
            case ScanSpeed::Thorough: return std::nullopt;
        }
        return std::nullopt;
    }

    const char* to_string(Category category) {
        for (const auto& entry : kCategoryNames) {
            if (entry.category == category) return entry.name;
        }
        return "unknown";
    }

    const char* to_string(Risk risk) {
        switch (risk) {
            case Risk::Safe: return "safe";
            case Risk::Moderate: return "moderate";
            case Risk::Risky: return "risky";
        }
        return "risky";
    }

    const char* to_string(ScanSpeed speed) {
        switch (speed) {
            case ScanSpeed::Quick: return "quick";
            case ScanSpeed::Normal: return "normal";
            case ScanSpeed::Thorough: return "thorough";
        }
        return "normal";
    }

    const char* to_string(CleanOutcome::Status status) {
        switch (status) {
            case CleanOutcome::Status::Cleaned: return "cleaned";
            case CleanOutcome::Status::Failed: return "failed";
            case CleanOutcome::Status::SkippedDryRun: return "skipped_dry_run";
        }
        return "failed";
    }

    std::optional<Category> parse_category(const std::string& text) {
        for (const auto& entry : kCategoryNames) {
            if (text == entry.name) return entry.category;
        }
        return std::nullopt;
    }

    std::optional<Risk> parse_risk(const std::string& text) {
        if (text == "safe") return Risk::Safe;
        if (text == "moderate") return Risk::Moderate;
        if (text == "risky") return Risk::Risky;
        return std::nullopt;
    }

    std::optional<ScanSpeed> parse_speed(const std::string& text) {
        if (text == "quick") return ScanSpeed::Quick;
        if (text == "normal") return ScanSpeed::Normal;
        if (text == "thorough") return ScanSpeed::Thorough;
        return std::nullopt;
    }

    ScanItem make_item(const std::filesystem::path& path, Category category,
                       std::uintmax_t size_bytes, bool validated, std::string description) {
        ScanItem item;
        item.path = path;
        item.category = category;
        item.risk = risk_of(category);
        item.size_bytes = size_bytes;
        item.validated = validated;
        item.description = std::move(description);
        return item;
    }

    std::size_t CleanReport::count(CleanOutcome::Status status) const {
        std::size_t n = 0;
        for (const auto& attempt : attempted) {
            if (attempt.outcome.status == status) ++n;
        }
        return n;
    }

}
