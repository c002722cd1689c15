#include "serialize.hpp"
#include "path_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace reclaim::engine {

    std::int64_t to_unix_seconds(Clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    Clock::time_point from_unix_seconds(std::int64_t seconds) {
        return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(seconds)));
    }

    void to_json(nlohmann::json& j, const ScanItem& item) {
        j = nlohmann::json{
            {"path", item.path.string()},
            {"category", to_string(item.category)},
            {"risk", to_string(item.risk)},
            {"size_bytes", item.size_bytes},
            {"validated", item.validated},
            {"description", item.description}
        };
    }

    void from_json(const nlohmann::json& j, ScanItem& item) {
        const std::string category_name = j.at("category").get<std::string>();
        auto category = parse_category(category_name);
        if (!category) {
            throw std::invalid_argument("unknown category: " + category_name);
        }
        // Validation-gated categories must carry an explicit validated flag.
        const bool validated = j.value("validated", !requires_validation(*category));
        if (requires_validation(*category) && !validated) {
            throw std::invalid_argument("unvalidated " + category_name + " item: " + j.at("path").get<std::string>());
        }
        // Risk is re-derived rather than trusted from the file.
        item = make_item(j.at("path").get<std::string>(), *category,
                         j.at("size_bytes").get<std::uintmax_t>(),
                         validated,
                         j.value("description", std::string()));
    }

    void to_json(nlohmann::json& j, const ScanResult& result) {
        nlohmann::json groups = nlohmann::json::object();
        for (const auto& [hex, paths] : result.duplicate_groups) {
            auto& list = groups[hex];
            list = nlohmann::json::array();
            for (const auto& p : paths) list.push_back(p.string());
        }

        j = nlohmann::json{
            {"items", result.items},
            {"total_size_bytes", result.total_size_bytes},
            {"duplicate_groups", groups},
            {"generated_at", to_unix_seconds(result.generated_at)},
            {"speed", to_string(result.speed)},
            {"warnings", result.warnings}
        };
    }

    void from_json(const nlohmann::json& j, ScanResult& result) {
        result = ScanResult{};
        result.items = j.at("items").get<std::vector<ScanItem>>();
        result.total_size_bytes = j.at("total_size_bytes").get<std::uintmax_t>();
        result.generated_at = from_unix_seconds(j.at("generated_at").get<std::int64_t>());
        result.speed = parse_speed(j.value("speed", std::string("normal"))).value_or(ScanSpeed::Normal);
        result.warnings = j.value("warnings", std::vector<std::string>{});

        if (j.contains("duplicate_groups")) {
            for (const auto& [hex, paths] : j.at("duplicate_groups").items()) {
                auto& group = result.duplicate_groups[hex];
                for (const auto& p : paths) group.emplace_back(p.get<std::string>());
            }
        }
    }

    void to_json(nlohmann::json& j, const CacheEntry& entry) {
        j = nlohmann::json{
            {"version", 1},
            {"created_at", to_unix_seconds(entry.created_at)},
            {"config_key", entry.config_key},
            {"scan_result", entry.scan_result}
        };
    }

    void from_json(const nlohmann::json& j, CacheEntry& entry) {
        entry.created_at = from_unix_seconds(j.at("created_at").get<std::int64_t>());
        entry.config_key = j.value("config_key", std::string());
        entry.scan_result = j.at("scan_result").get<ScanResult>();
    }

    void to_json(nlohmann::json& j, const CleanAttempt& attempt) {
        j = nlohmann::json{
            {"item", attempt.item},
            {"outcome", to_string(attempt.outcome.status)}
        };
        if (attempt.outcome.status == CleanOutcome::Status::Failed) {
            j["reason"] = attempt.outcome.reason;
        }
    }

    void to_json(nlohmann::json& j, const CleanReport& report) {
        j = nlohmann::json{
            {"attempted", report.attempted},
            {"bytes_freed", report.bytes_freed},
            {"cleaned", report.count(CleanOutcome::Status::Cleaned)},
            {"failed", report.count(CleanOutcome::Status::Failed)},
            {"skipped", report.count(CleanOutcome::Status::SkippedDryRun)}
        };
    }

    nlohmann::json describe_config(const ScanConfig& config) {
        std::vector<std::string> roots;
        for (const auto& root : config.roots) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(root, ec);
            roots.push_back(normalized(ec ? root : absolute).string());
        }
        std::sort(roots.begin(), roots.end());
        roots.erase(std::unique(roots.begin(), roots.end()), roots.end());

        std::vector<std::string> protected_paths;
        for (const auto& p : config.extra_protected_paths) protected_paths.push_back(normalized(p).string());
        std::sort(protected_paths.begin(), protected_paths.end());

        const auto depth = config.effective_depth();
        return nlohmann::json{
            {"roots", roots},
            {"max_depth", depth ? nlohmann::json(*depth) : nlohmann::json(nullptr)},
            {"min_large_file_size", config.min_large_file_size},
            {"find_duplicates", config.find_duplicates},
            {"skip_system", config.skip_system},
            {"min_candidate_size", config.min_candidate_size},
            {"min_log_size", config.min_log_size},
            {"min_duplicate_size", config.min_duplicate_size},
            {"extra_protected_paths", protected_paths}
        };
    }

}
