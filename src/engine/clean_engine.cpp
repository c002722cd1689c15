#include "clean_engine.hpp"
#include "path_utils.hpp"
#include "traverser.hpp"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace reclaim::engine {

    namespace {
        CleanOutcome failed(std::string reason) {
            return CleanOutcome{CleanOutcome::Status::Failed, std::move(reason)};
        }
    }

    CleanEngine::CleanEngine(std::vector<fs::path> extra_protected_paths)
        : m_extra_protected(std::move(extra_protected_paths)) {}

    std::vector<ScanItem> CleanEngine::select(const ScanResult& result, Risk risk_ceiling) {
        std::vector<ScanItem> selected;
        for (const auto& item : result.items) {
            if (item.risk <= risk_ceiling) selected.push_back(item);
        }
        return selected;
    }

    CleanReport CleanEngine::clean(const ScanResult& result, Risk risk_ceiling, bool dry_run,
                                   OutcomeCallback on_outcome) const {
        CleanReport report;

        for (const auto& item : select(result, risk_ceiling)) {
            CleanAttempt attempt{item, {}};

            if (dry_run) {
                attempt.outcome.status = CleanOutcome::Status::SkippedDryRun;
                std::cout << "[CleanEngine] Would remove: " << item.path.string() << "\n";
            } else {
                attempt.outcome = remove_item(item);
                if (attempt.outcome.status == CleanOutcome::Status::Cleaned) {
                    report.bytes_freed += item.size_bytes;
                    std::cout << "[CleanEngine] Cleaned: " << item.path.string() << "\n";
                } else {
                    std::cerr << "[CleanEngine] Failed to clean " << item.path.string()
                              << ": " << attempt.outcome.reason << "\n";
                }
            }

            report.attempted.push_back(attempt);
            if (on_outcome) on_outcome(report.attempted.back());
        }
        return report;
    }

    CleanOutcome CleanEngine::remove_item(const ScanItem& item) const {
        const fs::path& path = item.path;
        if (!path.is_absolute()) return failed("path is not absolute");
        if (is_protected(path, m_extra_protected)) return failed("path is protected");

        std::error_code ec;
        auto st = fs::symlink_status(path, ec);
        if (ec || !fs::exists(st)) {
            if (ec && ec != std::errc::no_such_file_or_directory) return failed(ec.message());
            return failed("path no longer exists");
        }
        if (fs::is_symlink(st)) return failed("path is now a symbolic link");

        // Last check before an irreversible delete: the item must still be what was scanned.
        std::uintmax_t current = 0;
        const bool is_dir = fs::is_directory(st);
        if (is_dir) {
            std::vector<std::string> warnings;
            current = Traverser::directory_size(path, warnings);
            if (!warnings.empty()) return failed("cannot re-measure: " + warnings.front());
        } else {
            current = fs::file_size(path, ec);
            if (ec) return failed(ec.message());
        }
        if (current != item.size_bytes) {
            return failed("size changed since scan (" + std::to_string(item.size_bytes) + " -> " +
                          std::to_string(current) + " bytes)");
        }

        if (is_dir) {
            fs::remove_all(path, ec);
        } else {
            fs::remove(path, ec);
        }
        if (ec) return failed(ec.message());

        return CleanOutcome{CleanOutcome::Status::Cleaned, {}};
    }

}
