#include "session.hpp"
#include "scan_cache.hpp"
#include "scan_engine.hpp"
#include "digest_index.hpp"
#include "config.hpp"
#include <iostream>

namespace reclaim::engine {

    Session::Session(ScanCache& cache, DigestIndex* index)
        : m_cache(cache), m_index(index) {}

    Session::Session(ScanCache& cache, const Config& config)
        : m_cache(cache), m_index(nullptr) {
        if (config.use_digest_index) {
            const std::filesystem::path path = config.digest_index_path.empty()
                ? DigestIndex::default_path()
                : std::filesystem::path(config.digest_index_path);
            m_owned_index = DigestIndex::try_open(path);
            m_index = m_owned_index.get();
        }
    }

    Session::~Session() = default;

    ScanResult Session::scan(const ScanConfig& config, bool no_cache) {
        ScanEngine engine(m_index);
        ScanResult result = engine.scan(config);

        if (!no_cache && !m_cache.save(result, ScanCache::config_key(config))) {
            std::cerr << "[Session] Warning: failed to save scan cache.\n";
        }
        return result;
    }

    ResolvedScan Session::resolve(const ScanConfig& config, bool force_scan) {
        ResolvedScan resolved;

        if (!force_scan) {
            const auto now = Clock::now();
            if (auto entry = m_cache.load(ScanCache::config_key(config), now)) {
                resolved.cache_age = std::chrono::duration_cast<std::chrono::seconds>(now - entry->created_at);
                if (resolved.cache_age->count() < 0) resolved.cache_age = std::chrono::seconds(0);
                resolved.result = std::move(entry->scan_result);
                resolved.from_cache = true;
                std::cout << "[Session] Using cached scan results from " << resolved.cache_age->count() << "s ago.\n";
                return resolved;
            }
            std::cout << "[Session] No usable cached scan, running fresh scan...\n";
        } else {
            std::cout << "[Session] Running fresh scan (forced)...\n";
        }

        resolved.result = scan(config, false);
        return resolved;
    }

    CleanReport Session::clean(const ScanResult& result, Risk risk_ceiling, bool dry_run,
                               const ScanConfig& config,
                               CleanEngine::OutcomeCallback on_outcome) {
        CleanEngine engine(config.extra_protected_paths);
        CleanReport report = engine.clean(result, risk_ceiling, dry_run, std::move(on_outcome));

        if (!dry_run && report.count(CleanOutcome::Status::Cleaned) > 0) {
            if (!m_cache.invalidate()) {
                std::cerr << "[Session] Warning: scan cache still lists removed items.\n";
            }
        }

        std::cout << "[Session] " << (dry_run ? "Dry run" : "Clean") << " finished: "
                  << report.count(CleanOutcome::Status::Cleaned) << " cleaned, "
                  << report.count(CleanOutcome::Status::Failed) << " failed, "
                  << report.count(CleanOutcome::Status::SkippedDryRun) << " skipped, "
                  << report.bytes_freed << " bytes freed\n";
        return report;
    }

}
