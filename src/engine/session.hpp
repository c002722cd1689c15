#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include "reclaim/types.hpp"
#include "clean_engine.hpp"

namespace reclaim::engine {

    class ScanCache;
    class DigestIndex;
    struct Config;

    struct ResolvedScan {
        ScanResult result;
        bool from_cache = false;
        std::optional<std::chrono::seconds> cache_age;
    };

    /**
     * @brief The scan / clean flow callers drive, with the ScanCache in between.
     *
     * Computing what would be deleted (scan/resolve) and deleting it (clean)
     * are separate calls so a caller can ask for confirmation in between.
     */
    class Session {
    public:
        explicit Session(ScanCache& cache, DigestIndex* index = nullptr);

        /**
         * @brief Opens (and owns) the digest index when `config.use_digest_index` is set.
         *
         * A digest index that cannot be opened is skipped with a warning.
         */
        Session(ScanCache& cache, const Config& config);
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        DigestIndex* digest_index() const { return m_index; }

        /**
         * @brief Fresh scan; persisted unless `no_cache`.
         */
        ScanResult scan(const ScanConfig& config, bool no_cache = false);

        /**
         * @brief Cached result for this config if fresh, otherwise a fresh (saved) scan.
         */
        ResolvedScan resolve(const ScanConfig& config, bool force_scan = false);

        /**
         * @brief Runs the CleanEngine; a real clean that removed anything invalidates the cache.
         */
        CleanReport clean(const ScanResult& result, Risk risk_ceiling, bool dry_run,
                          const ScanConfig& config = {},
                          CleanEngine::OutcomeCallback on_outcome = nullptr);

    private:
        ScanCache& m_cache;
        std::unique_ptr<DigestIndex> m_owned_index;
        DigestIndex* m_index;
    };

}
