#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    /**
     * @brief Single-file JSON persistence of the last completed scan.
     *
     * A missing, unparseable, stale or differently-configured entry is a
     * plain cache miss. Writers replace the file atomically (temp file +
     * rename); concurrent writers against one path are not supported.
     */
    class ScanCache {
    public:
        static constexpr std::chrono::seconds kFreshnessWindow{3600};

        explicit ScanCache(std::filesystem::path file = default_path());

        /**
         * @brief ~/.cache/reclaim/last-scan.json
         */
        static std::filesystem::path default_path();

        /**
         * @brief Fingerprint of every ScanConfig field that shapes the result.
         */
        static std::string config_key(const ScanConfig& config);

        /**
         * @param config_key If non-empty, entries written under another key are a miss.
         * @param now Reference time for the freshness check.
         */
        std::optional<CacheEntry> load(const std::string& config_key = {}, Clock::time_point now = Clock::now()) const;

        bool save(const ScanResult& result, const std::string& config_key = {});
        bool save(const CacheEntry& entry);

        /**
         * @brief Removes the cache file. Returns false only if it exists and could not be removed.
         */
        bool invalidate();

        /**
         * @brief Age of the stored entry regardless of freshness; nullopt if unreadable.
         */
        std::optional<std::chrono::seconds> age(Clock::time_point now = Clock::now()) const;

        const std::filesystem::path& file() const { return m_file; }

    private:
        std::filesystem::path m_file;

        std::optional<CacheEntry> read() const;
    };

}
