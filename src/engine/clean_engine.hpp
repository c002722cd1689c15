#pragma once

#include <filesystem>
#include <functional>
#include <vector>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    /**
     * @brief Deletes (or simulates deleting) scan items up to a risk ceiling.
     *
     * Items are processed one at a time in input order. A failure is recorded
     * for that item and the next one is attempted; nothing is rolled back.
     */
    class CleanEngine {
    public:
        using OutcomeCallback = std::function<void(const CleanAttempt&)>;

        explicit CleanEngine(std::vector<std::filesystem::path> extra_protected_paths = {});

        /**
         * @brief Items with risk <= ceiling, in their original order.
         */
        static std::vector<ScanItem> select(const ScanResult& result, Risk risk_ceiling);

        /**
         * @param on_outcome Invoked after each item, before the next one is touched.
         */
        CleanReport clean(const ScanResult& result, Risk risk_ceiling, bool dry_run,
                          OutcomeCallback on_outcome = nullptr) const;

    private:
        std::vector<std::filesystem::path> m_extra_protected;

        CleanOutcome remove_item(const ScanItem& item) const;
    };

}
