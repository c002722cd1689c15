#pragma once

#include <vector>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    /**
     * @brief Drops candidates that lie inside (or duplicate) another candidate.
     *
     * Shallower paths win, so a parent directory is kept and its already
     * counted children are discarded. Running it twice changes nothing.
     */
    class Deduplicator {
    public:
        static std::vector<ScanItem> dedupe(std::vector<ScanItem> candidates);

        static std::uintmax_t total_size(const std::vector<ScanItem>& items);
    };

}
