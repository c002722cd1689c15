#include "deduplicator.hpp"
#include "path_utils.hpp"
#include <algorithm>
#include <set>

namespace reclaim::engine {

    std::vector<ScanItem> Deduplicator::dedupe(std::vector<ScanItem> candidates) {
        for (auto& item : candidates) {
            item.path = normalized(item.path);
        }

        std::stable_sort(candidates.begin(), candidates.end(), [](const ScanItem& a, const ScanItem& b) {
            const auto da = path_depth(a.path);
            const auto db = path_depth(b.path);
            if (da != db) return da < db;
            return a.path < b.path;
        });

        std::set<std::filesystem::path> accepted_paths;
        std::vector<ScanItem> accepted;
        accepted.reserve(candidates.size());

        for (auto& item : candidates) {
            bool nested = false;
            // Walk up through every ancestor, the path itself included.
            for (auto p = item.path; !p.empty(); p = p.parent_path()) {
                if (accepted_paths.count(p)) {
                    nested = true;
                    break;
                }
                if (p == p.parent_path()) break;
            }
            if (nested) continue;

            accepted_paths.insert(item.path);
            accepted.push_back(std::move(item));
        }
        return accepted;
    }

    std::uintmax_t Deduplicator::total_size(const std::vector<ScanItem>& items) {
        std::uintmax_t total = 0;
        for (const auto& item : items) total += item.size_bytes;
        return total;
    }

}
