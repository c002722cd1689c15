#include "hash_engine.hpp"
#include "digest_index.hpp"
#include "reclaim/sha256.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace fs = std::filesystem;

namespace reclaim::engine {

    HashEngine::HashEngine(WorkerPool& pool, DigestIndex* index)
        : m_pool(pool), m_index(index) {}

    std::optional<std::string> HashEngine::digest(const fs::path& file, std::uintmax_t size) {
        std::int64_t mtime_ns = 0;
        bool have_mtime = false;
        if (m_index) {
            std::error_code ec;
            auto mtime = fs::last_write_time(file, ec);
            if (!ec) {
                mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
                have_mtime = true;
                if (auto cached = m_index->lookup(file, size, mtime_ns)) return cached;
            }
        }

        std::string hex = crypto::SHA256::hash_file(file);
        if (hex.empty()) return std::nullopt;

        if (m_index && have_mtime && !m_index->store(file, size, mtime_ns, hex)) {
            std::cerr << "[HashEngine] Could not record digest for " << file.string() << "\n";
        }
        return hex;
    }

    DuplicateGroups HashEngine::hash_duplicates(const std::vector<fs::path>& files,
                                                std::uintmax_t min_size,
                                                WarningCallback on_warning) {
        if (min_size == 0) min_size = 1;

        // Bucket by size first; only shared sizes need reading.
        std::set<fs::path> unique(files.begin(), files.end());
        std::unordered_map<std::uintmax_t, std::vector<fs::path>> by_size;
        for (const auto& path : unique) {
            std::error_code ec;
            auto st = fs::symlink_status(path, ec);
            if (ec) {
                if (on_warning) on_warning("Cannot stat " + path.string() + ": " + ec.message());
                continue;
            }
            if (!fs::is_regular_file(st)) continue;
            auto size = fs::file_size(path, ec);
            if (ec) {
                if (on_warning) on_warning("Cannot read size of " + path.string() + ": " + ec.message());
                continue;
            }
            if (size < min_size) continue;
            by_size[size].push_back(path);
        }

        std::mutex mutex;
        std::map<std::string, std::vector<fs::path>> by_digest;

        for (const auto& [size, paths] : by_size) {
            if (paths.size() < 2) continue;
            for (const auto& path : paths) {
                const std::uintmax_t file_size = size;
                m_pool.submit([this, &mutex, &by_digest, &on_warning, path, file_size] {
                    auto hex = digest(path, file_size);
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!hex) {
                        if (on_warning) on_warning("Cannot hash " + path.string());
                        return;
                    }
                    by_digest[*hex].push_back(path);
                });
            }
        }
        m_pool.wait();

        DuplicateGroups groups;
        for (auto& [hex, paths] : by_digest) {
            if (paths.size() < 2) continue;
            std::sort(paths.begin(), paths.end());
            groups.emplace(hex, std::move(paths));
        }
        return groups;
    }

}
