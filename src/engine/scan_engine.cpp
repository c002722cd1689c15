#include "scan_engine.hpp"
#include "traverser.hpp"
#include "deduplicator.hpp"
#include "hash_engine.hpp"
#include "worker_pool.hpp"
#include "../platform.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace reclaim::engine {

    const char* to_string(ScanEngine::State state) {
        switch (state) {
            case ScanEngine::State::Idle: return "idle";
            case ScanEngine::State::Traversing: return "traversing";
            case ScanEngine::State::Deduplicating: return "deduplicating";
            case ScanEngine::State::Hashing: return "hashing";
            case ScanEngine::State::Complete: return "complete";
        }
        return "idle";
    }

    ScanEngine::ScanEngine(DigestIndex* index) : m_index(index) {}

    ScanResult ScanEngine::scan(const ScanConfig& input) {
        m_state = State::Idle;

        ScanConfig config = input;
        if (config.roots.empty()) {
            auto home = platform::system::get_home_dir();
            if (home.empty()) throw ScanError("No scan roots given and HOME is not set");
            config.roots.push_back(home);
        }

        std::unique_ptr<WorkerPool> pool;
        try {
            pool = std::make_unique<WorkerPool>(config.workers ? config.workers : platform::system::available_parallelism());
        } catch (const std::system_error& e) {
            throw ScanError(std::string("Cannot start worker threads: ") + e.what());
        }

        const auto depth = config.effective_depth();
        std::cout << "[ScanEngine] Scanning " << config.roots.size() << " root(s), speed "
                  << to_string(config.speed) << ", depth "
                  << (depth ? std::to_string(*depth) : std::string("unlimited")) << "\n";

        ScanResult result;
        result.speed = config.speed;

        std::vector<ScanItem> candidates;
        std::map<fs::path, std::uintmax_t> files;
        auto on_warning = [&result](const std::string& message) {
            std::cerr << "[ScanEngine] warning: " << message << "\n";
            result.warnings.push_back(message);
        };

        m_state = State::Traversing;
        Traverser traverser(*pool, config);
        const size_t accessible = traverser.traverse(
            config.roots,
            [&candidates](const ScanItem& item) { candidates.push_back(item); },
            config.find_duplicates
                ? Traverser::FileCallback([&files](const fs::path& path, std::uintmax_t size) { files.emplace(path, size); })
                : Traverser::FileCallback(),
            on_warning);

        if (accessible == 0) {
            m_state = State::Idle;
            throw ScanError("None of the scan roots is accessible");
        }

        m_state = State::Deduplicating;
        result.items = Deduplicator::dedupe(std::move(candidates));

        if (config.find_duplicates) {
            m_state = State::Hashing;

            std::vector<fs::path> paths;
            paths.reserve(files.size());
            for (const auto& [path, size] : files) paths.push_back(path);

            // HashEngine serializes its own warning calls.
            HashEngine hasher(*pool, m_index);
            result.duplicate_groups = hasher.hash_duplicates(paths, config.min_duplicate_size, on_warning);

            std::set<fs::path> known;
            for (const auto& item : result.items) known.insert(item.path);

            for (const auto& [hex, group] : result.duplicate_groups) {
                // The first path of each group is left alone; the rest are surfaced.
                for (size_t i = 1; i < group.size(); ++i) {
                    if (known.count(group[i])) continue;
                    auto it = files.find(group[i]);
                    const std::uintmax_t size = it != files.end() ? it->second : 0;
                    result.items.push_back(make_item(group[i], Category::DuplicateFile, size, true,
                                                     "Duplicate of " + group.front().string()));
                    known.insert(group[i]);
                }
            }
            result.items = Deduplicator::dedupe(std::move(result.items));
        }

        result.total_size_bytes = Deduplicator::total_size(result.items);
        result.generated_at = Clock::now();
        m_state = State::Complete;

        std::cout << "[ScanEngine] Scan complete: " << result.items.size() << " item(s), "
                  << result.total_size_bytes << " bytes, " << result.duplicate_groups.size()
                  << " duplicate group(s), " << result.warnings.size() << " warning(s)\n";
        return result;
    }

}
