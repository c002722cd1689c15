#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include "reclaim/types.hpp"
#include "classifier.hpp"
#include "worker_pool.hpp"

namespace reclaim::engine {

    /**
     * @brief Depth-bounded, parallel walk that turns directory trees into candidates.
     *
     * Every directory listing is a task on the shared WorkerPool, so sibling
     * subtrees are walked concurrently. A directory that classifies and
     * validates is emitted as one ScanItem sized over its whole subtree and
     * is not descended into. Symlinks are never followed.
     */
    class Traverser {
    public:
        using ItemCallback = std::function<void(const ScanItem&)>;
        using FileCallback = std::function<void(const std::filesystem::path&, std::uintmax_t)>;
        using WarningCallback = std::function<void(const std::string&)>;

        Traverser(WorkerPool& pool, const ScanConfig& config);

        /**
         * @brief Walks all roots and blocks until every subtree task finished.
         *
         * Callbacks are serialized by the Traverser; they never run concurrently.
         * @param roots Directories to walk. They are not classified themselves.
         * @param on_item Called for every surfaced candidate.
         * @param on_file Called for plain files eligible for duplicate hashing (optional).
         * @param on_warning Called for soft failures (optional).
         * @return Number of roots that could be walked.
         */
        size_t traverse(const std::vector<std::filesystem::path>& roots,
                        ItemCallback on_item,
                        FileCallback on_file = nullptr,
                        WarningCallback on_warning = nullptr);

        /**
         * @brief Sums regular file sizes below `dir` without following symlinks.
         * Unreadable subdirectories contribute zero and add a warning.
         */
        static std::uintmax_t directory_size(const std::filesystem::path& dir, std::vector<std::string>& warnings);

    private:
        struct PendingCandidate;

        WorkerPool& m_pool;
        const ScanConfig& m_config;
        PathClassifier m_classifier;

        std::mutex m_emit_mutex;
        ItemCallback m_on_item;
        FileCallback m_on_file;
        WarningCallback m_on_warning;

        void walk_directory(const std::filesystem::path& dir, std::uint32_t depth);
        void visit_file(const std::filesystem::path& path, const std::string& name, const std::filesystem::path& dir);
        void schedule_candidate(const std::filesystem::path& dir, Category category);
        void size_candidate_listing(const std::shared_ptr<PendingCandidate>& pending, const std::filesystem::path& dir);
        void finish_candidate(const std::shared_ptr<PendingCandidate>& pending);
        bool is_skipped_directory(const std::filesystem::path& dir) const;

        void emit_item(const ScanItem& item);
        void emit_file(const std::filesystem::path& path, std::uintmax_t size);
        void warn(const std::string& message);
        void warn_all(const std::vector<std::string>& messages);
    };

}
