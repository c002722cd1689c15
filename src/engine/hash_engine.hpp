#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "reclaim/types.hpp"
#include "worker_pool.hpp"

namespace reclaim::engine {

    class DigestIndex;

    /**
     * @brief Groups files by full-content SHA-256.
     *
     * Files are hashed in parallel, one task per file, each with its own read
     * buffer. Only files whose size is shared with another candidate are
     * read at all; a file of unique size cannot have a duplicate.
     */
    class HashEngine {
    public:
        using WarningCallback = std::function<void(const std::string&)>;

        explicit HashEngine(WorkerPool& pool, DigestIndex* index = nullptr);

        /**
         * @brief Finds sets of identical plain files.
         * @param files Candidate paths; non-regular files are ignored.
         * @param min_size Smallest file size considered (zero-byte files are always skipped).
         * @param on_warning Receives one message per unreadable file.
         * @return digest -> sorted paths, only for groups with at least two members.
         */
        DuplicateGroups hash_duplicates(const std::vector<std::filesystem::path>& files,
                                        std::uintmax_t min_size = 1,
                                        WarningCallback on_warning = nullptr);

        /**
         * @brief Digest of one file, served from the DigestIndex when still valid.
         * @return nullopt if the file could not be read.
         */
        std::optional<std::string> digest(const std::filesystem::path& file, std::uintmax_t size);

    private:
        WorkerPool& m_pool;
        DigestIndex* m_index;
    };

}
