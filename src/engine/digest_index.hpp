#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>

namespace reclaim::engine {

    /**
     * @brief SQLite memo of full-file SHA-256 digests.
     *
     * A digest is only served back while the file's size and mtime still
     * match the stored row. One connection is shared by the hashing
     * workers; every call takes the internal mutex.
     */
    class DigestIndex {
    public:
        DigestIndex();
        ~DigestIndex();

        DigestIndex(const DigestIndex&) = delete;
        DigestIndex& operator=(const DigestIndex&) = delete;

        /**
         * @brief ~/.local/share/reclaim/digests.db
         */
        static std::filesystem::path default_path();

        /**
         * @brief Opened index, or nullptr if it cannot be opened.
         * Callers hash without memoization in that case.
         */
        static std::unique_ptr<DigestIndex> try_open(const std::filesystem::path& path = default_path());

        /**
         * @brief Opens (creating if needed) the database and its schema.
         */
        bool open(const std::filesystem::path& path);
        void close();
        bool is_open() const;

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        bool initialize_schema();

        /**
         * @brief Returns the stored digest if size and mtime are unchanged.
         */
        std::optional<std::string> lookup(const std::filesystem::path& path, std::uintmax_t size, std::int64_t mtime_ns);

        /**
         * @brief Inserts or replaces the digest for a path.
         */
        bool store(const std::filesystem::path& path, std::uintmax_t size, std::int64_t mtime_ns, const std::string& digest);

        /**
         * @brief Deletes rows whose file no longer exists.
         * @return Number of rows removed, or -1 on error.
         */
        int prune();

        size_t count();

    private:
        sqlite3* m_db = nullptr;
        mutable std::mutex m_mutex;

        bool remove_locked(const std::string& path);
    };

}
