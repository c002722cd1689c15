#include "digest_index.hpp"
#include "../platform.hpp"
#include <iostream>

namespace reclaim::engine {

    DigestIndex::DigestIndex() = default;
    DigestIndex::~DigestIndex() { close(); }

    std::filesystem::path DigestIndex::default_path() {
        auto dir = platform::system::get_data_dir();
        if (dir.empty()) dir = std::filesystem::temp_directory_path() / "reclaim";
        return dir / "digests.db";
    }

    std::unique_ptr<DigestIndex> DigestIndex::try_open(const std::filesystem::path& path) {
        auto index = std::make_unique<DigestIndex>();
        if (!index->open(path)) {
            std::cerr << "[DigestIndex] Continuing without digest index.\n";
            return nullptr;
        }
        return index;
    }

    bool DigestIndex::open(const std::filesystem::path& path) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_db) return true;

            if (path.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(path.parent_path(), ec);
            }
            if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
                std::cerr << "[DigestIndex] Failed to open: " << sqlite3_errmsg(m_db) << "\n";
                sqlite3_close(m_db);
                m_db = nullptr;
                return false;
            }
            sqlite3_busy_timeout(m_db, 2000);
        }
        return initialize_schema();
    }

    void DigestIndex::close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool DigestIndex::is_open() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_db != nullptr;
    }

    bool DigestIndex::initialize_schema() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return false;

        const char* sql =
            "CREATE TABLE IF NOT EXISTS digests ("
            "  path TEXT PRIMARY KEY NOT NULL,"
            "  size INTEGER NOT NULL,"
            "  mtime_ns INTEGER NOT NULL,"
            "  digest TEXT NOT NULL"
            ");";
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[DigestIndex] Schema error: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    std::optional<std::string> DigestIndex::lookup(const std::filesystem::path& path, std::uintmax_t size, std::int64_t mtime_ns) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return std::nullopt;

        const char* sql = "SELECT digest FROM digests WHERE path = ? AND size = ? AND mtime_ns = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

        const std::string key = path.string();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(size));
        sqlite3_bind_int64(stmt, 3, mtime_ns);

        std::optional<std::string> digest;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char* text = sqlite3_column_text(stmt, 0);
            if (text) digest = reinterpret_cast<const char*>(text);
        }
        sqlite3_finalize(stmt);
        return digest;
    }

    bool DigestIndex::store(const std::filesystem::path& path, std::uintmax_t size, std::int64_t mtime_ns, const std::string& digest) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return false;

        const char* sql =
            "INSERT INTO digests (path, size, mtime_ns, digest) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(path) DO UPDATE SET "
            "size = excluded.size, "
            "mtime_ns = excluded.mtime_ns, "
            "digest = excluded.digest;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        const std::string key = path.string();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(size));
        sqlite3_bind_int64(stmt, 3, mtime_ns);
        sqlite3_bind_text(stmt, 4, digest.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    int DigestIndex::prune() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return -1;

        std::vector<std::string> stale;
        const char* sql = "SELECT path FROM digests;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return -1;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char* text = sqlite3_column_text(stmt, 0);
            if (!text) continue;
            std::string path = reinterpret_cast<const char*>(text);
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) stale.push_back(std::move(path));
        }
        sqlite3_finalize(stmt);

        int removed = 0;
        for (const auto& path : stale) {
            if (remove_locked(path)) ++removed;
        }
        return removed;
    }

    size_t DigestIndex::count() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return 0;

        size_t n = 0;
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM digests;", -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW) n = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
            sqlite3_finalize(stmt);
        }
        return n;
    }

    bool DigestIndex::remove_locked(const std::string& path) {
        const char* sql = "DELETE FROM digests WHERE path = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);
        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

}
