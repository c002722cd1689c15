#include "scan_cache.hpp"
#include "serialize.hpp"
#include "reclaim/sha256.h"
#include "../platform.hpp"
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace reclaim::engine {

    namespace {
        // Tolerated clock skew for entries stamped slightly in the future.
        constexpr std::chrono::seconds kFutureSkew{60};
    }

    ScanCache::ScanCache(fs::path file) : m_file(std::move(file)) {}

    fs::path ScanCache::default_path() {
        auto dir = platform::system::get_cache_dir();
        if (dir.empty()) dir = fs::temp_directory_path() / "reclaim";
        return dir / "last-scan.json";
    }

    std::string ScanCache::config_key(const ScanConfig& config) {
        return crypto::SHA256::hash_string(describe_config(config).dump());
    }

    std::optional<CacheEntry> ScanCache::read() const {
        std::error_code ec;
        if (!fs::exists(m_file, ec)) return std::nullopt;

        std::ifstream in(m_file);
        if (!in) return std::nullopt;

        try {
            nlohmann::json j = nlohmann::json::parse(in);
            return j.get<CacheEntry>();
        } catch (const std::exception& e) {
            std::cerr << "[ScanCache] Ignoring unreadable cache " << m_file << ": " << e.what() << "\n";
            return std::nullopt;
        }
    }

    std::optional<CacheEntry> ScanCache::load(const std::string& config_key, Clock::time_point now) const {
        auto entry = read();
        if (!entry) return std::nullopt;

        const auto age = now - entry->created_at;
        if (age >= kFreshnessWindow || age < -kFutureSkew) {
            return std::nullopt;
        }
        if (!config_key.empty() && entry->config_key != config_key) {
            std::cout << "[ScanCache] Cached scan was made with different settings, ignoring it.\n";
            return std::nullopt;
        }
        return entry;
    }

    bool ScanCache::save(const ScanResult& result, const std::string& config_key) {
        CacheEntry entry;
        entry.scan_result = result;
        entry.created_at = Clock::now();
        entry.config_key = config_key;
        return save(entry);
    }

    bool ScanCache::save(const CacheEntry& entry) {
        std::error_code ec;
        if (m_file.has_parent_path()) {
            fs::create_directories(m_file.parent_path(), ec);
            if (ec) {
                std::cerr << "[ScanCache] Cannot create " << m_file.parent_path() << ": " << ec.message() << "\n";
                return false;
            }
        }

        fs::path temp = m_file;
        temp += ".tmp." + std::to_string(::getpid());

        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out) {
                std::cerr << "[ScanCache] Cannot write " << temp << "\n";
                return false;
            }
            nlohmann::json j = entry;
            out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            out.flush();
            if (!out) {
                std::cerr << "[ScanCache] Write failed for " << temp << "\n";
                out.close();
                fs::remove(temp, ec);
                return false;
            }
        }

        fs::rename(temp, m_file, ec);
        if (ec) {
            std::cerr << "[ScanCache] Cannot replace " << m_file << ": " << ec.message() << "\n";
            std::error_code rm_ec;
            fs::remove(temp, rm_ec);
            return false;
        }
        return true;
    }

    bool ScanCache::invalidate() {
        std::error_code ec;
        fs::remove(m_file, ec);
        if (ec) {
            std::cerr << "[ScanCache] Cannot remove " << m_file << ": " << ec.message() << "\n";
            return false;
        }
        return true;
    }

    std::optional<std::chrono::seconds> ScanCache::age(Clock::time_point now) const {
        auto entry = read();
        if (!entry) return std::nullopt;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - entry->created_at);
        return age.count() < 0 ? std::chrono::seconds(0) : age;
    }

}
