#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "reclaim/types.hpp"
#include "../platform.hpp"

namespace reclaim::engine {

    struct Config {
        ScanSpeed speed = ScanSpeed::Normal;
        std::uintmax_t min_large_file_mb = 100;  // 0 disables large-file detection
        std::uintmax_t min_candidate_kb = 1024;  // smaller cache/build dirs are not reported
        std::uintmax_t min_log_mb = 10;
        std::uintmax_t min_duplicate_kb = 1024;
        unsigned workers = 0;                    // 0 = host parallelism
        bool skip_system = true;
        bool use_digest_index = true;
        std::string digest_index_path;           // empty = DigestIndex::default_path()
        std::vector<std::string> extra_protected_paths;

        static std::filesystem::path default_path() {
            return platform::system::get_config_dir() / "config.json";
        }

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("speed")) {
                    if (auto speed = parse_speed(j["speed"].get<std::string>())) cfg.speed = *speed;
                }
                cfg.min_large_file_mb = j.value("min_large_file_mb", cfg.min_large_file_mb);
                cfg.min_candidate_kb = j.value("min_candidate_kb", cfg.min_candidate_kb);
                cfg.min_log_mb = j.value("min_log_mb", cfg.min_log_mb);
                cfg.min_duplicate_kb = j.value("min_duplicate_kb", cfg.min_duplicate_kb);
                cfg.workers = j.value("workers", cfg.workers);
                cfg.skip_system = j.value("skip_system", cfg.skip_system);
                cfg.use_digest_index = j.value("use_digest_index", cfg.use_digest_index);
                cfg.digest_index_path = j.value("digest_index_path", cfg.digest_index_path);
                cfg.extra_protected_paths = j.value("extra_protected_paths", cfg.extra_protected_paths);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                return Config{};
            }
            return cfg;
        }

        bool save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["speed"] = to_string(speed);
            j["min_large_file_mb"] = min_large_file_mb;
            j["min_candidate_kb"] = min_candidate_kb;
            j["min_log_mb"] = min_log_mb;
            j["min_duplicate_kb"] = min_duplicate_kb;
            j["workers"] = workers;
            j["skip_system"] = skip_system;
            j["use_digest_index"] = use_digest_index;
            j["digest_index_path"] = digest_index_path;
            j["extra_protected_paths"] = extra_protected_paths;

            std::ofstream f(path);
            if (!f) return false;
            f << j.dump(4);
            return static_cast<bool>(f);
        }

        /**
         * @brief Builds a ScanConfig from these defaults; empty roots mean $HOME.
         */
        ScanConfig to_scan_config(std::vector<std::filesystem::path> roots = {}, bool find_duplicates = false) const {
            ScanConfig sc;
            sc.roots = std::move(roots);
            if (sc.roots.empty()) {
                auto home = platform::system::get_home_dir();
                if (!home.empty()) sc.roots.push_back(home);
            }
            sc.speed = speed;
            sc.min_large_file_size = min_large_file_mb * 1024 * 1024;
            sc.min_candidate_size = min_candidate_kb * 1024;
            sc.min_log_size = min_log_mb * 1024 * 1024;
            sc.min_duplicate_size = min_duplicate_kb * 1024;
            sc.find_duplicates = find_duplicates;
            sc.workers = workers;
            sc.skip_system = skip_system;
            for (const auto& p : extra_protected_paths) sc.extra_protected_paths.emplace_back(p);
            return sc;
        }
    };

}
