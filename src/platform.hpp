#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace reclaim::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_home_dir();
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
        std::filesystem::path get_cache_dir();

        /**
         * @brief Number of worker threads the host can run in parallel (>= 1).
         */
        unsigned available_parallelism();

        /**
         * @brief Absolute prefixes that are never scanned nor deleted.
         */
        const std::vector<std::filesystem::path>& protected_roots();

        /**
         * @brief Relative user-library locations skipped when skip_system is set.
         * Matched as a component sequence anywhere below a scan root.
         */
        const std::vector<std::filesystem::path>& caution_paths();
    }

}
