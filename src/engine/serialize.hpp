#pragma once

#include <nlohmann/json.hpp>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    // nlohmann ADL hooks. Enums are written as lowercase names, timestamps as
    // unix seconds. Readers ignore unknown keys so newer files stay loadable.

    void to_json(nlohmann::json& j, const ScanItem& item);
    void from_json(const nlohmann::json& j, ScanItem& item);

    void to_json(nlohmann::json& j, const ScanResult& result);
    void from_json(const nlohmann::json& j, ScanResult& result);

    void to_json(nlohmann::json& j, const CacheEntry& entry);
    void from_json(const nlohmann::json& j, CacheEntry& entry);

    void to_json(nlohmann::json& j, const CleanAttempt& attempt);
    void to_json(nlohmann::json& j, const CleanReport& report);

    /**
     * @brief Canonical form of the parameters that shape a scan's output.
     */
    nlohmann::json describe_config(const ScanConfig& config);

    std::int64_t to_unix_seconds(Clock::time_point tp);
    Clock::time_point from_unix_seconds(std::int64_t seconds);

}
