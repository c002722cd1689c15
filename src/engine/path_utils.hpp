#pragma once

#include <filesystem>
#include <vector>

namespace reclaim::engine {

    /**
     * @brief lexically_normal() without a trailing separator.
     */
    std::filesystem::path normalized(const std::filesystem::path& path);

    /**
     * @brief Component-wise prefix test: true if `path` equals `prefix` or lies below it.
     * "/a/bc" is not within "/a/b".
     */
    bool is_within(const std::filesystem::path& path, const std::filesystem::path& prefix);

    /**
     * @brief True if `sequence` (relative) occurs as consecutive components of `path`.
     */
    bool contains_components(const std::filesystem::path& path, const std::filesystem::path& sequence);

    /**
     * @brief True if the path is under a fixed protected root or one of `extra`.
     */
    bool is_protected(const std::filesystem::path& path,
                      const std::vector<std::filesystem::path>& extra = {});

    /**
     * @brief Number of components; used to order candidates shallow-first.
     */
    std::size_t path_depth(const std::filesystem::path& path);

}
