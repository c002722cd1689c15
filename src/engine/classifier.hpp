#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <regex>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    /**
     * @brief Maps entry names onto cleanup categories.
     *
     * Rules are evaluated top to bottom and the first match wins, so specific
     * names (node_modules, .pytest_cache) must come before the generic
     * "*cache" rule. Classification is pure: no filesystem access.
     */
    class PathClassifier {
    public:
        PathClassifier();

        /**
         * @brief Classifies a directory entry.
         * @param name The entry's file name.
         * @param parent The directory that contains the entry.
         * @param is_directory Whether the entry is a directory.
         * @return The category, or nullopt if the entry is not recognized.
         */
        std::optional<Category> classify(const std::string& name,
                                         const std::filesystem::path& parent,
                                         bool is_directory) const;

    private:
        enum class Applies { Directory, File };

        struct Rule {
            std::regex regex;
            std::string original;
            Category category;
            Applies applies;
        };
        std::vector<Rule> m_rules;

        void add_rule(const std::string& glob, Category category, Applies applies, bool ignore_case = false);
        void add_defaults();

        static std::string glob_to_regex(const std::string& glob);
        static Category refine_cache(const std::string& name, const std::filesystem::path& parent);
    };

}
