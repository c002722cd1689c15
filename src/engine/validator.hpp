#pragma once

#include <string>
#include <unordered_set>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    /**
     * @brief Guards generically named build directories against false positives.
     *
     * A `build/` next to a project manifest is build output; a `build/` in a
     * photo library is not. Only NodeModules, RustTarget and BuildOutput are
     * checked, every other category passes unconditionally.
     */
    class Validator {
    public:
        /**
         * @param category The category the Classifier assigned.
         * @param parent_files Names of the regular files in the candidate's parent directory.
         * @return true if the candidate may be surfaced.
         */
        static bool validate(Category category, const std::unordered_set<std::string>& parent_files);

        /**
         * @brief Manifest names that mark a directory as a project root.
         */
        static const std::unordered_set<std::string>& project_markers();
    };

}
