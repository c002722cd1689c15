#include "validator.hpp"

namespace reclaim::engine {

    const std::unordered_set<std::string>& Validator::project_markers() {
        static const std::unordered_set<std::string> markers = {
            "package.json",
            "Cargo.toml",
            "go.mod",
            "pom.xml",
            "build.gradle",
            "build.gradle.kts",
            "settings.gradle",
            "build.xml",
            "CMakeLists.txt",
            "Makefile",
            "meson.build",
            "setup.py",
            "pyproject.toml",
            "composer.json",
            "Gemfile",
            "mix.exs",
            "pubspec.yaml",
            "angular.json",
            "vite.config.js",
            "vite.config.ts",
            "webpack.config.js",
        };
        return markers;
    }

    bool Validator::validate(Category category, const std::unordered_set<std::string>& parent_files) {
        switch (category) {
            case Category::NodeModules:
                return parent_files.count("package.json") > 0;
            case Category::RustTarget:
                return parent_files.count("Cargo.toml") > 0;
            case Category::BuildOutput:
                for (const auto& marker : project_markers()) {
                    if (parent_files.count(marker)) return true;
                }
                return false;
            default:
                return true;
        }
    }

}
