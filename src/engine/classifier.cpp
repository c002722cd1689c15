#include "classifier.hpp"
#include <algorithm>
#include <cctype>

namespace reclaim::engine {

    namespace {
        std::string lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
            for (const char* needle : needles) {
                if (haystack.find(needle) != std::string::npos) return true;
            }
            return false;
        }
    }

    PathClassifier::PathClassifier() {
        add_defaults();
    }

    void PathClassifier::add_defaults() {
        // Build tool output. Names are generic, the Validator gates them.
        add_rule("node_modules", Category::NodeModules, Applies::Directory);
        add_rule("target", Category::RustTarget, Applies::Directory);
        add_rule("build", Category::BuildOutput, Applies::Directory);
        add_rule("dist", Category::BuildOutput, Applies::Directory);
        add_rule("out", Category::BuildOutput, Applies::Directory);

        add_rule("__pycache__", Category::PythonArtifact, Applies::Directory);
        add_rule(".pytest_cache", Category::PythonArtifact, Applies::Directory);
        add_rule(".mypy_cache", Category::PythonArtifact, Applies::Directory);
        add_rule(".ruff_cache", Category::PythonArtifact, Applies::Directory);
        add_rule(".tox", Category::PythonArtifact, Applies::Directory);

        add_rule(".gradle", Category::JavaBuildCache, Applies::Directory);
        add_rule(".maven", Category::JavaBuildCache, Applies::Directory);
        add_rule(".m2", Category::JavaBuildCache, Applies::Directory);

        add_rule(".next", Category::FrameworkCache, Applies::Directory);
        add_rule(".nuxt", Category::FrameworkCache, Applies::Directory);
        add_rule(".angular", Category::FrameworkCache, Applies::Directory);
        add_rule(".svelte-kit", Category::FrameworkCache, Applies::Directory);
        add_rule(".parcel-cache", Category::FrameworkCache, Applies::Directory);
        add_rule(".turbo", Category::FrameworkCache, Applies::Directory);

        // Generic caches; refined to browser/package/system from the path.
        add_rule("*cache", Category::SystemCache, Applies::Directory, true);
        add_rule("*caches", Category::SystemCache, Applies::Directory, true);

        add_rule("*.log", Category::LogFile, Applies::File, true);
        add_rule("*.log.[0-9]*", Category::LogFile, Applies::File, true);

        add_rule("*.tmp", Category::TempFile, Applies::File, true);
        add_rule("*.temp", Category::TempFile, Applies::File, true);
        add_rule("*.swp", Category::TempFile, Applies::File);
        add_rule("*~", Category::TempFile, Applies::File);
    }

    void PathClassifier::add_rule(const std::string& glob, Category category, Applies applies, bool ignore_case) {
        auto flags = std::regex::ECMAScript;
        if (ignore_case) flags |= std::regex::icase;
        m_rules.push_back({std::regex(glob_to_regex(glob), flags), glob, category, applies});
    }

    std::optional<Category> PathClassifier::classify(const std::string& name,
                                                     const std::filesystem::path& parent,
                                                     bool is_directory) const {
        if (name.empty()) return std::nullopt;

        const Applies kind = is_directory ? Applies::Directory : Applies::File;
        for (const auto& rule : m_rules) {
            if (rule.applies != kind) continue;
            if (!std::regex_match(name, rule.regex)) continue;

            if (rule.category == Category::SystemCache) {
                return refine_cache(name, parent);
            }
            return rule.category;
        }
        return std::nullopt;
    }

    Category PathClassifier::refine_cache(const std::string& name, const std::filesystem::path& parent) {
        const std::string full = lower((parent / name).generic_string());

        if (contains_any(full, {"chrome", "chromium", "firefox", "mozilla", "safari", "brave", "microsoft edge", "opera"})) {
            return Category::BrowserCache;
        }
        if (contains_any(full, {"pip", "npm", "yarn", "pnpm", "cargo", "homebrew", "brew", "go-build", "composer", "gem", "nuget"})) {
            return Category::PackageCache;
        }
        return Category::SystemCache;
    }

    std::string PathClassifier::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (char c : glob) {
            if (c == '*') {
                regex_str += ".*";
            } else if (c == '?') {
                regex_str += ".";
            } else if (c == '.' || c == '+' || c == '(' || c == ')' || c == '^' || c == '$' ||
                       c == '|' || c == '{' || c == '}' || c == '\\') {
                regex_str += '\\';
                regex_str += c;
            } else {
                regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
