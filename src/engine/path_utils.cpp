#include "path_utils.hpp"
#include "../platform.hpp"

namespace reclaim::engine {

    namespace {
        std::vector<std::filesystem::path> components(const std::filesystem::path& path) {
            std::vector<std::filesystem::path> out;
            for (const auto& part : path.lexically_normal()) {
                // A trailing separator yields an empty final element.
                if (!part.empty()) out.push_back(part);
            }
            return out;
        }
    }

    std::filesystem::path normalized(const std::filesystem::path& path) {
        auto out = path.lexically_normal();
        if (!out.has_filename() && out.has_relative_path()) {
            out = out.parent_path();
        }
        return out;
    }

    bool is_within(const std::filesystem::path& path, const std::filesystem::path& prefix) {
        const auto p = components(path);
        const auto pre = components(prefix);
        if (pre.empty() || pre.size() > p.size()) return false;
        for (size_t i = 0; i < pre.size(); ++i) {
            if (p[i] != pre[i]) return false;
        }
        return true;
    }

    bool contains_components(const std::filesystem::path& path, const std::filesystem::path& sequence) {
        const auto p = components(path);
        const auto seq = components(sequence);
        if (seq.empty() || seq.size() > p.size()) return false;
        for (size_t start = 0; start + seq.size() <= p.size(); ++start) {
            bool match = true;
            for (size_t i = 0; i < seq.size(); ++i) {
                if (p[start + i] != seq[i]) {
                    match = false;
                    break;
                }
            }
            if (match) return true;
        }
        return false;
    }

    bool is_protected(const std::filesystem::path& path, const std::vector<std::filesystem::path>& extra) {
        for (const auto& root : platform::system::protected_roots()) {
            if (is_within(path, root)) return true;
        }
        for (const auto& root : extra) {
            if (is_within(path, root)) return true;
        }
        return false;
    }

    std::size_t path_depth(const std::filesystem::path& path) {
        return components(path).size();
    }

}
