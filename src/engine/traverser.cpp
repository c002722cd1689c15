#include "traverser.hpp"
#include "validator.hpp"
#include "path_utils.hpp"
#include "../platform.hpp"
#include <atomic>
#include <exception>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace reclaim::engine {

    struct Traverser::PendingCandidate {
        ScanItem item;
        std::atomic<std::uintmax_t> size{0};
        std::atomic<size_t> remaining{1}; // the listing task itself
        std::atomic<bool> failed{false};
    };

    namespace {
        std::string describe(Category category, const std::string& name) {
            switch (category) {
                case Category::SystemCache:
                case Category::BrowserCache:
                case Category::PackageCache:
                    return "Cache directory: " + name;
                case Category::LogFile:
                    return "Large log file";
                case Category::TempFile:
                    return "Temporary file";
                case Category::LargeFile:
                    return "Large file";
                default:
                    return name + " directory";
            }
        }
    }

    Traverser::Traverser(WorkerPool& pool, const ScanConfig& config)
        : m_pool(pool), m_config(config) {}

    size_t Traverser::traverse(const std::vector<fs::path>& roots,
                               ItemCallback on_item,
                               FileCallback on_file,
                               WarningCallback on_warning) {
        m_on_item = std::move(on_item);
        m_on_file = std::move(on_file);
        m_on_warning = std::move(on_warning);

        size_t accessible = 0;
        for (const auto& raw : roots) {
            std::error_code ec;
            const fs::path root = normalized(fs::absolute(raw, ec));
            if (ec) {
                warn("Cannot resolve root " + raw.string() + ": " + ec.message());
                continue;
            }
            if (is_protected(root, m_config.extra_protected_paths)) {
                warn("Refusing to scan protected path " + root.string());
                continue;
            }
            if (is_skipped_directory(root)) {
                warn("Skipping caution path " + root.string());
                continue;
            }
            auto st = fs::status(root, ec);
            if (ec || !fs::is_directory(st)) {
                warn("Invalid root path: " + root.string() + (ec ? " (" + ec.message() + ")" : ""));
                continue;
            }
            // Listing permission is checked up front so an unreadable root counts as inaccessible.
            fs::directory_iterator listing(root, ec);
            if (ec) {
                warn("Cannot read root " + root.string() + ": " + ec.message());
                continue;
            }

            ++accessible;
            m_pool.submit([this, root] { walk_directory(root, 0); });
        }

        m_pool.wait();
        return accessible;
    }

    bool Traverser::is_skipped_directory(const fs::path& dir) const {
        if (is_protected(dir, m_config.extra_protected_paths)) return true;
        if (!m_config.skip_system) return false;

        // Matched against the whole path so a root inside ~/Library or ~/.ssh is covered too.
        for (const auto& caution : platform::system::caution_paths()) {
            if (contains_components(dir, caution)) return true;
        }
        return false;
    }

    void Traverser::walk_directory(const fs::path& dir, std::uint32_t depth) {
        const auto max_depth = m_config.effective_depth();
        if (max_depth && depth >= *max_depth) return;

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            warn("Cannot read directory " + dir.string() + ": " + ec.message());
            return;
        }

        std::vector<fs::directory_entry> entries;
        std::unordered_set<std::string> files;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                warn("Listing interrupted in " + dir.string() + ": " + ec.message());
                break;
            }
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) {
                files.insert(it->path().filename().string());
            }
            entries.push_back(*it);
        }

        for (const auto& entry : entries) {
            const fs::path& path = entry.path();
            const std::string name = path.filename().string();

            std::error_code st_ec;
            auto st = entry.symlink_status(st_ec);
            if (st_ec) {
                warn("Cannot stat " + path.string() + ": " + st_ec.message());
                continue;
            }
            if (fs::is_symlink(st)) continue;

            if (fs::is_directory(st)) {
                if (is_skipped_directory(path)) continue;

                auto category = m_classifier.classify(name, dir, true);
                if (category && Validator::validate(*category, files)) {
                    schedule_candidate(path, *category);
                    continue;
                }
                m_pool.submit([this, path, depth] { walk_directory(path, depth + 1); });
            } else if (fs::is_regular_file(st)) {
                visit_file(path, name, dir);
            }
        }
    }

    void Traverser::visit_file(const fs::path& path, const std::string& name, const fs::path& dir) {
        std::error_code ec;
        const std::uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            warn("Cannot read size of " + path.string() + ": " + ec.message());
            return;
        }

        auto category = m_classifier.classify(name, dir, false);
        if (category == Category::LogFile && size < m_config.min_log_size) {
            category.reset();
        }
        if (category == Category::TempFile && size == 0) {
            return;
        }

        if (category) {
            emit_item(make_item(path, *category, size, true, describe(*category, name)));
            return;
        }

        const bool hidden = !name.empty() && name[0] == '.';
        if (m_config.min_large_file_size > 0 && size >= m_config.min_large_file_size && !hidden) {
            emit_item(make_item(path, Category::LargeFile, size, true, describe(Category::LargeFile, name)));
        }

        if (size > 0 && size >= m_config.min_duplicate_size) {
            emit_file(path, size);
        }
    }

    void Traverser::schedule_candidate(const fs::path& dir, Category category) {
        auto pending = std::make_shared<PendingCandidate>();
        pending->item = make_item(dir, category, 0, true, describe(category, dir.filename().string()));

        m_pool.submit([this, pending, dir] {
            try {
                size_candidate_listing(pending, dir);
            } catch (const std::exception& e) {
                pending->failed = true;
                warn("Cannot size " + dir.string() + ": " + e.what());
            }
            finish_candidate(pending);
        });
    }

    void Traverser::size_candidate_listing(const std::shared_ptr<PendingCandidate>& pending, const fs::path& dir) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            pending->failed = true;
            warn("Cannot read directory " + dir.string() + ": " + ec.message());
            return;
        }

        std::uintmax_t local = 0;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                warn("Listing interrupted in " + dir.string() + ": " + ec.message());
                break;
            }
            std::error_code st_ec;
            auto st = it->symlink_status(st_ec);
            if (st_ec) {
                warn("Cannot stat " + it->path().string() + ": " + st_ec.message());
                continue;
            }

            if (fs::is_directory(st)) {
                const fs::path sub = it->path();
                pending->remaining.fetch_add(1);
                try {
                    m_pool.submit([this, pending, sub] {
                        try {
                            std::vector<std::string> warnings;
                            pending->size.fetch_add(directory_size(sub, warnings));
                            warn_all(warnings);
                        } catch (const std::exception& e) {
                            pending->failed = true;
                            warn("Cannot size " + sub.string() + ": " + e.what());
                        }
                        finish_candidate(pending);
                    });
                } catch (const std::exception& e) {
                    // The subtree task never ran, so its share is released here.
                    pending->failed = true;
                    warn("Cannot schedule sizing of " + sub.string() + ": " + e.what());
                    finish_candidate(pending);
                }
            } else if (fs::is_regular_file(st)) {
                std::error_code size_ec;
                auto size = fs::file_size(it->path(), size_ec);
                if (size_ec) {
                    warn("Cannot read size of " + it->path().string() + ": " + size_ec.message());
                    continue;
                }
                local += size;
            }
        }
        pending->size.fetch_add(local);
    }

    void Traverser::finish_candidate(const std::shared_ptr<PendingCandidate>& pending) {
        if (pending->remaining.fetch_sub(1) != 1) return;

        if (pending->failed) {
            warn("Dropped candidate " + pending->item.path.string() + ": its size could not be measured");
            return;
        }

        ScanItem item = pending->item;
        item.size_bytes = pending->size.load();
        if (item.size_bytes >= m_config.min_candidate_size) {
            emit_item(item);
        }
    }

    std::uintmax_t Traverser::directory_size(const fs::path& dir, std::vector<std::string>& warnings) {
        std::uintmax_t total = 0;
        std::vector<fs::path> stack{dir};

        while (!stack.empty()) {
            fs::path current = std::move(stack.back());
            stack.pop_back();

            std::error_code ec;
            fs::directory_iterator it(current, ec);
            if (ec) {
                warnings.push_back("Cannot size " + current.string() + ": " + ec.message());
                continue;
            }

            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) {
                    warnings.push_back("Sizing interrupted in " + current.string() + ": " + ec.message());
                    break;
                }
                std::error_code st_ec;
                auto st = it->symlink_status(st_ec);
                if (st_ec) {
                    warnings.push_back("Cannot stat " + it->path().string() + ": " + st_ec.message());
                    continue;
                }

                if (fs::is_directory(st)) {
                    stack.push_back(it->path());
                } else if (fs::is_regular_file(st)) {
                    std::error_code size_ec;
                    auto size = fs::file_size(it->path(), size_ec);
                    if (size_ec) {
                        warnings.push_back("Cannot read size of " + it->path().string() + ": " + size_ec.message());
                        continue;
                    }
                    total += size;
                }
            }
        }
        return total;
    }

    void Traverser::emit_item(const ScanItem& item) {
        std::lock_guard<std::mutex> lock(m_emit_mutex);
        if (m_on_item) m_on_item(item);
    }

    void Traverser::emit_file(const fs::path& path, std::uintmax_t size) {
        std::lock_guard<std::mutex> lock(m_emit_mutex);
        if (m_on_file) m_on_file(path, size);
    }

    void Traverser::warn(const std::string& message) {
        std::lock_guard<std::mutex> lock(m_emit_mutex);
        if (m_on_warning) m_on_warning(message);
    }

    void Traverser::warn_all(const std::vector<std::string>& messages) {
        if (messages.empty()) return;
        std::lock_guard<std::mutex> lock(m_emit_mutex);
        if (!m_on_warning) return;
        for (const auto& message : messages) m_on_warning(message);
    }

}
