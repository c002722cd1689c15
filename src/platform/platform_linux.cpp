#include "../platform.hpp"
#include <cstdlib>
#include <thread>

namespace reclaim::platform {

    namespace system {
        std::filesystem::path get_home_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) : std::filesystem::path();
        }

        std::filesystem::path get_config_dir() {
            if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
                return std::filesystem::path(xdg) / "reclaim";
            }
            auto home = get_home_dir();
            return home.empty() ? home : home / ".config/reclaim";
        }

        std::filesystem::path get_data_dir() {
            if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
                return std::filesystem::path(xdg) / "reclaim";
            }
            auto home = get_home_dir();
            return home.empty() ? home : home / ".local/share/reclaim";
        }

        std::filesystem::path get_cache_dir() {
            if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
                return std::filesystem::path(xdg) / "reclaim";
            }
            auto home = get_home_dir();
            return home.empty() ? home : home / ".cache/reclaim";
        }

        unsigned available_parallelism() {
            unsigned n = std::thread::hardware_concurrency();
            return n == 0 ? 1 : n;
        }

        const std::vector<std::filesystem::path>& protected_roots() {
            static const std::vector<std::filesystem::path> roots = {
                "/System",
                "/Library",
                "/Applications",
                "/private/var/db",
                "/proc",
                "/sys",
                "/dev",
                "/run",
                "/boot",
                "/bin",
                "/sbin",
                "/lib",
                "/lib64",
                "/usr",
                "/etc",
                "/var/lib",
                "/snap",
            };
            return roots;
        }

        const std::vector<std::filesystem::path>& caution_paths() {
            static const std::vector<std::filesystem::path> paths = {
                "Library/Application Support",
                "Library/Mobile Documents",
                "Library/Mail",
                "Library/Keychains",
                ".ssh",
                ".gnupg",
                ".local/share/keyrings",
                ".password-store",
            };
            return paths;
        }
    }

}
