#include "../platform.hpp"
#include <cstdlib>

namespace raptor::platform {

    namespace {
        std::filesystem::path xdg_dir(const char* variable, const char* fallback) {
            const char* xdg = std::getenv(variable);
            if (xdg && *xdg) return std::filesystem::path(xdg) / "raptor";
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / fallback / "raptor" : std::filesystem::path();
        }
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            return xdg_dir("XDG_CONFIG_HOME", ".config");
        }
        std::filesystem::path get_data_dir() {
            return xdg_dir("XDG_DATA_HOME", ".local/share");
        }
    }

}
