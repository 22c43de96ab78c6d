#include "../platform.hpp"
#include <cstdlib>
#include <limits.h>
#include <pwd.h>
#include <unistd.h>

namespace ferry::platform {

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/ferry" : "";
        }

        std::string hostname() {
            char buffer[HOST_NAME_MAX + 1] = {};
            if (gethostname(buffer, sizeof(buffer) - 1) != 0) return "";
            return std::string(buffer);
        }

        std::string username() {
            if (struct passwd* pw = getpwuid(geteuid()); pw && pw->pw_name) {
                return pw->pw_name;
            }
            const char* user = std::getenv("USER");
            return user ? user : "";
        }
    }

}
