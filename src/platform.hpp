#pragma once

#include <string>
#include <filesystem>

namespace ferry::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();

        /**
         * @brief Host name of this machine, or an empty string if it cannot be read.
         */
        std::string hostname();

        /**
         * @brief Login name of the current user, or an empty string if unknown.
         */
        std::string username();
    }

}
