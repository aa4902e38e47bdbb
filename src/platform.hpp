#pragma once

#include <filesystem>

namespace raptor::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        /**
         * @brief $XDG_CONFIG_HOME/raptor, else ~/.config/raptor. Empty if neither is known.
         */
        std::filesystem::path get_config_dir();

        /**
         * @brief $XDG_DATA_HOME/raptor, else ~/.local/share/raptor. Empty if neither is known.
         */
        std::filesystem::path get_data_dir();
    }

}
