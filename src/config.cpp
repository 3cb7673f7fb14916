#include "config.hpp"
#include "definitions.hpp"  // for error_inter

#include <cstdlib>  // for getenv
#include <memory>   // for unique_ptr, make_unique, operator==

static std::unique_ptr<Config> s_config = nullptr;

bool Config::initialize() noexcept {
    if (s_config != nullptr) {
        error_inter("You should only initialize it once!\n");
        return false;
    }
    s_config = std::make_unique<Config>();
    if (s_config) {
        s_config->m_data["CATALOG_PATH"]    = "/etc/de-switcher/profiles.toml";
        s_config->m_data["OUTPUT_DIR"]      = ".";
        s_config->m_data["PACKAGE_MANAGER"] = "pacman";
        s_config->m_data["HEADLESS_MODE"]   = 0;

        // e.g "KDE" or "Budgie:GNOME"
        const char* current_desktop         = std::getenv("XDG_CURRENT_DESKTOP");
        s_config->m_data["CURRENT_DESKTOP"] = std::string{current_desktop != nullptr ? current_desktop : ""};

        // Profiles, empty until detected or selected
        s_config->m_data["CURRENT_PROFILE"] = "";
        s_config->m_data["TARGET_PROFILE"]  = "";
    }

    return s_config.get();
}

auto Config::instance() -> Config* {
    return s_config.get();
}
