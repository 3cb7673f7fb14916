#ifndef UTILS_HPP
#define UTILS_HPP

#include "definitions.hpp"
#include "switcher_config.hpp"

// import deswitch
#include "deswitch/profile_catalog.hpp"
#include "deswitch/script_composer.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace utils {

void dump_settings_to_log() noexcept;
bool parse_config() noexcept;

/// Builds the catalog from the compiled-in profiles and CATALOG_PATH.
[[nodiscard]] auto load_catalog() noexcept -> std::optional<deswitch::profile::ProfileCatalog>;

/// Fills CURRENT_PROFILE from CURRENT_DESKTOP unless settings already set it.
void detect_current_profile(const deswitch::profile::ProfileCatalog& catalog) noexcept;

/// Snapshot of the current settings.
[[nodiscard]] auto current_settings() noexcept -> switcher::SwitcherConfig;

/// @brief Write script into the output directory as an executable file.
/// Existing file with the same name is overwritten.
/// @return Path of the written script, or error message.
[[nodiscard]] auto write_script(const deswitch::script::GeneratedScript& script, std::string_view output_dir) noexcept
    -> std::expected<std::string, std::string>;
void print_next_steps(std::string_view script_path) noexcept;

/// Compose and write the script without TUI.
bool run_headless(const deswitch::profile::ProfileCatalog& catalog) noexcept;

}  // namespace utils

#endif  // UTILS_HPP
