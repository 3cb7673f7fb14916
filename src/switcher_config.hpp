#ifndef SWITCHER_CONFIG_HPP
#define SWITCHER_CONFIG_HPP

// import deswitch
#include "deswitch/package_manager.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace switcher {

/// Settings of a single switcher run.
struct SwitcherConfig {
    bool headless_mode{false};

    // Profiles
    std::optional<std::string> current_profile{};
    std::optional<std::string> target_profile{};

    deswitch::package::PackageManager package_manager{deswitch::package::PackageManager::Pacman};

    // Paths
    std::optional<std::string> output_dir{};
    std::optional<std::string> catalog_path{};
};

/// Parses switcher configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return SwitcherConfig on success, or error string on failure.
[[nodiscard]] auto parse_switcher_config(std::string_view json_content) noexcept
    -> std::expected<SwitcherConfig, std::string>;

/// Validates that all required fields are present for headless mode.
/// current_profile is expected to already hold the detected profile, if any.
/// @param config The configuration to validate.
/// @return void on success, or error string describing missing fields.
[[nodiscard]] auto validate_headless_config(const SwitcherConfig& config) noexcept
    -> std::expected<void, std::string>;

/// Returns default SwitcherConfig.
[[nodiscard]] auto get_default_config() noexcept -> SwitcherConfig;

}  // namespace switcher

#endif  // SWITCHER_CONFIG_HPP
