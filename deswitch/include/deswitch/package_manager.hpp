#ifndef PACKAGE_MANAGER_HPP
#define PACKAGE_MANAGER_HPP

#include "deswitch/script_error.hpp"

#include <array>        // for array
#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace deswitch::package {

/// @brief Package manager front end used by the generated script
enum class PackageManager : std::uint8_t {
    /// Plain pacman, run through sudo
    Pacman,
    /// yay AUR helper
    Yay,
    /// paru AUR helper
    Paru
};

/// @brief All supported package managers, in selector order
inline constexpr std::array<PackageManager, 3> kPackageManagers{PackageManager::Pacman, PackageManager::Yay, PackageManager::Paru};

/// @brief Command templates of a package manager
struct PackageCommands final {
    /// Program name, e.g. "pacman"
    std::string_view program{};
    /// Prefix needed for privileged operations, e.g. "sudo", empty if the program escalates itself
    std::string_view privilege_prefix{};
    /// Flags for non-interactive removal with dependency cleanup
    std::string_view remove_flags{};
    /// Flags for non-interactive sync and installation
    std::string_view install_flags{};

    /// @brief Render removal command line
    /// @param targets Package names, or shell words expanding to them
    /// @return The command line, or nullopt if there is nothing to remove
    [[nodiscard]] auto remove_command(const std::vector<std::string>& targets) const noexcept -> std::optional<std::string>;

    /// @brief Render installation command line
    /// @param targets Package names
    /// @return The command line, or nullopt if there is nothing to install
    [[nodiscard]] auto install_command(const std::vector<std::string>& targets) const noexcept -> std::optional<std::string>;

    constexpr bool operator==(const PackageCommands&) const = default;
};

/// @brief Get command templates for package manager
/// @param kind The package manager
/// @return The command templates, or UnsupportedPackageManager error
[[nodiscard]] auto commands_for(PackageManager kind) noexcept -> std::expected<PackageCommands, ScriptError>;

/// @brief Convert package manager to string
[[nodiscard]] auto package_manager_to_string(PackageManager kind) noexcept -> std::string_view;

/// @brief Convert string to package manager
/// @return The package manager or std::nullopt if unknown
[[nodiscard]] auto package_manager_from_string(std::string_view name) noexcept -> std::optional<PackageManager>;

/// @brief Whether the package manager refuses to run as root
[[nodiscard]] auto requires_unprivileged_user(PackageManager kind) noexcept -> bool;

/// @brief Command listing which of the given packages are installed.
/// Group names are expanded to their installed members.
[[nodiscard]] auto query_installed_command(const std::vector<std::string>& packages) noexcept -> std::string;

}  // namespace deswitch::package

#endif  // PACKAGE_MANAGER_HPP
