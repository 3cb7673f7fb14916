#ifndef SCRIPT_COMPOSER_HPP
#define SCRIPT_COMPOSER_HPP

#include "deswitch/package_manager.hpp"
#include "deswitch/profile_catalog.hpp"
#include "deswitch/script_error.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace deswitch::script {

/// @brief Section of the generated script, in output order
enum class ScriptSectionKind : std::uint8_t {
    /// Shebang, review banner and run-time guards
    Header,
    /// Removal of packages the target does not need
    Removal,
    /// Installation of packages the target adds
    Installation,
    /// Display manager disable/enable pair
    DisplayManager,
    /// Interactive reboot prompt
    Reboot
};

/// @brief Rendered section of the script
struct ScriptSection final {
    ScriptSectionKind kind{ScriptSectionKind::Header};
    std::vector<std::string> lines{};

    bool operator==(const ScriptSection&) const = default;
};

/// @brief Inputs of a single generation request
struct ScriptRequest final {
    /// Id of the currently installed profile
    std::string current_profile{};
    /// Id of the profile to switch to
    std::string target_profile{};
    /// Package manager used by the script
    package::PackageManager package_manager{package::PackageManager::Pacman};
    /// File name shown in the review banner, defaults to make_script_filename()
    std::string script_name{};
};

/// @brief Generated migration script
struct GeneratedScript final {
    /// Suggested file name of the script
    std::string file_name{};
    /// Sections in output order, omitted sections are absent
    std::vector<ScriptSection> sections{};
    /// Full script text
    std::string text{};

    [[nodiscard]] auto has_section(ScriptSectionKind kind) const noexcept -> bool;
};

/// @brief Convert section kind to string
[[nodiscard]] auto section_kind_to_string(ScriptSectionKind kind) noexcept -> std::string_view;

/// @brief Default script file name, e.g. "de_switcher_gnome_to_kde.sh"
[[nodiscard]] auto make_script_filename(std::string_view current_profile, std::string_view target_profile) noexcept -> std::string;

/// @brief Compose migration script.
/// Resolves both profiles through the catalog, computes the package diff and
/// display manager transition and renders them in fixed order. Nothing is
/// rendered if any lookup fails. Identical inputs produce identical text.
/// @param catalog The profile catalog
/// @param request The generation request
/// @return The script, or ProfileNotFound/UnsupportedPackageManager error
[[nodiscard]] auto compose_script(const profile::ProfileCatalog& catalog, const ScriptRequest& request) noexcept
    -> std::expected<GeneratedScript, ScriptError>;

}  // namespace deswitch::script

#endif  // SCRIPT_COMPOSER_HPP
