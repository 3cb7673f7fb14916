#ifndef PROFILE_CATALOG_HPP
#define PROFILE_CATALOG_HPP

#include "deswitch/script_error.hpp"

#include <cstddef>      // for size_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace deswitch::profile {

/// @brief Desktop environment or window manager profile.
struct Profile final {
    /// Stable key, e.g. "gnome", "kde"
    std::string id{};
    /// Human readable name
    std::string label{};
    /// Packages the profile requires, order is irrelevant
    std::vector<std::string> packages{};
    /// Display manager service without ".service" suffix, absent for WMs started from a TTY
    std::optional<std::string> display_manager{};
    /// XDG_CURRENT_DESKTOP tokens identifying a running session of this profile
    std::vector<std::string> session_names{};

    bool operator==(const Profile&) const = default;
};

/// @brief Immutable registry of known profiles.
class ProfileCatalog final {
 public:
    using value_type      = std::vector<Profile>;
    using const_reference = const value_type&;

    ProfileCatalog() noexcept = default;

    /// @brief Build a catalog from the given profiles.
    /// @param profiles The profiles, kept in the given order.
    /// @return The catalog, or error string describing the first invalid entry.
    [[nodiscard]] static auto create(value_type profiles) noexcept -> std::expected<ProfileCatalog, std::string>;

    /// @brief Compiled-in catalog of supported profiles.
    [[nodiscard]] static auto defaults() noexcept -> ProfileCatalog;

    /// @brief Lookup profile by id.
    /// @return Copy of the profile, or ProfileNotFound error.
    [[nodiscard]] auto lookup(std::string_view id) const noexcept -> std::expected<Profile, ScriptError>;

    [[nodiscard]] auto contains(std::string_view id) const noexcept -> bool;

    /// @brief Profile ids in catalog order.
    [[nodiscard]] auto ids() const noexcept -> std::vector<std::string>;

    /* clang-format off */

    // Element access.
    auto profiles() const noexcept -> const_reference
    { return m_profiles; }

    // Capacity.
    auto size() const noexcept -> std::size_t
    { return m_profiles.size(); }
    auto empty() const noexcept -> bool
    { return m_profiles.empty(); }

    /* clang-format on */

 private:
    explicit ProfileCatalog(value_type profiles) noexcept;

    value_type m_profiles{};
};

/// @brief Profiles the compiled-in catalog is built from.
[[nodiscard]] auto default_profiles() noexcept -> std::vector<Profile>;

/// @brief Overlay profiles on top of a base list.
/// Profiles of the overlay replace base profiles with the same id, new ids are appended.
[[nodiscard]] auto merge_profiles(std::vector<Profile> base, std::vector<Profile> overlay) noexcept -> std::vector<Profile>;

/// @brief Checks name against the Arch package name rules: [a-z0-9@._+-], not starting with '-' or '.'.
[[nodiscard]] auto is_valid_package_name(std::string_view name) noexcept -> bool;

/// @brief Checks name against the systemd unit name alphabet: [A-Za-z0-9:_.@-].
[[nodiscard]] auto is_valid_service_name(std::string_view name) noexcept -> bool;

}  // namespace deswitch::profile

#endif  // PROFILE_CATALOG_HPP
