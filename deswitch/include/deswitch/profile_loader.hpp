#ifndef PROFILE_LOADER_HPP
#define PROFILE_LOADER_HPP

#include "deswitch/profile_catalog.hpp"

#include <optional>     // for optional
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace deswitch::profile {

// Parse profiles from TOML content.
// Every profile is a table under [profile.<id>] with 'packages' array and
// optional 'label', 'display_manager' and 'session_names'.
auto parse_profiles(std::string_view config_content) noexcept -> std::optional<std::vector<Profile>>;

// Build catalog from the compiled-in profiles extended by the profiles file.
// A missing file yields the default catalog, unreadable or invalid content yields nullopt.
auto load_catalog(std::string_view profiles_path) noexcept -> std::optional<ProfileCatalog>;

}  // namespace deswitch::profile

#endif  // PROFILE_LOADER_HPP
