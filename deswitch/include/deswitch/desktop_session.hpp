#ifndef DESKTOP_SESSION_HPP
#define DESKTOP_SESSION_HPP

#include "deswitch/profile_catalog.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace deswitch::session {

// Resolve XDG_CURRENT_DESKTOP value (e.g. "Budgie:GNOME") to a catalog profile id.
// Tokens are checked in order, the first token matching any profile session name wins.
auto detect_profile(const profile::ProfileCatalog& catalog, std::string_view current_desktop) noexcept -> std::optional<std::string>;

}  // namespace deswitch::session

#endif  // DESKTOP_SESSION_HPP
