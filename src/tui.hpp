#ifndef TUI_HPP
#define TUI_HPP

// import deswitch
#include "deswitch/package_manager.hpp"
#include "deswitch/profile_catalog.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace tui {
auto select_profile(const deswitch::profile::ProfileCatalog& catalog, std::string_view body, std::string_view preselected = {}) noexcept -> std::optional<std::string>;
auto select_package_manager(deswitch::package::PackageManager preselected) noexcept -> std::optional<deswitch::package::PackageManager>;

bool init(const deswitch::profile::ProfileCatalog& catalog) noexcept;
}  // namespace tui

#endif  // TUI_HPP
