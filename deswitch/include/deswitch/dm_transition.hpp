#ifndef DM_TRANSITION_HPP
#define DM_TRANSITION_HPP

#include "deswitch/profile_catalog.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace deswitch::services {

/// @brief Display manager services to disable and enable.
/// Empty when both profiles run under the same display manager, or both have none.
struct DisplayManagerTransition final {
    /// Service of the current profile
    std::optional<std::string> disable{};
    /// Service of the target profile
    std::optional<std::string> enable{};

    [[nodiscard]] auto empty() const noexcept -> bool {
        return !disable.has_value() && !enable.has_value();
    }

    bool operator==(const DisplayManagerTransition&) const = default;
};

/// @brief Plan display manager switch between two profiles.
/// @param current The currently installed profile
/// @param target The profile to switch to
/// @return The transition, enable is always set when the target has a display manager
[[nodiscard]] auto plan_display_manager_transition(const profile::Profile& current, const profile::Profile& target) noexcept -> DisplayManagerTransition;

/// @brief Unit name of a service, e.g. "gdm" -> "gdm.service".
[[nodiscard]] auto service_unit_name(std::string_view service) noexcept -> std::string;

}  // namespace deswitch::services

#endif  // DM_TRANSITION_HPP
