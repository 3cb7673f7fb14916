#include "deswitch/dm_transition.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace deswitch::services {

auto plan_display_manager_transition(const profile::Profile& current, const profile::Profile& target) noexcept -> DisplayManagerTransition {
    if (current.display_manager == target.display_manager) {
        spdlog::debug("display manager unchanged between {} and {}", current.id, target.id);
        return {};
    }

    DisplayManagerTransition transition{
        .disable = current.display_manager,
        .enable  = target.display_manager,
    };
    if (!transition.enable) {
        spdlog::warn("target profile '{}' has no display manager, session must be started from a TTY", target.id);
    }
    return transition;
}

auto service_unit_name(std::string_view service) noexcept -> std::string {
    if (service.ends_with(".service"sv)) {
        return std::string{service};
    }
    return fmt::format(FMT_COMPILE("{}.service"), service);
}

}  // namespace deswitch::services
