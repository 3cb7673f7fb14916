#include "deswitch/desktop_session.hpp"
#include "deswitch/string_utils.hpp"

#include <algorithm>  // for any_of

#include <spdlog/spdlog.h>

namespace deswitch::session {

auto detect_profile(const profile::ProfileCatalog& catalog, std::string_view current_desktop) noexcept -> std::optional<std::string> {
    for (auto&& token : utils::make_multiline_view(current_desktop, ':')) {
        const auto& session = utils::to_lower(token);
        for (const auto& profile : catalog.profiles()) {
            const bool matches = std::ranges::any_of(profile.session_names,
                [&](auto&& name) { return utils::to_lower(name) == session; });
            if (matches) {
                spdlog::info("Detected current desktop '{}' as profile '{}'", current_desktop, profile.id);
                return profile.id;
            }
        }
    }

    spdlog::warn("Current desktop '{}' does not match any known profile", current_desktop);
    return std::nullopt;
}

}  // namespace deswitch::session
