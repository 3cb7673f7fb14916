#include "tui.hpp"
#include "definitions.hpp"
#include "utils.hpp"
#include "widgets.hpp"

// import deswitch
#include "deswitch/script_composer.hpp"

#include <algorithm>  // for find_if, find
#include <iterator>   // for distance
#include <cstdint>    // for int32_t
#include <vector>     // for vector

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

/* clang-format off */
#include <ftxui/component/component.hpp>           // for Renderer, Button
#include <ftxui/component/screen_interactive.hpp>  // for Component, ScreenI...
#include <ftxui/dom/elements.hpp>                  // for operator|, size
/* clang-format on */

using namespace ftxui;
using namespace std::string_view_literals;

namespace tui {

auto select_profile(const deswitch::profile::ProfileCatalog& catalog, std::string_view body, std::string_view preselected) noexcept -> std::optional<std::string> {
    const auto& profiles = catalog.profiles();

    std::vector<std::string> entries{};
    entries.reserve(profiles.size());
    for (const auto& profile : profiles) {
        entries.emplace_back(fmt::format(FMT_COMPILE("{} ({})"), profile.label, profile.id));
    }

    std::int32_t selected{};
    const auto& preselected_it = std::ranges::find_if(profiles, [&](auto&& profile) { return profile.id == preselected; });
    if (preselected_it != profiles.end()) {
        selected = static_cast<std::int32_t>(std::distance(profiles.begin(), preselected_it));
    }

    auto screen = ScreenInteractive::Fullscreen();
    std::optional<std::string> profile_id{};
    auto ok_callback = [&] {
        profile_id = profiles[static_cast<std::size_t>(selected)].id;
        spdlog::info("selected: {}", *profile_id);
        screen.ExitLoopClosure()();
    };

    static constexpr auto UseSpaceBar = "Use [Spacebar] to de/select options listed."sv;
    const auto& options_body          = fmt::format(FMT_COMPILE("\n{}\n{}\n"), body, UseSpaceBar);

    static constexpr auto profile_title = "DE Switcher | Select Profile"sv;
    detail::radiolist_widget(entries, ok_callback, &selected, &screen, {options_body, profile_title}, {.text_size = nothing});
    return profile_id;
}

auto select_package_manager(deswitch::package::PackageManager preselected) noexcept -> std::optional<deswitch::package::PackageManager> {
    const auto& managers = deswitch::package::kPackageManagers;

    std::vector<std::string> entries{};
    for (auto kind : managers) {
        entries.emplace_back(deswitch::package::package_manager_to_string(kind));
    }

    std::int32_t selected{};
    const auto& preselected_it = std::ranges::find(managers, preselected);
    if (preselected_it != managers.end()) {
        selected = static_cast<std::int32_t>(std::distance(managers.begin(), preselected_it));
    }

    auto screen = ScreenInteractive::Fullscreen();
    std::optional<deswitch::package::PackageManager> manager{};
    auto ok_callback = [&] {
        manager = managers[static_cast<std::size_t>(selected)];
        spdlog::info("selected: {}", deswitch::package::package_manager_to_string(*manager));
        screen.ExitLoopClosure()();
    };

    static constexpr auto manager_body  = "\nPlease choose the package manager used by the script.\nyay and paru must be run as a regular user.\n"sv;
    static constexpr auto manager_title = "DE Switcher | Package Manager"sv;
    detail::radiolist_widget(entries, ok_callback, &selected, &screen, {manager_body, manager_title}, {.text_size = nothing});
    return manager;
}

bool init(const deswitch::profile::ProfileCatalog& catalog) noexcept {
    const auto& settings = utils::current_settings();

    // Ask for current profile if it's unknown, otherwise let the user correct the detected one
    auto current_profile = settings.current_profile;
    if (!current_profile) {
        static constexpr auto current_body = "The running desktop could not be detected.\nPlease choose the currently installed profile."sv;
        current_profile = tui::select_profile(catalog, current_body);
        /* clang-format off */
        if (!current_profile) { return true; }
        /* clang-format on */
    } else {
        const auto& confirm_body = fmt::format(FMT_COMPILE("\nCurrent profile: {}\nIs this correct?\n"), *current_profile);
        if (!detail::yesno_widget(confirm_body, size(HEIGHT, LESS_THAN, 10) | size(WIDTH, LESS_THAN, 50))) {
            static constexpr auto correct_body = "Please choose the currently installed profile."sv;
            current_profile = tui::select_profile(catalog, correct_body, *current_profile);
            /* clang-format off */
            if (!current_profile) { return true; }
            /* clang-format on */
        }
    }

    const auto& target_body = fmt::format(FMT_COMPILE("Current profile: {}\nPlease choose the profile to switch to."), *current_profile);
    auto target_profile     = tui::select_profile(catalog, target_body, settings.target_profile.value_or(""));
    /* clang-format off */
    if (!target_profile) { return true; }
    /* clang-format on */

    const auto& package_manager = tui::select_package_manager(settings.package_manager);
    /* clang-format off */
    if (!package_manager) { return true; }
    /* clang-format on */

    const deswitch::script::ScriptRequest request{
        .current_profile = *current_profile,
        .target_profile  = *target_profile,
        .package_manager = *package_manager,
    };
    auto script = deswitch::script::compose_script(catalog, request);
    if (!script) {
        const auto& error_msg = fmt::format(FMT_COMPILE("{}: {}"), deswitch::script_error_kind_to_string(script.error().kind), script.error().message);
        detail::msgbox_widget(error_msg);
        error_inter("{}\n", error_msg);
        return false;
    }

    const auto& output_dir   = settings.output_dir.value_or(".");
    const auto& preview_body = fmt::format(FMT_COMPILE("Review the script, OK writes it to {}/{}"), output_dir, script->file_name);
    if (!detail::preview_widget(script->text, {preview_body, "DE Switcher | Preview"sv})) {
        spdlog::info("Script discarded by user");
        return true;
    }

    auto script_path = utils::write_script(*script, output_dir);
    if (!script_path) {
        spdlog::error("{}", script_path.error());
        error_inter("{}\n", script_path.error());
        return false;
    }
    utils::print_next_steps(*script_path);
    return true;
}

}  // namespace tui
