#include "deswitch/script_composer.hpp"
#include "deswitch/dm_transition.hpp"
#include "deswitch/profile_diff.hpp"
#include "deswitch/string_utils.hpp"

#include <algorithm>  // for replace, any_of
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using deswitch::package::PackageCommands;
using deswitch::package::PackageManager;
using deswitch::profile::DiffResult;
using deswitch::profile::Profile;
using deswitch::script::ScriptSection;
using deswitch::script::ScriptSectionKind;
using deswitch::services::DisplayManagerTransition;

// Shell variable holding the still installed removal targets.
constexpr auto REMOVE_TARGETS_VAR = "REMOVE_TARGETS"sv;

auto render_header(const Profile& current, const Profile& target, PackageManager kind, std::string_view script_name) noexcept -> ScriptSection {
    const auto& manager_name = deswitch::package::package_manager_to_string(kind);

    ScriptSection section{.kind = ScriptSectionKind::Header};
    auto& lines = section.lines;
    lines.emplace_back("#!/bin/sh");
    lines.emplace_back("# ----------------------------------------------------");
    lines.emplace_back("# Generated by de-switcher");
    lines.emplace_back(fmt::format(FMT_COMPILE("# Current profile: {} ({})"), current.label, current.id));
    lines.emplace_back(fmt::format(FMT_COMPILE("# Target profile: {} ({})"), target.label, target.id));
    lines.emplace_back(fmt::format(FMT_COMPILE("# Package manager: {}"), manager_name));
    lines.emplace_back("#");
    lines.emplace_back("# REVIEW THIS SCRIPT BEFORE RUNNING IT FROM A TTY:");
    lines.emplace_back(fmt::format(FMT_COMPILE("# sh ./{}"), script_name));
    lines.emplace_back("# ----------------------------------------------------");

    // the old session must not be running while its packages are removed
    lines.emplace_back(R"(if [ -n "${DISPLAY:-}" ] || [ -n "${WAYLAND_DISPLAY:-}" ]; then)");
    lines.emplace_back(R"(    echo "Run this script from a text console (TTY), not from a graphical session.")");
    lines.emplace_back("    exit 1");
    lines.emplace_back("fi");

    if (deswitch::package::requires_unprivileged_user(kind)) {
        lines.emplace_back(R"sh(if [ "$(id -u)" -eq 0 ]; then)sh");
        lines.emplace_back(fmt::format(FMT_COMPILE(R"(    echo "{} must not be run as root, start this script as a regular user.")"), manager_name));
        lines.emplace_back("    exit 1");
        lines.emplace_back("fi");
    }

    lines.emplace_back(fmt::format(FMT_COMPILE(R"(echo "Preparing to switch from {} to {} using {}...")"), current.id, target.id, manager_name));
    return section;
}

auto render_removal(const DiffResult& diff, const PackageCommands& commands) noexcept -> std::optional<ScriptSection> {
    if (diff.to_remove.empty()) {
        return std::nullopt;
    }
    const auto& remove_cmd = commands.remove_command({fmt::format(FMT_COMPILE("${}"), REMOVE_TARGETS_VAR)});
    if (!remove_cmd) {
        return std::nullopt;
    }
    const auto& packages = deswitch::utils::join(diff.to_remove, " "sv);

    ScriptSection section{.kind = ScriptSectionKind::Removal};
    auto& lines = section.lines;
    lines.emplace_back("# Remove packages of the current profile that the target does not need");
    lines.emplace_back(fmt::format(FMT_COMPILE(R"(echo "Removing packages: {}")"), packages));
    lines.emplace_back(fmt::format(FMT_COMPILE("{}=$({})"), REMOVE_TARGETS_VAR, deswitch::package::query_installed_command(diff.to_remove)));
    lines.emplace_back(fmt::format(FMT_COMPILE(R"(if [ -n "${}" ]; then)"), REMOVE_TARGETS_VAR));
    lines.emplace_back(fmt::format(FMT_COMPILE(R"(    {} || echo "Warning: package removal failed, continuing.")"), *remove_cmd));
    lines.emplace_back("fi");
    return section;
}

auto render_installation(const DiffResult& diff, const PackageCommands& commands) noexcept -> std::optional<ScriptSection> {
    const auto& install_cmd = commands.install_command(diff.to_install);
    if (!install_cmd) {
        return std::nullopt;
    }
    const auto& packages = deswitch::utils::join(diff.to_install, " "sv);

    ScriptSection section{.kind = ScriptSectionKind::Installation};
    auto& lines = section.lines;
    lines.emplace_back("# Install packages of the target profile");
    lines.emplace_back(fmt::format(FMT_COMPILE(R"(echo "Installing packages: {}")"), packages));
    lines.emplace_back(fmt::format(FMT_COMPILE("if ! {}; then"), *install_cmd));
    lines.emplace_back(R"(    echo "Package installation failed. The old display manager may already be removed, reinstall or enable one before rebooting.")");
    lines.emplace_back("    exit 1");
    lines.emplace_back("fi");
    return section;
}

auto render_display_manager(const DisplayManagerTransition& transition, const Profile& target) noexcept -> std::optional<ScriptSection> {
    if (transition.empty()) {
        return std::nullopt;
    }

    ScriptSection section{.kind = ScriptSectionKind::DisplayManager};
    auto& lines = section.lines;
    lines.emplace_back("# Switch the display manager");

    // The new unit must exist before the old one is disabled.
    if (transition.enable) {
        const auto& enable_unit = deswitch::services::service_unit_name(*transition.enable);
        lines.emplace_back(fmt::format(FMT_COMPILE("if ! systemctl cat {} >/dev/null 2>&1; then"), enable_unit));
        lines.emplace_back(fmt::format(FMT_COMPILE(R"(    echo "{} is not installed, display manager left unchanged.")"), enable_unit));
        lines.emplace_back("    exit 1");
        lines.emplace_back("fi");
    }
    if (transition.disable) {
        const auto& disable_unit = deswitch::services::service_unit_name(*transition.disable);
        lines.emplace_back(fmt::format(FMT_COMPILE(R"(sudo systemctl disable {} || echo "{} is already gone.")"), disable_unit, disable_unit));
    }
    if (transition.enable) {
        // --force replaces a stale display-manager.service alias
        lines.emplace_back(fmt::format(FMT_COMPILE("sudo systemctl enable --force {}"), deswitch::services::service_unit_name(*transition.enable)));
    } else {
        lines.emplace_back(fmt::format(FMT_COMPILE(R"(echo "{} does not use a display manager, start it from a TTY after reboot.")"), target.id));
    }
    return section;
}

auto render_reboot() noexcept -> ScriptSection {
    return ScriptSection{
        .kind  = ScriptSectionKind::Reboot,
        .lines = {
            "# Reboot",
            R"(echo "")",
            R"(echo "!!! The switch is complete. You MUST reboot to finish it. !!!")",
            R"(printf "Do you want to reboot now? [y/N]: ")",
            "read -r response",
            R"(case "$response" in)",
            "    [yY][eE][sS]|[yY])",
            "        sudo reboot",
            "        ;;",
            "    *)",
            R"(        echo "Please reboot manually to complete the switch.")",
            "        ;;",
            "esac",
        },
    };
}

auto render_text(const std::vector<ScriptSection>& sections) noexcept -> std::string {
    std::vector<std::string> blocks{};
    blocks.reserve(sections.size());
    for (const auto& section : sections) {
        blocks.emplace_back(deswitch::utils::join(section.lines, "\n"sv));
    }
    return fmt::format(FMT_COMPILE("{}\n"), deswitch::utils::join(blocks, "\n\n"sv));
}

}  // namespace

namespace deswitch::script {

auto GeneratedScript::has_section(ScriptSectionKind kind) const noexcept -> bool {
    return std::ranges::any_of(sections, [kind](auto&& section) { return section.kind == kind; });
}

auto section_kind_to_string(ScriptSectionKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ScriptSectionKind::Header:
        return "header"sv;
    case ScriptSectionKind::Removal:
        return "removal"sv;
    case ScriptSectionKind::Installation:
        return "installation"sv;
    case ScriptSectionKind::DisplayManager:
        return "display-manager"sv;
    case ScriptSectionKind::Reboot:
        return "reboot"sv;
    }
    return "unknown"sv;
}

auto make_script_filename(std::string_view current_profile, std::string_view target_profile) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("de_switcher_{}_to_{}.sh"), current_profile, target_profile);
}

auto compose_script(const profile::ProfileCatalog& catalog, const ScriptRequest& request) noexcept
    -> std::expected<GeneratedScript, ScriptError> {
    auto current = catalog.lookup(request.current_profile);
    if (!current) {
        spdlog::error("Cannot compose script: {}", current.error().message);
        return std::unexpected(std::move(current.error()));
    }
    auto target = catalog.lookup(request.target_profile);
    if (!target) {
        spdlog::error("Cannot compose script: {}", target.error().message);
        return std::unexpected(std::move(target.error()));
    }
    auto commands = package::commands_for(request.package_manager);
    if (!commands) {
        spdlog::error("Cannot compose script: {}", commands.error().message);
        return std::unexpected(std::move(commands.error()));
    }

    const auto& diff       = profile::diff_profiles(*current, *target);
    const auto& transition = services::plan_display_manager_transition(*current, *target);

    GeneratedScript script{};
    script.file_name = request.script_name.empty() ? make_script_filename(current->id, target->id) : request.script_name;
    // banner is a comment, keep it on one line
    std::ranges::replace(script.file_name, '\n', '_');

    script.sections.emplace_back(render_header(*current, *target, request.package_manager, script.file_name));
    if (auto section = render_removal(diff, *commands); section.has_value()) {
        script.sections.emplace_back(std::move(*section));
    }
    if (auto section = render_installation(diff, *commands); section.has_value()) {
        script.sections.emplace_back(std::move(*section));
    }
    if (auto section = render_display_manager(transition, *target); section.has_value()) {
        script.sections.emplace_back(std::move(*section));
    }
    script.sections.emplace_back(render_reboot());
    script.text = render_text(script.sections);

    spdlog::info("Composed script {} ({} -> {}, {})", script.file_name, current->id, target->id,
        package::package_manager_to_string(request.package_manager));
    return script;
}

}  // namespace deswitch::script
