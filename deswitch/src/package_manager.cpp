#include "deswitch/package_manager.hpp"
#include "deswitch/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using deswitch::package::PackageCommands;

// prefix program flags targets
auto render_command(const PackageCommands& commands, std::string_view flags, const std::vector<std::string>& targets) noexcept -> std::optional<std::string> {
    if (targets.empty()) {
        return std::nullopt;
    }

    const auto& args = deswitch::utils::join(targets, " "sv);
    if (commands.privilege_prefix.empty()) {
        return fmt::format(FMT_COMPILE("{} {} {}"), commands.program, flags, args);
    }
    return fmt::format(FMT_COMPILE("{} {} {} {}"), commands.privilege_prefix, commands.program, flags, args);
}

}  // namespace

namespace deswitch::package {

auto PackageCommands::remove_command(const std::vector<std::string>& targets) const noexcept -> std::optional<std::string> {
    return render_command(*this, remove_flags, targets);
}

auto PackageCommands::install_command(const std::vector<std::string>& targets) const noexcept -> std::optional<std::string> {
    return render_command(*this, install_flags, targets);
}

auto commands_for(PackageManager kind) noexcept -> std::expected<PackageCommands, ScriptError> {
    switch (kind) {
    case PackageManager::Pacman:
        return PackageCommands{
            .program          = "pacman"sv,
            .privilege_prefix = "sudo"sv,
            .remove_flags     = "-Rns --noconfirm"sv,
            .install_flags    = "-Syu --needed --noconfirm"sv,
        };
    case PackageManager::Yay:
        return PackageCommands{
            .program       = "yay"sv,
            .remove_flags  = "-Rns --noconfirm"sv,
            .install_flags = "-Syu --needed --noconfirm --answerclean None --answerdiff None"sv,
        };
    case PackageManager::Paru:
        return PackageCommands{
            .program       = "paru"sv,
            .remove_flags  = "-Rns --noconfirm"sv,
            .install_flags = "-Syu --needed --noconfirm --skipreview"sv,
        };
    }

    spdlog::error("No command templates for package manager {}", static_cast<std::int32_t>(kind));
    return std::unexpected(ScriptError{
        .kind    = ScriptErrorKind::UnsupportedPackageManager,
        .message = fmt::format(FMT_COMPILE("package manager #{} is not supported"), static_cast<std::int32_t>(kind)),
    });
}

auto package_manager_to_string(PackageManager kind) noexcept -> std::string_view {
    switch (kind) {
    case PackageManager::Pacman:
        return "pacman"sv;
    case PackageManager::Yay:
        return "yay"sv;
    case PackageManager::Paru:
        return "paru"sv;
    }
    return "unknown"sv;
}

auto package_manager_from_string(std::string_view name) noexcept -> std::optional<PackageManager> {
    if (name == "pacman"sv) {
        return PackageManager::Pacman;
    }
    if (name == "yay"sv) {
        return PackageManager::Yay;
    }
    if (name == "paru"sv) {
        return PackageManager::Paru;
    }
    return std::nullopt;
}

auto requires_unprivileged_user(PackageManager kind) noexcept -> bool {
    return kind == PackageManager::Yay || kind == PackageManager::Paru;
}

auto query_installed_command(const std::vector<std::string>& packages) noexcept -> std::string {
    // -Qq knows single packages only, -Qqg expands groups (xfce4, lxqt) into installed members
    const auto& names = utils::join(packages, " "sv);
    return fmt::format(FMT_COMPILE("{{ pacman -Qq {0}; pacman -Qqg {0}; }} 2>/dev/null | sort -u"), names);
}

}  // namespace deswitch::package
