#include "deswitch/profile_catalog.hpp"

#include <algorithm>  // for find_if, any_of, all_of
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr auto is_lower_alnum(char ch) noexcept -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
}

constexpr auto is_alnum(char ch) noexcept -> bool {
    return is_lower_alnum(ch) || (ch >= 'A' && ch <= 'Z');
}

auto validate_profile(const deswitch::profile::Profile& profile) noexcept -> std::optional<std::string> {
    using deswitch::profile::is_valid_package_name;
    using deswitch::profile::is_valid_service_name;

    if (!is_valid_package_name(profile.id)) {
        return fmt::format(FMT_COMPILE("invalid profile id '{}'"), profile.id);
    }
    if (profile.label.contains('\n') || profile.label.contains('\r')) {
        return fmt::format(FMT_COMPILE("label of profile '{}' must be a single line"), profile.id);
    }
    for (const auto& pkg : profile.packages) {
        if (!is_valid_package_name(pkg)) {
            return fmt::format(FMT_COMPILE("invalid package name '{}' in profile '{}'"), pkg, profile.id);
        }
    }
    if (profile.display_manager && !is_valid_service_name(*profile.display_manager)) {
        return fmt::format(FMT_COMPILE("invalid display manager '{}' in profile '{}'"), *profile.display_manager, profile.id);
    }
    return std::nullopt;
}

}  // namespace

namespace deswitch::profile {

ProfileCatalog::ProfileCatalog(value_type profiles) noexcept
  : m_profiles(std::move(profiles)) { }

auto ProfileCatalog::create(value_type profiles) noexcept -> std::expected<ProfileCatalog, std::string> {
    for (auto it = profiles.cbegin(); it != profiles.cend(); ++it) {
        if (auto err = validate_profile(*it); err.has_value()) {
            return std::unexpected(std::move(*err));
        }
        const auto& id = it->id;
        if (std::any_of(profiles.cbegin(), it, [&](auto&& prev) { return prev.id == id; })) {
            return std::unexpected(fmt::format(FMT_COMPILE("duplicate profile id '{}'"), id));
        }
    }
    return ProfileCatalog{std::move(profiles)};
}

auto ProfileCatalog::defaults() noexcept -> ProfileCatalog {
    return ProfileCatalog{default_profiles()};
}

auto ProfileCatalog::lookup(std::string_view id) const noexcept -> std::expected<Profile, ScriptError> {
    auto it = std::ranges::find(m_profiles, id, &Profile::id);
    if (it == m_profiles.end()) {
        spdlog::debug("profile '{}' is not in the catalog", id);
        return std::unexpected(ScriptError{
            .kind    = ScriptErrorKind::ProfileNotFound,
            .message = fmt::format(FMT_COMPILE("profile '{}' is not in the catalog"), id),
        });
    }
    return *it;
}

auto ProfileCatalog::contains(std::string_view id) const noexcept -> bool {
    return std::ranges::find(m_profiles, id, &Profile::id) != m_profiles.end();
}

auto ProfileCatalog::ids() const noexcept -> std::vector<std::string> {
    std::vector<std::string> res{};
    res.reserve(m_profiles.size());
    for (const auto& profile : m_profiles) {
        res.emplace_back(profile.id);
    }
    return res;
}

auto merge_profiles(std::vector<Profile> base, std::vector<Profile> overlay) noexcept -> std::vector<Profile> {
    for (auto&& profile : overlay) {
        auto it = std::ranges::find(base, profile.id, &Profile::id);
        if (it != base.end()) {
            spdlog::info("profile '{}' overridden", profile.id);
            *it = std::move(profile);
            continue;
        }
        base.emplace_back(std::move(profile));
    }
    return base;
}

auto is_valid_package_name(std::string_view name) noexcept -> bool {
    if (name.empty() || name.starts_with('-') || name.starts_with('.')) {
        return false;
    }
    return std::ranges::all_of(name, [](char ch) {
        return is_lower_alnum(ch) || "@._+-"sv.contains(ch);
    });
}

auto is_valid_service_name(std::string_view name) noexcept -> bool {
    if (name.empty() || name.starts_with('-')) {
        return false;
    }
    return std::ranges::all_of(name, [](char ch) {
        return is_alnum(ch) || ":_.@-"sv.contains(ch);
    });
}

auto default_profiles() noexcept -> std::vector<Profile> {
    return {
        Profile{
            .id              = "kde",
            .label           = "KDE Plasma",
            .packages        = {"plasma-desktop", "plasma-nm", "plasma-pa", "powerdevil", "kscreen", "kde-gtk-config",
                       "breeze-gtk", "konsole", "dolphin", "xdg-desktop-portal-kde", "sddm", "sddm-kcm"},
            .display_manager = "sddm",
            .session_names   = {"KDE"},
        },
        Profile{
            .id              = "gnome",
            .label           = "GNOME",
            .packages        = {"gnome-shell", "gnome-control-center", "gnome-console", "gnome-keyring", "gnome-tweaks",
                       "nautilus", "xdg-desktop-portal-gnome", "gdm"},
            .display_manager = "gdm",
            .session_names   = {"GNOME"},
        },
        Profile{
            .id              = "xfce",
            .label           = "Xfce",
            .packages        = {"xfce4", "xfce4-goodies", "network-manager-applet", "lightdm", "lightdm-gtk-greeter"},
            .display_manager = "lightdm",
            .session_names   = {"XFCE"},
        },
        Profile{
            .id              = "cinnamon",
            .label           = "Cinnamon",
            .packages        = {"cinnamon", "nemo", "gnome-terminal", "lightdm", "lightdm-slick-greeter"},
            .display_manager = "lightdm",
            .session_names   = {"X-Cinnamon", "Cinnamon"},
        },
        Profile{
            .id              = "mate",
            .label           = "MATE",
            .packages        = {"mate", "mate-extra", "network-manager-applet", "lightdm", "lightdm-gtk-greeter"},
            .display_manager = "lightdm",
            .session_names   = {"MATE"},
        },
        Profile{
            .id              = "budgie",
            .label           = "Budgie",
            .packages        = {"budgie-desktop", "budgie-control-center", "nemo", "gnome-terminal", "lightdm", "lightdm-gtk-greeter"},
            .display_manager = "lightdm",
            .session_names   = {"Budgie"},
        },
        Profile{
            .id              = "lxqt",
            .label           = "LXQt",
            .packages        = {"lxqt", "breeze-icons", "sddm"},
            .display_manager = "sddm",
            .session_names   = {"LXQt"},
        },
        Profile{
            .id              = "lxde",
            .label           = "LXDE",
            .packages        = {"lxde", "lightdm", "lightdm-gtk-greeter"},
            .display_manager = "lightdm",
            .session_names   = {"LXDE"},
        },
        Profile{
            .id              = "i3wm",
            .label           = "i3 Window Manager",
            .packages        = {"i3-wm", "i3status", "i3lock", "dmenu", "xterm", "lightdm", "lightdm-gtk-greeter"},
            .display_manager = "lightdm",
            .session_names   = {"i3"},
        },
        Profile{
            .id              = "cosmic",
            .label           = "COSMIC",
            .packages        = {"cosmic", "cosmic-greeter"},
            .display_manager = "cosmic-greeter",
            .session_names   = {"COSMIC"},
        },
        // started from a TTY, no display manager
        Profile{
            .id            = "sway",
            .label         = "Sway",
            .packages      = {"sway", "swaybg", "swayidle", "swaylock", "foot", "wmenu"},
            .session_names = {"sway"},
        },
        Profile{
            .id            = "hyprland",
            .label         = "Hyprland",
            .packages      = {"hyprland", "kitty", "wofi", "xdg-desktop-portal-hyprland"},
            .session_names = {"Hyprland"},
        },
    };
}

}  // namespace deswitch::profile
