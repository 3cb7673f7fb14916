#include "doctest_compatibility.h"

#include "deswitch/profile_catalog.hpp"
#include "deswitch/profile_diff.hpp"

#include <algorithm>
#include <string>
#include <vector>

using deswitch::profile::Profile;

namespace {

auto intersects(const std::vector<std::string>& pkgs, const std::vector<std::string>& other) -> bool {
    return std::ranges::any_of(pkgs, [&](auto&& pkg) { return std::ranges::find(other, pkg) != other.end(); });
}

}  // namespace

TEST_CASE("profile diff test")
{
    const Profile gnome{.id = "gnome", .packages = {"gnome-shell", "gdm"}, .display_manager = "gdm"};
    const Profile kde{.id = "kde", .packages = {"plasma-desktop", "sddm"}, .display_manager = "sddm"};

    SECTION("disjoint profiles")
    {
        const auto& diff = deswitch::profile::diff_profiles(gnome, kde);
        REQUIRE((diff.to_remove == std::vector<std::string>{"gdm", "gnome-shell"}));
        REQUIRE((diff.to_install == std::vector<std::string>{"plasma-desktop", "sddm"}));
    }
    SECTION("same profile")
    {
        const auto& diff = deswitch::profile::diff_profiles(gnome, gnome);
        REQUIRE(diff.empty());
    }
    SECTION("shared packages are kept")
    {
        const Profile xfce{.id = "xfce", .packages = {"xfce4", "lightdm", "lightdm-gtk-greeter", "network-manager-applet"}};
        const Profile mate{.id = "mate", .packages = {"mate", "network-manager-applet", "lightdm", "lightdm-gtk-greeter"}};

        const auto& diff = deswitch::profile::diff_profiles(xfce, mate);
        REQUIRE((diff.to_remove == std::vector<std::string>{"xfce4"}));
        REQUIRE((diff.to_install == std::vector<std::string>{"mate"}));
    }
    SECTION("empty current profile")
    {
        const Profile bare{.id = "bare"};
        const auto& diff = deswitch::profile::diff_profiles(bare, kde);
        REQUIRE(diff.to_remove.empty());
        REQUIRE((diff.to_install == std::vector<std::string>{"plasma-desktop", "sddm"}));
    }
    SECTION("empty target profile")
    {
        const Profile bare{.id = "bare"};
        const auto& diff = deswitch::profile::diff_profiles(kde, bare);
        REQUIRE((diff.to_remove == std::vector<std::string>{"plasma-desktop", "sddm"}));
        REQUIRE(diff.to_install.empty());
    }
    SECTION("duplicates collapse")
    {
        const Profile dup{.id = "dup", .packages = {"sddm", "plasma-desktop", "sddm"}};
        const auto& diff = deswitch::profile::diff_profiles(dup, gnome);
        REQUIRE((diff.to_remove == std::vector<std::string>{"plasma-desktop", "sddm"}));
    }
}

TEST_CASE("canonical package set test")
{
    REQUIRE((deswitch::profile::canonical_package_set({"b", "a", "c", "a"}) == std::vector<std::string>{"a", "b", "c"}));
    REQUIRE(deswitch::profile::canonical_package_set({}).empty());
}

TEST_CASE("profile diff properties over default catalog")
{
    const auto& catalog = deswitch::profile::ProfileCatalog::defaults();

    for (const auto& lhs : catalog.profiles()) {
        const auto& self_diff = deswitch::profile::diff_profiles(lhs, lhs);
        CAPTURE(lhs.id);
        REQUIRE(self_diff.empty());

        for (const auto& rhs : catalog.profiles()) {
            CAPTURE(rhs.id);
            const auto& forward  = deswitch::profile::diff_profiles(lhs, rhs);
            const auto& backward = deswitch::profile::diff_profiles(rhs, lhs);

            // never remove what the target still needs
            REQUIRE(!intersects(forward.to_remove, rhs.packages));
            REQUIRE(!intersects(forward.to_install, lhs.packages));

            REQUIRE((forward.to_remove == backward.to_install));
            REQUIRE((forward.to_install == backward.to_remove));

            REQUIRE(std::ranges::is_sorted(forward.to_remove));
            REQUIRE(std::ranges::is_sorted(forward.to_install));
        }
    }
}
