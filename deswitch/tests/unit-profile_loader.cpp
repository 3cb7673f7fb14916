#include "doctest_compatibility.h"

#include "deswitch/file_utils.hpp"
#include "deswitch/logger.hpp"
#include "deswitch/profile_loader.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

static constexpr auto VALID_PROFILES_TEST = R"(
[profile.someprofile-1]
label = "Some Profile"
packages = ["ca","da","fa"]
display_manager = "sddm"
session_names = ["SomeDE"]
[profile.someprofile-2]
packages = ["cb","db","fb"]
display_manager = "ly.service"
[profile.someprofile-3]
packages = []
)"sv;

static constexpr auto INVALID_PROFILES_TEST = R"(
[profile.someprofile-1]
pacages = ["ca,"da","fa"
[profile.someprofile-2
packaes = ["cb","db",fb"]
)"sv;

static constexpr auto MISSING_PACKAGES_TEST = R"(
[profile.someprofile-1]
label = "No packages"
)"sv;

static constexpr auto WRONG_TYPE_TEST = R"(
[profile.someprofile-1]
packages = ["ca", 42]
)"sv;

TEST_CASE("profiles parsing test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    deswitch::logger::set_logger(logger);

    SECTION("valid profiles")
    {
        auto profiles = deswitch::profile::parse_profiles(VALID_PROFILES_TEST);
        REQUIRE(profiles);
        REQUIRE_EQ(profiles->size(), 3);

        REQUIRE_EQ((*profiles)[0].id, "someprofile-1");
        REQUIRE_EQ((*profiles)[0].label, "Some Profile");
        REQUIRE(((*profiles)[0].packages == std::vector<std::string>{"ca", "da", "fa"}));
        REQUIRE_EQ((*profiles)[0].display_manager, std::optional<std::string>{"sddm"});
        REQUIRE(((*profiles)[0].session_names == std::vector<std::string>{"SomeDE"}));

        // label defaults to id, service suffix is stripped
        REQUIRE_EQ((*profiles)[1].id, "someprofile-2");
        REQUIRE_EQ((*profiles)[1].label, "someprofile-2");
        REQUIRE_EQ((*profiles)[1].display_manager, std::optional<std::string>{"ly"});
        REQUIRE((*profiles)[1].session_names.empty());

        REQUIRE_EQ((*profiles)[2].id, "someprofile-3");
        REQUIRE((*profiles)[2].packages.empty());
        REQUIRE(!(*profiles)[2].display_manager.has_value());
    }
    SECTION("invalid toml")
    {
        REQUIRE(!deswitch::profile::parse_profiles(INVALID_PROFILES_TEST));
    }
    SECTION("missing packages")
    {
        REQUIRE(!deswitch::profile::parse_profiles(MISSING_PACKAGES_TEST));
    }
    SECTION("non string package")
    {
        REQUIRE(!deswitch::profile::parse_profiles(WRONG_TYPE_TEST));
    }
    SECTION("missing profile table")
    {
        REQUIRE(!deswitch::profile::parse_profiles("[desktop.kde]\npackages = [\"a\"]\n"sv));
    }
}

TEST_CASE("catalog loading test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    deswitch::logger::set_logger(logger);

    const auto& tmp_dir = fs::temp_directory_path() / "deswitch-unit-profile_loader";
    fs::create_directories(tmp_dir);

    SECTION("missing file gives defaults")
    {
        auto catalog = deswitch::profile::load_catalog((tmp_dir / "does-not-exist.toml").string());
        REQUIRE(catalog);
        REQUIRE_EQ(catalog->size(), deswitch::profile::ProfileCatalog::defaults().size());
    }
    SECTION("extra profiles extend defaults")
    {
        const auto& filepath = (tmp_dir / "profiles.toml").string();
        REQUIRE(deswitch::file_utils::write_to_file(R"(
[profile.kde]
label = "KDE Plasma (meta)"
packages = ["plasma-meta", "sddm"]
display_manager = "sddm"
[profile.niri]
packages = ["niri", "fuzzel"]
)"sv, filepath));

        auto catalog = deswitch::profile::load_catalog(filepath);
        REQUIRE(catalog);
        REQUIRE_EQ(catalog->size(), deswitch::profile::ProfileCatalog::defaults().size() + 1);
        REQUIRE_EQ(catalog->lookup("kde"sv)->label, "KDE Plasma (meta)");
        REQUIRE(catalog->contains("niri"sv));
        REQUIRE_EQ(catalog->ids().back(), "niri");
    }
    SECTION("invalid package name is rejected")
    {
        const auto& filepath = (tmp_dir / "bad-profiles.toml").string();
        REQUIRE(deswitch::file_utils::write_to_file(R"(
[profile.evil]
packages = ["foo && reboot"]
)"sv, filepath));

        REQUIRE(!deswitch::profile::load_catalog(filepath));
    }

    fs::remove_all(tmp_dir);
}
