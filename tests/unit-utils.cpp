#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "config.hpp"
#include "utils.hpp"

// import deswitch
#include "deswitch/file_utils.hpp"
#include "deswitch/logger.hpp"
#include "deswitch/profile_catalog.hpp"
#include "deswitch/script_composer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

TEST_CASE("script writer test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    deswitch::logger::set_logger(logger);

    const auto& tmp_dir = fs::temp_directory_path() / "deswitch-unit-utils";
    fs::remove_all(tmp_dir);

    const deswitch::script::GeneratedScript script{
        .file_name = "de_switcher_gnome_to_kde.sh",
        .text      = "#!/bin/sh\necho test\n",
    };

    SECTION("creates directory and executable file")
    {
        const auto& out_dir = tmp_dir / "nested" / "dir";
        auto script_path    = utils::write_script(script, out_dir.string());
        REQUIRE(script_path.has_value());
        REQUIRE_EQ(*script_path, (out_dir / script.file_name).string());

        REQUIRE_EQ(deswitch::file_utils::read_whole_file(*script_path), std::optional<std::string>{script.text});

        const auto& perms = fs::status(*script_path).permissions();
        REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
        REQUIRE((perms & fs::perms::group_exec) != fs::perms::none);
        REQUIRE((perms & fs::perms::others_exec) != fs::perms::none);
        REQUIRE((perms & fs::perms::group_write) == fs::perms::none);
    }
    SECTION("overwrites existing file")
    {
        fs::create_directories(tmp_dir);
        const auto& existing = (tmp_dir / script.file_name).string();
        REQUIRE(deswitch::file_utils::write_to_file("old content, much longer than the new script\n"sv, existing));

        auto script_path = utils::write_script(script, tmp_dir.string());
        REQUIRE(script_path.has_value());
        REQUIRE_EQ(deswitch::file_utils::read_whole_file(*script_path), std::optional<std::string>{script.text});
    }
    SECTION("output dir is a file")
    {
        fs::create_directories(tmp_dir);
        const auto& not_dir = (tmp_dir / "regular-file").string();
        REQUIRE(deswitch::file_utils::write_to_file("x"sv, not_dir));

        auto script_path = utils::write_script(script, not_dir);
        REQUIRE(!script_path.has_value());
    }

    fs::remove_all(tmp_dir);
}

TEST_CASE("settings test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    deswitch::logger::set_logger(logger);

    if (Config::instance() == nullptr) {
        REQUIRE(Config::initialize());
    }
    auto& config_data = Config::instance()->data();

    const auto& catalog = deswitch::profile::ProfileCatalog::defaults();

    SECTION("defaults")
    {
        config_data["CURRENT_PROFILE"] = "";
        config_data["TARGET_PROFILE"]  = "";

        const auto& settings = utils::current_settings();
        REQUIRE(!settings.headless_mode);
        REQUIRE_EQ(settings.package_manager, deswitch::package::PackageManager::Pacman);
        REQUIRE_EQ(settings.output_dir, "."sv);
        REQUIRE_EQ(settings.catalog_path, "/etc/de-switcher/profiles.toml"sv);
        REQUIRE(!settings.target_profile.has_value());
    }
    SECTION("detects current profile from desktop")
    {
        config_data["CURRENT_PROFILE"] = "";
        config_data["CURRENT_DESKTOP"] = "Budgie:GNOME";

        utils::detect_current_profile(catalog);
        REQUIRE_EQ(std::get<std::string>(config_data["CURRENT_PROFILE"]), "budgie");
        REQUIRE_EQ(utils::current_settings().current_profile, "budgie"sv);
    }
    SECTION("profile from settings wins over detection")
    {
        config_data["CURRENT_PROFILE"] = "xfce";
        config_data["CURRENT_DESKTOP"] = "KDE";

        utils::detect_current_profile(catalog);
        REQUIRE_EQ(std::get<std::string>(config_data["CURRENT_PROFILE"]), "xfce");
    }
    SECTION("unknown desktop leaves profile empty")
    {
        config_data["CURRENT_PROFILE"] = "";
        config_data["CURRENT_DESKTOP"] = "Unity";

        utils::detect_current_profile(catalog);
        REQUIRE(std::get<std::string>(config_data["CURRENT_PROFILE"]).empty());
        REQUIRE(!utils::current_settings().current_profile.has_value());
    }
    SECTION("headless run writes script")
    {
        const auto& tmp_dir = fs::temp_directory_path() / "deswitch-unit-utils-headless";
        fs::remove_all(tmp_dir);

        config_data["HEADLESS_MODE"]   = 1;
        config_data["CURRENT_PROFILE"] = "gnome";
        config_data["TARGET_PROFILE"]  = "kde";
        config_data["PACKAGE_MANAGER"] = "yay";
        config_data["OUTPUT_DIR"]      = tmp_dir.string();

        REQUIRE(utils::run_headless(catalog));
        const auto& content = deswitch::file_utils::read_whole_file((tmp_dir / "de_switcher_gnome_to_kde.sh").string());
        REQUIRE(content.has_value());
        REQUIRE(content->starts_with("#!/bin/sh\n"sv));
        REQUIRE(content->contains("Package manager: yay"sv));

        fs::remove_all(tmp_dir);
    }
    SECTION("headless run fails on unknown target")
    {
        config_data["HEADLESS_MODE"]   = 1;
        config_data["CURRENT_PROFILE"] = "gnome";
        config_data["TARGET_PROFILE"]  = "xfce-unlisted";

        REQUIRE(!utils::run_headless(catalog));
    }
    SECTION("headless run fails without target")
    {
        config_data["HEADLESS_MODE"]   = 1;
        config_data["CURRENT_PROFILE"] = "gnome";
        config_data["TARGET_PROFILE"]  = "";

        REQUIRE(!utils::run_headless(catalog));
    }
}
