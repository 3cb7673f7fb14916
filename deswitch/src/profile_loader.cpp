#include "deswitch/profile_loader.hpp"
#include "deswitch/file_utils.hpp"

#include <filesystem>    // for exists
#include <string>        // for string
#include <system_error>  // for error_code
#include <utility>       // for move

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

inline auto parse_toml_array(const toml::array* arr, std::vector<std::string>& vec) noexcept -> bool {
    for (const auto& node_el : *arr) {
        auto elem = node_el.value<std::string_view>();
        if (!elem) {
            return false;
        }
        vec.emplace_back(*elem);
    }
    return true;
}

// Accept both "gdm" and "gdm.service", keep the bare service name.
inline auto strip_service_suffix(std::string_view service) noexcept -> std::string {
    static constexpr auto suffix = ".service"sv;
    if (service.ends_with(suffix)) {
        service.remove_suffix(suffix.size());
    }
    return std::string{service};
}

}  // namespace

namespace deswitch::profile {

auto parse_profiles(std::string_view config_content) noexcept -> std::optional<std::vector<Profile>> {
    toml::parse_result profiles_file = toml::parse(config_content);
    if (profiles_file.failed()) {
        spdlog::error("Failed to parse profiles: {}", profiles_file.error().description());
        return std::nullopt;
    }
    const auto& profiles_table = std::move(profiles_file).table();

    const auto* profile_table = profiles_table["profile"].as_table();
    if (profile_table == nullptr) {
        spdlog::error("Failed to parse profiles: missing [profile] table");
        return std::nullopt;
    }

    std::vector<Profile> profiles{};
    for (auto&& [key, value] : *profile_table) {
        const auto profile_id = std::string{std::string_view{key}};
        const auto* value_table = value.as_table();
        if (value_table == nullptr) {
            spdlog::error("Failed to parse profile '{}': not a table", profile_id);
            return std::nullopt;
        }

        Profile profile{.id = profile_id};

        const auto* packages = (*value_table)["packages"].as_array();
        if (packages == nullptr || !parse_toml_array(packages, profile.packages)) {
            spdlog::error("Failed to parse profile '{}': 'packages' must be an array of strings", profile_id);
            return std::nullopt;
        }

        profile.label = (*value_table)["label"].value_or(std::string_view{profile_id});

        if (const auto& dm_node = (*value_table)["display_manager"]; dm_node) {
            auto display_manager = dm_node.value<std::string_view>();
            if (!display_manager) {
                spdlog::error("Failed to parse profile '{}': 'display_manager' must be a string", profile_id);
                return std::nullopt;
            }
            profile.display_manager = strip_service_suffix(*display_manager);
        }

        if (const auto& sessions_node = (*value_table)["session_names"]; sessions_node) {
            const auto* sessions = sessions_node.as_array();
            if (sessions == nullptr || !parse_toml_array(sessions, profile.session_names)) {
                spdlog::error("Failed to parse profile '{}': 'session_names' must be an array of strings", profile_id);
                return std::nullopt;
            }
        }

        profiles.emplace_back(std::move(profile));
    }
    return std::make_optional<std::vector<Profile>>(std::move(profiles));
}

auto load_catalog(std::string_view profiles_path) noexcept -> std::optional<ProfileCatalog> {
    std::error_code err{};
    if (profiles_path.empty() || !fs::exists(fs::path{profiles_path}, err)) {
        spdlog::info("No profiles file at '{}', using built-in catalog", profiles_path);
        return ProfileCatalog::defaults();
    }

    auto content = file_utils::read_whole_file(profiles_path);
    if (!content) {
        return std::nullopt;
    }
    auto extra_profiles = parse_profiles(*content);
    if (!extra_profiles) {
        spdlog::error("Invalid profiles file: {}", profiles_path);
        return std::nullopt;
    }
    spdlog::info("Loaded {} profile(s) from '{}'", extra_profiles->size(), profiles_path);

    auto catalog = ProfileCatalog::create(merge_profiles(default_profiles(), std::move(*extra_profiles)));
    if (!catalog) {
        spdlog::error("Invalid profiles file '{}': {}", profiles_path, catalog.error());
        return std::nullopt;
    }
    return std::make_optional<ProfileCatalog>(std::move(*catalog));
}

}  // namespace deswitch::profile
