#include "switcher_config.hpp"

#include <expected>     // for expected, unexpected
#include <string_view>  // for string_view
#include <utility>      // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

namespace {

// Reads optional string member of the root object into out.
auto read_string_field(const rapidjson::Document& doc, const char* key, std::optional<std::string>& out) noexcept
    -> std::expected<void, std::string> {
    auto member = doc.FindMember(key);
    if (member == doc.MemberEnd()) {
        return {};
    }
    if (!member->value.IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out = std::string{member->value.GetString(), member->value.GetStringLength()};
    return {};
}

auto is_missing(const std::optional<std::string>& value) noexcept -> bool {
    return !value || value->empty();
}

}  // namespace

namespace switcher {

auto get_default_config() noexcept -> SwitcherConfig {
    return SwitcherConfig{
        .headless_mode   = false,
        .package_manager = deswitch::package::PackageManager::Pacman,
    };
}

auto parse_switcher_config(std::string_view json_content) noexcept
    -> std::expected<SwitcherConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    // Parse headless_mode (optional, default false)
    if (doc.HasMember("headless_mode")) {
        if (!doc["headless_mode"].IsBool()) {
            return std::unexpected("'headless_mode' must be a boolean");
        }
        config.headless_mode = doc["headless_mode"].GetBool();
    }

    // Profiles (optional, target required in headless mode)
    if (auto res = read_string_field(doc, "current_profile", config.current_profile); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = read_string_field(doc, "target_profile", config.target_profile); !res) {
        return std::unexpected(std::move(res.error()));
    }

    // Parse package_manager (optional, default pacman)
    std::optional<std::string> manager_name{};
    if (auto res = read_string_field(doc, "package_manager", manager_name); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (manager_name) {
        const auto& manager = deswitch::package::package_manager_from_string(*manager_name);
        if (!manager) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid package manager '{}'. Valid managers: pacman, yay, paru"), *manager_name));
        }
        config.package_manager = *manager;
    }

    // Paths (optional)
    if (auto res = read_string_field(doc, "output_dir", config.output_dir); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = read_string_field(doc, "catalog_path", config.catalog_path); !res) {
        return std::unexpected(std::move(res.error()));
    }

    return config;
}

auto validate_headless_config(const SwitcherConfig& config) noexcept
    -> std::expected<void, std::string> {
    if (!config.headless_mode) {
        return {};
    }

    std::string missing_fields;
    if (is_missing(config.current_profile)) {
        // only reached when the running desktop was not recognized
        missing_fields += "'current_profile', ";
    }
    if (is_missing(config.target_profile)) {
        missing_fields += "'target_profile', ";
    }

    if (!missing_fields.empty()) {
        missing_fields.resize(missing_fields.size() - 2);
        return std::unexpected(fmt::format(FMT_COMPILE("HEADLESS mode requires: {}"), missing_fields));
    }

    return {};
}

}  // namespace switcher
