#include "utils.hpp"
#include "config.hpp"
#include "definitions.hpp"

// import deswitch
#include "deswitch/desktop_session.hpp"
#include "deswitch/file_utils.hpp"
#include "deswitch/profile_loader.hpp"

#include <cstdint>       // for int32_t
#include <filesystem>    // for exists, create_directories
#include <system_error>  // for error_code
#include <utility>       // for move
#include <variant>       // for get, visit

#include <fmt/compile.h>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

auto non_empty(const std::string& value) noexcept -> std::optional<std::string> {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

namespace utils {

void dump_settings_to_log() noexcept {
    auto* config_instance = Config::instance();
    auto& config_data     = config_instance->data();

    std::string out{};
    for (const auto& [key, value] : config_data) {
        const auto& value_formatted = std::visit([](auto&& arg) -> std::string { return fmt::format("{}", arg); }, value);
        out += fmt::format("Option: [{}], Value: [{}]\n", key, value_formatted);
    }
    spdlog::info("Settings:\n{}", out);
}

bool parse_config() noexcept {
    auto* config_instance = Config::instance();
    auto& config_data     = config_instance->data();

    spdlog::info("de-switcher version '{}'", DESWITCH_VERSION);

    // 1. Read file.
    static constexpr auto file_path = "settings.json"sv;
    if (!fs::exists(file_path)) {
        fmt::print(stderr, "Config not found running with defaults\n");
        return true;
    }
    const auto& file_content = deswitch::file_utils::read_whole_file(file_path);
    if (!file_content) {
        error_inter("Failed to read '{}'!\n", file_path);
        return false;
    }

    // 2. Parse a JSON.
    auto config = switcher::parse_switcher_config(*file_content);
    if (!config) {
        spdlog::error("Invalid '{}': {}", file_path, config.error());
        error_inter("Invalid '{}': {}\n", file_path, config.error());
        return false;
    }

    config_data["HEADLESS_MODE"]   = static_cast<std::int32_t>(config->headless_mode);
    config_data["PACKAGE_MANAGER"] = std::string{deswitch::package::package_manager_to_string(config->package_manager)};
    if (config->current_profile) {
        config_data["CURRENT_PROFILE"] = *config->current_profile;
    }
    if (config->target_profile) {
        config_data["TARGET_PROFILE"] = *config->target_profile;
    }
    if (config->output_dir) {
        config_data["OUTPUT_DIR"] = *config->output_dir;
    }
    if (config->catalog_path) {
        config_data["CATALOG_PATH"] = *config->catalog_path;
    }

    if (config->headless_mode) {
        spdlog::info("Running in HEADLESS mode!");
    } else {
        spdlog::info("Running in NORMAL mode!");
    }
    return true;
}

auto load_catalog() noexcept -> std::optional<deswitch::profile::ProfileCatalog> {
    auto* config_instance = Config::instance();
    auto& config_data     = config_instance->data();

    const auto& catalog_path = std::get<std::string>(config_data["CATALOG_PATH"]);
    auto catalog             = deswitch::profile::load_catalog(catalog_path);
    if (!catalog) {
        error_inter("Failed to load profiles from '{}'!\n", catalog_path);
        return std::nullopt;
    }
    spdlog::info("Loaded {} profiles", catalog->size());
    return catalog;
}

void detect_current_profile(const deswitch::profile::ProfileCatalog& catalog) noexcept {
    auto* config_instance = Config::instance();
    auto& config_data     = config_instance->data();

    auto& current_profile = std::get<std::string>(config_data["CURRENT_PROFILE"]);
    if (!current_profile.empty()) {
        spdlog::info("Current profile '{}' set in settings, skipping detection", current_profile);
        return;
    }

    const auto& current_desktop = std::get<std::string>(config_data["CURRENT_DESKTOP"]);
    if (current_desktop.empty()) {
        spdlog::warn("XDG_CURRENT_DESKTOP is not set");
        return;
    }
    if (auto detected = deswitch::session::detect_profile(catalog, current_desktop); detected.has_value()) {
        current_profile = std::move(*detected);
    }
}

auto current_settings() noexcept -> switcher::SwitcherConfig {
    auto* config_instance = Config::instance();
    auto& config_data     = config_instance->data();

    const auto& manager_name = std::get<std::string>(config_data["PACKAGE_MANAGER"]);
    return switcher::SwitcherConfig{
        .headless_mode   = std::get<std::int32_t>(config_data["HEADLESS_MODE"]) != 0,
        .current_profile = non_empty(std::get<std::string>(config_data["CURRENT_PROFILE"])),
        .target_profile  = non_empty(std::get<std::string>(config_data["TARGET_PROFILE"])),
        .package_manager = deswitch::package::package_manager_from_string(manager_name).value_or(deswitch::package::PackageManager::Pacman),
        .output_dir      = non_empty(std::get<std::string>(config_data["OUTPUT_DIR"])),
        .catalog_path    = non_empty(std::get<std::string>(config_data["CATALOG_PATH"])),
    };
}

auto write_script(const deswitch::script::GeneratedScript& script, std::string_view output_dir) noexcept
    -> std::expected<std::string, std::string> {
    const fs::path dir_path{output_dir.empty() ? "."sv : output_dir};

    std::error_code err{};
    fs::create_directories(dir_path, err);
    if (err) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to create '{}': {}"), dir_path.string(), err.message()));
    }

    const auto& script_path = (dir_path / script.file_name).string();
    if (!deswitch::file_utils::create_executable_file(script_path, script.text)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to write '{}'"), script_path));
    }
    spdlog::info("Script written to '{}'", script_path);
    return script_path;
}

void print_next_steps(std::string_view script_path) noexcept {
    success_inter("Migration script written to '{}'.\n", script_path);
    output_inter("Next steps:\n");
    output_inter("  1. Review the script: less {}\n", script_path);
    output_inter("  2. Log out and switch to a TTY (e.g. Ctrl+Alt+F3)\n");
    output_inter("  3. Run it: sh {}\n", script_path);
}

bool run_headless(const deswitch::profile::ProfileCatalog& catalog) noexcept {
    const auto& settings = current_settings();
    if (auto valid = switcher::validate_headless_config(settings); !valid) {
        spdlog::error("{}", valid.error());
        error_inter("{}\n", valid.error());
        return false;
    }

    const deswitch::script::ScriptRequest request{
        .current_profile = *settings.current_profile,
        .target_profile  = *settings.target_profile,
        .package_manager = settings.package_manager,
    };
    auto script = deswitch::script::compose_script(catalog, request);
    if (!script) {
        error_inter("{}: {}\n", deswitch::script_error_kind_to_string(script.error().kind), script.error().message);
        return false;
    }

    auto script_path = write_script(*script, settings.output_dir.value_or("."));
    if (!script_path) {
        spdlog::error("{}", script_path.error());
        error_inter("{}\n", script_path.error());
        return false;
    }
    print_next_steps(*script_path);
    return true;
}

}  // namespace utils
