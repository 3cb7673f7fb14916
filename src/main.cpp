#include "config.hpp"       // for Config
#include "definitions.hpp"  // for error_inter
#include "tui.hpp"          // for init
#include "utils.hpp"        // for parse_config, load_catalog...

// import deswitch
#include "deswitch/logger.hpp"

#include <chrono>   // for seconds
#include <cstdint>  // for int32_t
#include <variant>  // for get

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

int main() {
    // Initialize default config.
    if (!Config::initialize()) {
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("deswitch_logger", "/tmp/de-switcher.log");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set deswitch logger.
    deswitch::logger::set_logger(logger);

    if (!utils::parse_config()) {
        error_inter("Error occurred during initialization! Closing..\n");
        spdlog::shutdown();
        return 1;
    }

    const auto& catalog = utils::load_catalog();
    if (!catalog) {
        spdlog::shutdown();
        return 1;
    }
    utils::detect_current_profile(*catalog);
    utils::dump_settings_to_log();

    auto* config_instance     = Config::instance();
    auto& config_data         = config_instance->data();
    const auto& headless_mode = std::get<std::int32_t>(config_data["HEADLESS_MODE"]);

    const bool success = headless_mode ? utils::run_headless(*catalog) : tui::init(*catalog);

    spdlog::shutdown();
    return success ? 0 : 1;
}
