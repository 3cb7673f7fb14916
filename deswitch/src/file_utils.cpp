#include "deswitch/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <filesystem>    // for permissions
#include <fstream>       // for ofstream
#include <system_error>  // for error_code

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace deswitch::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    std::fseek(file, 0u, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0u, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    return buf;
}

auto write_to_file(std::string_view data, std::string_view filepath) noexcept -> bool {
    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[WRITE_TO_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    file.close();
    if (file.fail()) {
        spdlog::error("[WRITE_TO_FILE] '{}' write failed", filepath);
        return false;
    }
    return true;
}

auto create_executable_file(std::string_view filepath, std::string_view data) noexcept -> bool {
    if (!file_utils::write_to_file(data, filepath)) {
        return false;
    }

    std::error_code err{};
    fs::permissions(fs::path{filepath},
        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
        fs::perm_options::replace, err);
    if (err) {
        spdlog::error("[CREATE_EXEC_FILE] '{}' chmod failed: {}", filepath, err.message());
        return false;
    }
    return true;
}

}  // namespace deswitch::file_utils
