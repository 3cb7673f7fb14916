#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace deswitch::file_utils {

// Returns nullopt if the file cannot be opened or read.
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

auto write_to_file(std::string_view data, std::string_view filepath) noexcept -> bool;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
// The resulting file is marked executable (0755).
auto create_executable_file(std::string_view filepath, std::string_view data) noexcept -> bool;

}  // namespace deswitch::file_utils

#endif  // FILE_UTILS_HPP
