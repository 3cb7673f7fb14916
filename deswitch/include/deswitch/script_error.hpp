#ifndef SCRIPT_ERROR_HPP
#define SCRIPT_ERROR_HPP

#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace deswitch {

/// @brief Reasons a script composition request is rejected.
enum class ScriptErrorKind : std::uint8_t {
    /// Profile id is not present in the catalog
    ProfileNotFound,
    /// Package manager kind has no command templates
    UnsupportedPackageManager
};

/// @brief Error value returned by the composition pipeline.
struct ScriptError final {
    ScriptErrorKind kind{ScriptErrorKind::ProfileNotFound};
    std::string message{};

    bool operator==(const ScriptError&) const = default;
};

/// @brief Convert error kind to string
/// @param kind The error kind
/// @return The string representation
[[nodiscard]] auto script_error_kind_to_string(ScriptErrorKind kind) noexcept -> std::string_view;

}  // namespace deswitch

#endif  // SCRIPT_ERROR_HPP
