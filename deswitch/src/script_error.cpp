#include "deswitch/script_error.hpp"

using namespace std::string_view_literals;

namespace deswitch {

auto script_error_kind_to_string(ScriptErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ScriptErrorKind::ProfileNotFound:
        return "profile not found"sv;
    case ScriptErrorKind::UnsupportedPackageManager:
        return "unsupported package manager"sv;
    }
    return "unknown error"sv;
}

}  // namespace deswitch
