#ifndef PROFILE_DIFF_HPP
#define PROFILE_DIFF_HPP

#include "deswitch/profile_catalog.hpp"

#include <string>  // for string
#include <vector>  // for vector

namespace deswitch::profile {

/// @brief Package operations needed to go from one profile to another.
/// Both lists are sorted and free of duplicates.
struct DiffResult final {
    /// current.packages - target.packages
    std::vector<std::string> to_remove{};
    /// target.packages - current.packages
    std::vector<std::string> to_install{};

    [[nodiscard]] auto empty() const noexcept -> bool {
        return to_remove.empty() && to_install.empty();
    }

    bool operator==(const DiffResult&) const = default;
};

/// @brief Sorted copy of the package list without duplicates.
[[nodiscard]] auto canonical_package_set(std::vector<std::string> packages) noexcept -> std::vector<std::string>;

/// @brief Compute package set difference between two profiles.
/// This is a plain set subtraction, dependencies are resolved by the
/// package manager when the script runs.
/// @param current The currently installed profile
/// @param target The profile to switch to
/// @return The removal and installation sets
[[nodiscard]] auto diff_profiles(const Profile& current, const Profile& target) noexcept -> DiffResult;

}  // namespace deswitch::profile

#endif  // PROFILE_DIFF_HPP
