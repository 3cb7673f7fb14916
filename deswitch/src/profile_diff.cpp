#include "deswitch/profile_diff.hpp"

#include <algorithm>  // for sort, unique, set_difference
#include <iterator>   // for back_inserter

#include <spdlog/spdlog.h>

namespace {

auto set_difference(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs) noexcept -> std::vector<std::string> {
    std::vector<std::string> res{};
    std::ranges::set_difference(lhs, rhs, std::back_inserter(res));
    return res;
}

}  // namespace

namespace deswitch::profile {

auto canonical_package_set(std::vector<std::string> packages) noexcept -> std::vector<std::string> {
    std::ranges::sort(packages);
    const auto [first, last] = std::ranges::unique(packages);
    packages.erase(first, last);
    return packages;
}

auto diff_profiles(const Profile& current, const Profile& target) noexcept -> DiffResult {
    const auto& current_pkgs = canonical_package_set(current.packages);
    const auto& target_pkgs  = canonical_package_set(target.packages);

    DiffResult result{
        .to_remove  = set_difference(current_pkgs, target_pkgs),
        .to_install = set_difference(target_pkgs, current_pkgs),
    };
    spdlog::debug("diff {} -> {}: {} to remove, {} to install", current.id, target.id, result.to_remove.size(), result.to_install.size());
    return result;
}

}  // namespace deswitch::profile
