#include "deswitch/string_utils.hpp"

#include <algorithm>  // for for_each, transform
#include <cctype>     // for tolower

namespace deswitch::utils {

auto make_multiline(std::string_view str, char delim) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    std::string res{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            res += delim;
        }
        res += lines[i];
    }
    return res;
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string res{str};
    std::ranges::transform(res, res.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return res;
}

}  // namespace deswitch::utils
