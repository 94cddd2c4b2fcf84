#pragma once

#include <algorithm>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace rustman {

std::size_t lev_edit_distance(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Find the string in `strings` closest to `given`, if it is close enough to be a
 * plausible typo (at most a third of its length away, and never more than three edits).
 */
template <typename Range>
std::optional<std::string> did_you_mean(std::string_view given, Range&& strings) noexcept {
    auto cand = std::ranges::min_element(strings, std::less{}, [&](auto&& candidate) {
        return lev_edit_distance(candidate, given);
    });
    if (cand == std::ranges::end(strings)) {
        return std::nullopt;
    }
    auto limit = std::min<std::size_t>(3, std::max<std::size_t>(1, given.size() / 3));
    if (lev_edit_distance(*cand, given) > limit) {
        return std::nullopt;
    }
    return std::string(*cand);
}

inline std::optional<std::string>
did_you_mean(std::string_view given, std::initializer_list<std::string_view> strings) noexcept {
    return did_you_mean(given, std::views::all(strings));
}

}  // namespace rustman
