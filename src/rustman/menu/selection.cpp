#include "./selection.hpp"

#include <rustman/util/string.hpp>

#include <charconv>
#include <cstdint>

using namespace rustman;

selection selection::parse(std::string_view input, std::size_t count) noexcept {
    auto s = trim_view(input);
    if (s == "q" || s == "Q") {
        return quit();
    }

    // An explicit plus sign is allowed. A minus sign is not, so negative numbers are not numbers.
    if (s.starts_with('+')) {
        s.remove_prefix(1);
    }
    std::uint64_t number = 0;
    auto [ptr, ec]       = std::from_chars(s.data(), s.data() + s.size(), number);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return invalid(invalid_reason::not_a_number);
    }
    if (number < 1 || number > count) {
        return invalid(invalid_reason::out_of_range);
    }
    return pick(static_cast<std::size_t>(number - 1));
}
