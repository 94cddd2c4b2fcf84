#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fansi {

enum class should_style {
    detect,
    force,
    never,
};

/**
 * @brief Render a string of fansi markup.
 *
 * `.bold.red[text]` renders `text` in the given style. Styles nest. A backtick escapes the
 * character that follows it, so "`.x[`]" renders as ".x[]". With should_style::never (or when
 * detection fails) the markup is removed and no control sequences are emitted.
 */
std::string stylize(std::string_view text, should_style = should_style::detect);

namespace detail {
const std::string& cached_rendering(const char* ptr) noexcept;
}

inline namespace literals {
inline namespace styled_literals {
inline const std::string& operator""_styled(const char* str, std::size_t) {
    return detail::cached_rendering(str);
}

}  // namespace styled_literals
}  // namespace literals

}  // namespace fansi
