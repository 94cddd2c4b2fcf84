#pragma once

#include <cstddef>
#include <string_view>

namespace rustman {

enum class selection_kind {
    /// The user asked to leave the menu
    quit,
    /// The user picked a project
    index,
    /// The input was not a usable selection
    invalid,
};

enum class invalid_reason {
    none,
    /// Not 'q', and not an integer at all
    not_a_number,
    /// An integer, but not one of the listed project numbers
    out_of_range,
};

/**
 * @brief One line of user input at the project menu, interpreted against the number of listed
 * projects.
 */
struct selection {
    selection_kind kind = selection_kind::invalid;
    /// Zero-based index of the chosen project. Only meaningful for selection_kind::index
    std::size_t index = 0;
    /// Why the input was rejected. Only meaningful for selection_kind::invalid
    invalid_reason why = invalid_reason::none;

    /**
     * @brief Interpret a line of input.
     *
     * Surrounding whitespace is ignored. "q" (either case) quits. A decimal integer from 1 to
     * `count` selects the project with that one-based number.
     */
    [[nodiscard]] static selection parse(std::string_view input, std::size_t count) noexcept;

    static selection quit() noexcept { return {selection_kind::quit}; }
    static selection pick(std::size_t idx) noexcept { return {selection_kind::index, idx}; }
    static selection invalid(invalid_reason why) noexcept {
        return {selection_kind::invalid, 0, why};
    }
};

}  // namespace rustman
