#pragma once

#include "./selection.hpp"

#include <rustman/project/project.hpp>

#include <iosfwd>
#include <optional>
#include <vector>

namespace rustman {

class cancellation_flag;
class line_reader;

enum class menu_state {
    listing,
    awaiting_selection,
    showing_detail,
    terminated,
};

/// Why the menu stopped running
enum class exit_reason {
    /// The user entered 'q'
    quit,
    /// The input stream closed
    end_of_input,
    /// The cancellation flag was set while waiting for input
    interrupted,
    /// There was nothing to list
    no_projects,
};

/**
 * @brief The interactive project menu: a numbered listing, then a prompt loop that shows the
 * details of the chosen project.
 */
class project_menu {
    std::vector<project_info> _projects;
    line_reader&              _input;
    std::ostream&             _out;
    const cancellation_flag&  _cancel;
    menu_state                _state = menu_state::listing;

public:
    project_menu(std::vector<project_info> projects,
                 line_reader&              input,
                 std::ostream&             out,
                 const cancellation_flag&  cancel)
        : _projects(std::move(projects))
        , _input(input)
        , _out(out)
        , _cancel(cancel) {}

    /// Print one "<n>. <name> - <description>" line per project
    void render_listing();

    /**
     * @brief Print the prompt and read one selection.
     *
     * Returns nullopt if the input ended or the user cancelled before a line was read.
     */
    [[nodiscard]] std::optional<selection> read_selection();

    void show_detail(const project_info& proj);

    /**
     * @brief Run the menu until the user quits, the input ends, or the program is interrupted.
     */
    exit_reason run();

    [[nodiscard]] menu_state state() const noexcept { return _state; }

    [[nodiscard]] auto& projects() const noexcept { return _projects; }
};

}  // namespace rustman
