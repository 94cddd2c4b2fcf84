#include "./menu.hpp"

#include "./line_reader.hpp"

#include <rustman/util/log.hpp>
#include <rustman/util/signal.hpp>

#include <fmt/ostream.h>

#include <ostream>

using namespace rustman;

void project_menu::render_listing() {
    _state = menu_state::listing;
    std::size_t n = 1;
    for (auto& proj : _projects) {
        fmt::print(_out, "{}. {} - {}\n", n++, proj.name, proj.description_or_placeholder());
    }
}

std::optional<selection> project_menu::read_selection() {
    _state = menu_state::awaiting_selection;
    _out << "> " << std::flush;
    auto line = _input.read_line();
    if (!line) {
        return std::nullopt;
    }
    rustman_log(trace, "User input: '{}'", *line);
    return selection::parse(*line, _projects.size());
}

void project_menu::show_detail(const project_info& proj) {
    _state = menu_state::showing_detail;
    fmt::print(_out,
               "\nProject Details:\n"
               "Project Name: {}\n"
               "Description: {}\n"
               "Path: {}\n"
               "You can run this project from: {}\n",
               proj.name,
               proj.description_or_placeholder(),
               proj.path.string(),
               proj.build_output_path().string());
}

exit_reason project_menu::run() {
    if (_projects.empty()) {
        _out << "No Rust projects found.\n";
        _state = menu_state::terminated;
        return exit_reason::no_projects;
    }

    render_listing();
    _out << "\nEnter the number of the project to view details, or 'q' to quit:\n";

    while (true) {
        auto sel = read_selection();
        if (!sel) {
            _state = menu_state::terminated;
            if (_cancel.is_cancelled()) {
                rustman_log(debug, "Menu interrupted by signal {}", _cancel.signal_number());
                _out << "\nProgram interrupted. Exiting...\n" << std::flush;
                return exit_reason::interrupted;
            }
            rustman_log(debug, "Input closed. Leaving the menu.");
            _out << std::flush;
            return exit_reason::end_of_input;
        }

        switch (sel->kind) {
        case selection_kind::quit:
            _state = menu_state::terminated;
            _out << "Exiting program...\n" << std::flush;
            return exit_reason::quit;
        case selection_kind::index:
            show_detail(_projects[sel->index]);
            break;
        case selection_kind::invalid:
            if (sel->why == invalid_reason::out_of_range) {
                _out << "Invalid selection. Please enter a valid project number.\n";
            } else {
                _out << "Please enter a valid number or 'q' to quit.\n";
            }
            break;
        }
    }
}
