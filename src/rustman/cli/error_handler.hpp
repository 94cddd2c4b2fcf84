#pragma once

#include <functional>

namespace rustman {

/**
 * @brief Invoke the given function, and turn any error that escapes it into log output and a
 * process exit code.
 *
 * 1 is returned when the projects directory cannot be accessed, 0 when the user interrupted
 * the program, and 42 for anything unexpected. An e_exit object supplies its own exit code.
 */
int handle_cli_errors(std::function<int()>) noexcept;

}  // namespace rustman
