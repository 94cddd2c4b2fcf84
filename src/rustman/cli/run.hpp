#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace rustman {

class cancellation_flag;

namespace cli {

/**
 * @brief Parse the command line and run the selected action, returning the process exit code.
 *
 * `--help` and command-line usage errors are answered without touching the projects directory:
 * Help text goes to `out` with exit code 0, and usage errors go to `err` with exit code 2.
 */
int run(std::string_view                program_name,
        const std::vector<std::string>& argv,
        const cancellation_flag&        cancel,
        std::ostream&                   out,
        std::ostream&                   err);

}  // namespace cli

}  // namespace rustman
