#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <rustman/version.hpp>

#include <fmt/core.h>

using namespace rustman;

namespace rustman::cli {

namespace cmd {
using command = int(const options&, const cancellation_flag&);

command list;

}  // namespace cmd

int dispatch_main(const options& opts, const cancellation_flag& cancel) noexcept {
    return rustman::handle_cli_errors([&] {
        if (opts.show_version) {
            fmt::print("rustman {}\n", VERSION_STRING);
            return 0;
        }
        return cmd::list(opts, cancel);
    });
}

}  // namespace rustman::cli
