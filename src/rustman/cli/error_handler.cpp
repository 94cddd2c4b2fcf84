#include "./error_handler.hpp"

#include <rustman/error/exit.hpp>
#include <rustman/error/marker.hpp>
#include <rustman/project/error.hpp>
#include <rustman/util/log.hpp>
#include <rustman/util/signal.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <fansi/styled.hpp>
#include <fmt/ostream.h>

#include <iostream>
#include <system_error>

using namespace rustman;
using namespace fansi::literals;

namespace {

auto handlers = std::tuple(  //
    [](e_scan_directory dir, std::error_code ec, e_scan_entry const* entry) {
        rustman_log(error,
                    "Unable to read the projects directory [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                    dir.value.string(),
                    ec.message());
        if (entry) {
            rustman_log(error, "  (While examining [{}])", entry->value.string());
        }
        if (ec == std::errc::no_such_file_or_directory) {
            rustman_log(info,
                        "  (Use .bold[--dir] or set .bold[RUSTMAN_DIR] to scan another "
                        "directory)"_styled);
        }
        write_error_marker("scan-dir-inaccessible");
        return 1;
    },
    [](const user_cancelled&) {
        std::cout << "\nProgram interrupted. Exiting...\n" << std::flush;
        return 0;
    },
    [](rustman::e_exit                             ex,
       boost::leaf::verbose_diagnostic_info const& info,
       rustman::e_error_marker const*              marker) {
        rustman_log(trace, "Additional error information: {}", fmt::streamed(info));
        if (marker) {
            write_error_marker(marker->value);
        }
        return ex.value;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        rustman_log(critical,
                    "An unhandled std::system_error arose. .bold.red[THIS IS A RUSTMAN BUG!] "
                    "Info: {}"_styled,
                    fmt::streamed(diag));
        rustman_log(critical,
                    "Exception message from std::system_error: .bold.red[{}]"_styled,
                    exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        rustman_log(critical,
                    "An unhandled error arose. .bold.red[THIS IS A RUSTMAN BUG!] Info: {}"_styled,
                    fmt::streamed(diag));
        return 42;
    });
}  // namespace

int rustman::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
