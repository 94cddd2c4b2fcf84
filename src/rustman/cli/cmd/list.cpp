#include "../options.hpp"

#include <rustman/error/exit.hpp>
#include <rustman/error/marker.hpp>
#include <rustman/error/on_error.hpp>
#include <rustman/menu/line_reader.hpp>
#include <rustman/menu/menu.hpp>
#include <rustman/project/scan.hpp>
#include <rustman/util/log.hpp>
#include <rustman/util/signal.hpp>

#include <magic_enum.hpp>

#include <iostream>

#include <unistd.h>

using namespace rustman;

namespace rustman::cli::cmd {

int list(const options& opts, const cancellation_flag& cancel) {
    if (opts.scan_dir.empty()) {
        RUSTMAN_E_SCOPE(e_error_marker{"empty-projects-dir"});
        rustman_log(error, "The projects directory must not be an empty path");
        throw_system_exit(2);
    }

    auto projects = scan_projects({
        .root            = opts.scan_dir,
        .on_bad_manifest = opts.on_bad_manifest,
        .cancel          = &cancel,
    });
    rustman_log(debug, "Found {} project(s) in [{}]", projects.size(), opts.scan_dir.string());

    fd_line_reader input{STDIN_FILENO, cancel};
    project_menu   menu{std::move(projects), input, std::cout, cancel};
    auto           why = menu.run();
    rustman_log(trace, "Menu finished ({})", magic_enum::enum_name(why));
    return 0;
}

}  // namespace rustman::cli::cmd
