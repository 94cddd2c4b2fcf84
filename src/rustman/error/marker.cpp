#include "./marker.hpp"

#include <rustman/util/env.hpp>
#include <rustman/util/fs/io.hpp>
#include <rustman/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>

void rustman::write_error_marker(std::string_view error) noexcept {
    rustman_log(trace, "[error marker {}]", error);
    auto efile_path = rustman::getenv("RUSTMAN_WRITE_ERROR_MARKER");
    if (!efile_path) {
        return;
    }
    boost::leaf::try_catch(
        [&] {
            rustman::write_file(*efile_path, error);
            rustman_log(trace, "[error marker written to [{}]]", *efile_path);
        },
        [&](const std::system_error& e) {
            rustman_log(warn,
                        "Failed to write error marker to [{}]: {}",
                        *efile_path,
                        e.code().message());
        });
}
