#include "./error_handler.hpp"

#include <rustman/error/exit.hpp>
#include <rustman/error/marker.hpp>
#include <rustman/error/on_error.hpp>
#include <rustman/util/fs/io.hpp>
#include <rustman/project/scan.hpp>
#include <rustman/util/signal.hpp>
#include <rustman/util/temp.hpp>

#include <boost/leaf/exception.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>
#include <stdexcept>

using namespace rustman;

TEST_CASE("Successful commands keep their exit code") {
    CHECK(handle_cli_errors([] { return 0; }) == 0);
    CHECK(handle_cli_errors([] { return 3; }) == 3);
}

TEST_CASE("An inaccessible projects directory exits with 1") {
    auto tmp = temporary_dir::create();
    auto rc  = handle_cli_errors([&] {
        (void)scan_projects({.root = tmp.path() / "missing"});
        return 0;
    });
    CHECK(rc == 1);
}

TEST_CASE("An interrupt exits cleanly") {
    CHECK(handle_cli_errors([]() -> int { throw user_cancelled(); }) == 0);

    cancellation_flag flag;
    flag.notify(SIGINT);
    CHECK(handle_cli_errors([&] {
              flag.cancellation_point();
              return 5;
          })
          == 0);
}

TEST_CASE("e_exit supplies the exit code") {
    CHECK(handle_cli_errors([]() -> int { throw_system_exit(2); }) == 2);
}

TEST_CASE("An exit carrying an error marker writes the marker") {
    auto tmp         = temporary_dir::create();
    auto marker_path = tmp.path() / "marker.txt";
    ::setenv("RUSTMAN_WRITE_ERROR_MARKER", marker_path.c_str(), 1);
    auto rc = handle_cli_errors([]() -> int {
        RUSTMAN_E_SCOPE(e_error_marker{"some-failure"});
        throw_system_exit(3);
    });
    ::unsetenv("RUSTMAN_WRITE_ERROR_MARKER");
    CHECK(rc == 3);
    CHECK(read_file(marker_path) == "some-failure");
}

TEST_CASE("Unexpected errors exit with 42") {
    CHECK(handle_cli_errors([]() -> int { throw std::runtime_error("oops"); }) == 42);
    CHECK(handle_cli_errors([]() -> int {
              BOOST_LEAF_THROW_EXCEPTION(std::system_error(
                  std::make_error_code(std::errc::permission_denied)));
          })
          == 42);
}
