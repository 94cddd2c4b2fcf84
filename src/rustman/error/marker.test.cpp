#include "./marker.hpp"

#include <rustman/util/fs/io.hpp>
#include <rustman/util/temp.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>

using namespace rustman;

TEST_CASE("Write an error marker to the requested file") {
    auto tmp         = temporary_dir::create();
    auto marker_path = tmp.path() / "marker.txt";
    ::setenv("RUSTMAN_WRITE_ERROR_MARKER", marker_path.c_str(), 1);
    write_error_marker("scan-dir-inaccessible");
    ::unsetenv("RUSTMAN_WRITE_ERROR_MARKER");
    CHECK(read_file(marker_path) == "scan-dir-inaccessible");
}

TEST_CASE("An unwritable marker file is not an error") {
    auto tmp = temporary_dir::create();
    ::setenv("RUSTMAN_WRITE_ERROR_MARKER", (tmp.path() / "no/such/dir/marker").c_str(), 1);
    CHECK_NOTHROW(write_error_marker("anything"));
    ::unsetenv("RUSTMAN_WRITE_ERROR_MARKER");
}
