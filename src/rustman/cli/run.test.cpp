#include "./run.hpp"

#include <rustman/util/fs/io.hpp>
#include <rustman/util/signal.hpp>
#include <rustman/util/temp.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>
#include <sstream>

using namespace rustman;

namespace {

struct cli_fixture {
    temporary_dir      tmp = temporary_dir::create();
    cancellation_flag  cancel;
    std::ostringstream out;
    std::ostringstream err;

    std::string missing_dir() const { return (tmp.path() / "no-such-dir").string(); }

    int run(std::vector<std::string> argv) {
        return cli::run("rustman", argv, cancel, out, err);
    }
};

}  // namespace

TEST_CASE("--help prints usage and does not scan") {
    cli_fixture f;
    // The same directory makes the command fail once a scan is attempted
    CHECK(f.run({"--dir", f.missing_dir()}) == 1);

    f.out.str("");
    CHECK(f.run({"--dir", f.missing_dir(), "--help"}) == 0);
    CHECK(f.out.str().starts_with("Usage: rustman"));
    CHECK(f.out.str().find("Browse the Rust projects in a directory") != std::string::npos);
    CHECK(f.out.str().find("--list") != std::string::npos);
    CHECK(f.out.str().find("Project Details") == std::string::npos);
    CHECK(f.err.str().empty());

    f.out.str("");
    CHECK(f.run({"-h"}) == 0);
    CHECK(f.out.str().starts_with("Usage: rustman"));
}

TEST_CASE("Command-line usage errors exit with 2") {
    cli_fixture f;

    SECTION("Unknown flag") {
        CHECK(f.run({"--lsit", "--dir", f.missing_dir()}) == 2);
        CHECK(f.err.str().starts_with("Usage: rustman"));
        CHECK(f.err.str().find("--lsit") != std::string::npos);
        CHECK(f.err.str().find("--list") != std::string::npos);
    }

    SECTION("Invalid enum value") {
        CHECK(f.run({"--on-bad-manifest=ignore", "--dir", f.missing_dir()}) == 2);
        CHECK(f.err.str().find("Invalid value 'ignore'") != std::string::npos);
        CHECK(f.err.str().find("fallback") != std::string::npos);
    }

    SECTION("Missing value") {
        CHECK(f.run({"--dir"}) == 2);
        CHECK(f.err.str().find("'--dir'") != std::string::npos);
    }

    SECTION("Repeated flag") {
        CHECK(f.run({"--dir", f.missing_dir(), "--dir", f.missing_dir()}) == 2);
        CHECK(f.err.str().find("more than once") != std::string::npos);
    }

    CHECK(f.out.str().empty());
}

TEST_CASE("An empty projects directory is rejected with a marker") {
    cli_fixture f;
    auto        marker_path = f.tmp.path() / "marker.txt";
    ::setenv("RUSTMAN_WRITE_ERROR_MARKER", marker_path.c_str(), 1);
    auto rc = f.run({"--dir", ""});
    ::unsetenv("RUSTMAN_WRITE_ERROR_MARKER");
    CHECK(rc == 2);
    CHECK(read_file(marker_path) == "empty-projects-dir");
}
