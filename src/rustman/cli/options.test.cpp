#include "./options.hpp"

#include <debate/debate.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>

using namespace rustman;

namespace {

struct scoped_env {
    std::string name;

    scoped_env(std::string n, const char* value)
        : name(std::move(n)) {
        ::setenv(name.c_str(), value, 1);
    }
    ~scoped_env() { ::unsetenv(name.c_str()); }
};

}  // namespace

TEST_CASE("Parse command-line options") {
    cli::options            opts;
    debate::argument_parser parser;
    opts.setup_parser(parser);

    parser.parse_argv({"--dir", "/tmp/my-projects", "-L", "debug", "--on-bad-manifest=skip"});
    CHECK(opts.scan_dir == "/tmp/my-projects");
    CHECK(opts.log_level == log::level::debug);
    CHECK(opts.on_bad_manifest == bad_manifest_policy::skip);
    CHECK_FALSE(opts.list);
    CHECK_FALSE(opts.show_version);

    parser.parse_argv({"-l"});
    CHECK(opts.list);
    parser.parse_argv({"--version"});
    CHECK(opts.show_version);

    CHECK_THROWS_AS(parser.parse_argv({"--on-bad-manifest=ignore"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--log-level=loud"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--frob"}), debate::unrecognized_argument);
}

TEST_CASE("Option defaults") {
    scoped_env home{"HOME", "/home/tester"};
    ::unsetenv("RUSTMAN_DIR");
    ::unsetenv("RUSTMAN_LOG_LEVEL");
    ::unsetenv("RUSTMAN_ON_BAD_MANIFEST");

    cli::options opts;
    CHECK(opts.scan_dir == fs::path("/home/tester/rust"));
    CHECK(opts.log_level == log::level::info);
    CHECK(opts.on_bad_manifest == bad_manifest_policy::fallback);
}

TEST_CASE("Option defaults from the environment") {
    scoped_env dir{"RUSTMAN_DIR", "/srv/crates"};
    scoped_env level{"RUSTMAN_LOG_LEVEL", "trace"};
    scoped_env policy{"RUSTMAN_ON_BAD_MANIFEST", "skip"};

    cli::options opts;
    CHECK(opts.scan_dir == fs::path("/srv/crates"));
    CHECK(opts.log_level == log::level::trace);
    CHECK(opts.on_bad_manifest == bad_manifest_policy::skip);
}

TEST_CASE("Invalid environment values are ignored") {
    scoped_env level{"RUSTMAN_LOG_LEVEL", "LOUD"};
    scoped_env policy{"RUSTMAN_ON_BAD_MANIFEST", "explode"};

    cli::options opts;
    CHECK(opts.log_level == log::level::info);
    CHECK(opts.on_bad_manifest == bad_manifest_policy::fallback);
}
