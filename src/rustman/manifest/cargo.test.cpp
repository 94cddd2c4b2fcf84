#include "./cargo.hpp"

#include "./error.hpp"

#include <rustman/error/try_catch.hpp>
#include <rustman/rustman.test.hpp>
#include <rustman/util/temp.hpp>

#include <catch2/catch.hpp>

using namespace rustman;

TEST_CASE("Read name and description") {
    auto man = cargo_manifest::from_string(R"(
[package]
name = "foo"
description = "bar"
)");
    CHECK(man.name == "foo");
    CHECK(man.description == "bar");
}

TEST_CASE("Description is optional") {
    auto man = cargo_manifest::from_string("[package]\nname = \"foo\"\n");
    CHECK(man.name == "foo");
    CHECK_FALSE(man.description);

    man = cargo_manifest::from_string("[package]\nname = \"foo\"\ndescription = \"\"\n");
    CHECK_FALSE(man.description);
}

TEST_CASE("Only string values are package metadata") {
    auto man = cargo_manifest::from_string("[package]\nname = 12\ndescription = [\"x\"]\n");
    CHECK_FALSE(man.name);
    CHECK_FALSE(man.description);
}

TEST_CASE("Fields outside of [package] are not package metadata") {
    auto man = cargo_manifest::from_string(R"(
name = "top-level"
[workspace]
members = ["a", "b"]
[workspace.package]
description = "shared"
)");
    CHECK_FALSE(man.name);
    CHECK_FALSE(man.description);
}

TEST_CASE("A quoted key containing a dot is not a nested key") {
    auto man = cargo_manifest::from_string(R"(
"package.name" = "wrong"
[package]
name = "right"
)");
    CHECK(man.name == "right");
}

TEST_CASE("Workspace-inherited fields read as absent") {
    auto man = cargo_manifest::from_string(R"(
[package]
name = "member"
description.workspace = true
)");
    CHECK(man.name == "member");
    CHECK_FALSE(man.description);
}

TEST_CASE("A typical manifest") {
    auto man = cargo_manifest::from_string(R"(
# A comment
[package]
name = 'literal-name'
version = "0.1.0"
edition = "2021"
authors = [
    "Someone <someone@example.com>",  # trailing comment
]
description = """
Spans \
    one line"""
license = "MIT OR Apache-2.0"

[dependencies]
serde = { version = "1", features = ["derive"] }
clap.version = "4"

[[bin]]
name = "tool"
path = "src/main.rs"

[profile.release]
lto = true
opt-level = 3
)");
    CHECK(man.name == "literal-name");
    CHECK(man.description == "Spans one line");
}

TEST_CASE("Invalid manifests") {
    struct case_ {
        std::string_view content;
        int              line;
    };
    const auto c = GENERATE(Catch::Generators::values<case_>({
        {"[package\n", 1},
        {"[package]\nname = \"unterminated\n", 2},
        {"[package]\nname = \"a\"\nname = \"b\"\n", 3},
        {"package.name = \"a\"\n[package]\nname = \"b\"\n", 2},
        {"[package]\n[package]\n", 2},
        {"[package]\nname = \"bad \\q escape\"\n", 2},
        {"[package]\nname\n", 2},
    }));
    INFO(c.content);
    rustman_leaf_try {
        (void)cargo_manifest::from_string(c.content);
        FAIL_CHECK("Expected a parse error");
    }
    rustman_leaf_catch(const invalid_toml&, e_toml_parse_error err, e_toml_line err_line) {
        CHECK_FALSE(err.value.empty());
        CHECK(err_line.value == c.line);
    }
    rustman_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}

TEST_CASE("Load a manifest file") {
    auto tmp = temporary_dir::create();
    testing::write_fixture(tmp.path() / "Cargo.toml",
                           "[package]\nname = \"on-disk\"\ndescription = \"A file\"\n");
    auto man = REQUIRES_LEAF_NOFAIL(cargo_manifest::from_file(tmp.path() / "Cargo.toml"));
    CHECK(man.name == "on-disk");
    CHECK(man.description == "A file");
}

TEST_CASE("A malformed manifest file reports its path") {
    auto tmp   = temporary_dir::create();
    auto fpath = tmp.path() / "Cargo.toml";
    testing::write_fixture(fpath, "[package\n");
    rustman_leaf_try {
        (void)cargo_manifest::from_file(fpath);
        FAIL_CHECK("Expected an error");
    }
    rustman_leaf_catch(e_toml_parse_error, e_toml_line line, e_cargo_manifest_path man_path) {
        CHECK(line.value == 1);
        CHECK(man_path.value == fpath);
    }
    rustman_leaf_catch_all { FAIL_CHECK("Incorrect error: " << diagnostic_info); };
}
