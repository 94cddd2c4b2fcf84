#include "./path.hpp"

#include <rustman/rustman.test.hpp>
#include <rustman/util/temp.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Normalize some paths") {
    CHECK(rustman::normalize_path("foo").string() == "foo");
    CHECK(rustman::normalize_path("foo/bar").string() == "foo/bar");
    CHECK(rustman::normalize_path("foo/bar/").string() == "foo/bar");
    CHECK(rustman::normalize_path("foo//bar/").string() == "foo/bar");
    CHECK(rustman::normalize_path("foo/./bar/").string() == "foo/bar");
    CHECK(rustman::normalize_path("foo/../foo/bar/").string() == "foo/bar");
    CHECK(rustman::normalize_path("/").string() == "/");
}

TEST_CASE("Resolve an existing directory") {
    auto tmp = rustman::temporary_dir::create();
    auto resolved = REQUIRES_LEAF_NOFAIL(rustman::resolve_path_strong(tmp.path() / "."));
    CHECK(resolved.is_absolute());
    CHECK(resolved.filename() == tmp.path().filename());
}

TEST_CASE("Resolving a missing path is an error") {
    auto tmp = rustman::temporary_dir::create();
    auto r = rustman::resolve_path_strong(tmp.path() / "does-not-exist");
    CHECK_FALSE(r);
}
