#if __linux__ || __FreeBSD__

#include "./paths.hpp"

#include <rustman/util/env.hpp>
#include <rustman/util/log.hpp>

using namespace rustman;

fs::path rustman::user_home_dir() {
    return fs::absolute(rustman::getenv("HOME", [] {
        rustman_log(error, "No HOME environment variable set!");
        return "/";
    }));
}

fs::path rustman::default_projects_dir() {
    return fs::absolute(
        rustman::getenv("RUSTMAN_DIR", [] { return (user_home_dir() / "rust").string(); }));
}

#endif
