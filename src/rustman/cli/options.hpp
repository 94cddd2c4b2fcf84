#pragma once

#include <rustman/project/scan.hpp>
#include <rustman/util/log.hpp>

#include <debate/argument_parser.hpp>

#include <filesystem>
#include <string>

namespace rustman::cli {

/**
 * @brief Complete aggregate of all rustman command-line options
 */
struct options {
    using path   = fs::path;
    using string = std::string;

    options() noexcept;

    // The `--dir` argument. Defaults to $RUSTMAN_DIR, then to ~/rust
    path scan_dir;
    // The `--log-level` argument
    log::level log_level = default_from_env("RUSTMAN_LOG_LEVEL", log::level::info);
    // The `--on-bad-manifest` argument
    bad_manifest_policy on_bad_manifest
        = default_from_env("RUSTMAN_ON_BAD_MANIFEST", bad_manifest_policy::fallback);
    // An explicit `--list`. Listing is also what happens without it.
    bool list = false;
    // `--version`
    bool show_version = false;

    /**
     * @brief Attach arguments to the given argument parser, binding those arguments to the values
     * in this object.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;

    static log::level          default_from_env(string env_var, log::level default_value) noexcept;
    static bad_manifest_policy default_from_env(string              env_var,
                                                bad_manifest_policy default_value) noexcept;
};

}  // namespace rustman::cli
