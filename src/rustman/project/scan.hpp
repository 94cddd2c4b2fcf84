#pragma once

#include "./project.hpp"

#include <rustman/util/fs/path.hpp>

#include <vector>

namespace rustman {

class cancellation_flag;

/**
 * @brief What to do with a project directory whose manifest cannot be read or parsed
 */
enum class bad_manifest_policy {
    /// Keep the project, named after its directory and without a description
    fallback,
    /// Leave the project out of the scan results
    skip,
};

struct scan_params {
    fs::path            root;
    bad_manifest_policy on_bad_manifest = bad_manifest_policy::fallback;
    /// If given, the scan stops with user_cancelled once this flag is set
    const cancellation_flag* cancel = nullptr;
};

/**
 * @brief Find the Cargo projects that are immediate children of `params.root`.
 *
 * Subdirectories without a Cargo.toml are ignored. Results are in the order that the filesystem
 * lists the directory's entries, which is not necessarily sorted and may differ between
 * filesystems.
 *
 * Throws (with an e_scan_directory and a std::error_code attached) if the root does not exist,
 * is not a directory, or cannot be listed.
 */
[[nodiscard]] std::vector<project_info> scan_projects(const scan_params& params);

}  // namespace rustman
