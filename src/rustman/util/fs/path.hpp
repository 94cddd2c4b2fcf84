#pragma once

#include <rustman/error/result_fwd.hpp>

#include <filesystem>

namespace rustman {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

/**
 * @brief An error occurring when resolving a filepath
 */
struct e_resolve_path {
    fs::path value;
};

/**
 * @brief Convert a path to its most-normal form.
 *
 * This removes redundant path elements (dots and dot-dots) and trailing directory separators.
 */
[[nodiscard]] fs::path normalize_path(path_ref p) noexcept;

/**
 * @brief Obtain the normalized path to an existing file or directory.
 */
[[nodiscard]] result<fs::path> resolve_path_strong(path_ref p) noexcept;

}  // namespace rustman
