#pragma once

#include <rustman/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rustman {

/// Shown in place of a missing or empty project description
inline constexpr std::string_view NO_DESCRIPTION = "No description";

/**
 * @brief A project directory found by a scan, along with the metadata read from its manifest.
 */
struct project_info {
    /// The package name, or the directory's name if the manifest did not provide one
    std::string name;
    std::optional<std::string> description;
    /// Absolute path to the project directory
    fs::path path;

    /// The directory in which `cargo build --release` places its outputs
    [[nodiscard]] fs::path build_output_path() const { return path / "target" / "release"; }

    [[nodiscard]] std::string_view description_or_placeholder() const noexcept {
        if (description && !description->empty()) {
            return *description;
        }
        return NO_DESCRIPTION;
    }
};

}  // namespace rustman
