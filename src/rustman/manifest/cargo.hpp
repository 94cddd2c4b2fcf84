#pragma once

#include <rustman/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rustman {

/// The name of the manifest file that marks a directory as a Cargo project
inline constexpr std::string_view CARGO_MANIFEST_FILENAME = "Cargo.toml";

/**
 * @brief The subset of a Cargo.toml that describes the package.
 *
 * Only string-valued `package.name` and `package.description` fields are used. Values inherited
 * from a workspace (e.g. `description.workspace = true`) are not resolved and read as absent, and
 * an empty string reads the same as a missing field.
 */
struct cargo_manifest {
    std::optional<std::string> name;
    std::optional<std::string> description;

    /**
     * @brief Parse manifest text. Throws invalid_toml (with e_toml_parse_error and e_toml_line
     * attached) if the text is not valid TOML.
     *
     * @param source_name The name of the text's origin, used in error messages
     */
    static cargo_manifest from_string(std::string_view content,
                                      std::string_view source_name = CARGO_MANIFEST_FILENAME);
    static cargo_manifest from_file(path_ref manifest_path);
};

}  // namespace rustman
