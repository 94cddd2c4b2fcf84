#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace rustman {

/**
 * @brief Thrown when manifest text is not valid TOML
 */
struct invalid_toml : std::runtime_error {
    using runtime_error::runtime_error;
};

struct e_toml_parse_error {
    std::string value;
};

/// 1-based line number at which a TOML parse error was detected
struct e_toml_line {
    int value;
};

struct e_cargo_manifest_path {
    std::filesystem::path value;
};

}  // namespace rustman
