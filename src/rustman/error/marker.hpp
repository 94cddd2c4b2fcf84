#pragma once

#include <string>
#include <string_view>

namespace rustman {

/**
 * @brief Record a short machine-readable name for the error that is being reported.
 *
 * If the RUSTMAN_WRITE_ERROR_MARKER environment variable names a file, the marker is written
 * into that file. Scripts and tests use this to tell failures apart without scraping the log.
 */
void write_error_marker(std::string_view) noexcept;

struct e_error_marker {
    std::string value;
};

}  // namespace rustman
