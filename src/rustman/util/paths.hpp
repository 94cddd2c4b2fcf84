#pragma once

#include <rustman/util/fs/path.hpp>

namespace rustman {

fs::path user_home_dir();

/**
 * @brief The directory scanned when none is given: $RUSTMAN_DIR, or ~/rust
 */
fs::path default_projects_dir();

}  // namespace rustman
