#pragma once

#include <filesystem>

namespace rustman {

/// The root directory being scanned for projects
struct e_scan_directory {
    std::filesystem::path value;
};

/// The candidate project directory being examined during a scan
struct e_scan_entry {
    std::filesystem::path value;
};

}  // namespace rustman
