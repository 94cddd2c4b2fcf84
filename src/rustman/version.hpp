#pragma once

#include <string_view>

namespace rustman {

inline constexpr std::string_view VERSION_STRING = "0.1.0";

}  // namespace rustman
