#pragma once
#include <string_view>

namespace ezfuck::ansi {
inline constexpr std::string_view red{"\x1b[31m"};
inline constexpr std::string_view yellow{"\x1b[33m"};
inline constexpr std::string_view reset{"\x1b[0m"};
}  // namespace ezfuck::ansi
