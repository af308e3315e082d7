#pragma once

#include <string_view>

namespace sightline::core {

/// s without leading and trailing spaces, tabs, CR and LF.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto start = s.find_first_not_of(kSpace);
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(kSpace);
  return s.substr(start, end - start + 1);
}

}  // namespace sightline::core
