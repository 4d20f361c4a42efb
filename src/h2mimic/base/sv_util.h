// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

// String view utilities - locale-free ASCII operations for header names.

#ifndef H2MIMIC_BASE_SV_UTIL_H_
#define H2MIMIC_BASE_SV_UTIL_H_

#include <cstddef>
#include <string>
#include <string_view>

namespace h2mimic {
namespace sv {

// Branchless ASCII lowercase character (avoids std::tolower locale overhead)
inline constexpr char ToLowerChar(char c) {
  return static_cast<char>(c + ((c >= 'A' && c <= 'Z') * 32));
}

// Case-insensitive equality (no allocation)
inline constexpr bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ToLowerChar(a[i]) != ToLowerChar(b[i])) {
      return false;
    }
  }
  return true;
}

// Lowercased copy; HTTP/2 field names must be lowercase on the wire
inline std::string ToLower(std::string_view s) {
  std::string result(s);
  for (char& c : result) {
    c = ToLowerChar(c);
  }
  return result;
}

inline constexpr bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace sv
}  // namespace h2mimic

#endif  // H2MIMIC_BASE_SV_UTIL_H_
