// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_HTTP2_PSEUDO_HEADER_H_
#define H2MIMIC_HTTP2_PSEUDO_HEADER_H_

#include <cstdint>
#include <string_view>

namespace h2mimic {
namespace http2 {

// Request pseudo-header fields (RFC 7540 Section 8.1.2.3)
enum class PseudoType : uint8_t {
  kMethod,
  kScheme,
  kAuthority,
  kPath,
};

inline constexpr std::string_view PseudoTypeName(PseudoType type) {
  switch (type) {
    case PseudoType::kMethod:
      return ":method";
    case PseudoType::kScheme:
      return ":scheme";
    case PseudoType::kAuthority:
      return ":authority";
    case PseudoType::kPath:
      return ":path";
  }
  return {};
}

}  // namespace http2
}  // namespace h2mimic

#endif  // H2MIMIC_HTTP2_PSEUDO_HEADER_H_
