// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_TYPES_H_
#define H2MIMIC_TYPES_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "h2mimic/error.h"

namespace h2mimic {

// HTTP header pair
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const = default;
};

// Collection of HTTP headers
using Headers = std::vector<Header>;

// Result type for operations that can fail.
// Holds either a value or the Error that prevented producing one.
template <typename T>
struct Result {
  std::optional<T> value;
  Error error;

  explicit operator bool() const { return value.has_value(); }
  bool ok() const { return value.has_value(); }

  static Result Ok(T val) { return {std::move(val), {}}; }

  static Result Err(Error err) { return {std::nullopt, std::move(err)}; }
};

}  // namespace h2mimic

#endif  // H2MIMIC_TYPES_H_
