// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

// OrderedHeaders - HTTP headers kept in insertion order.
// Data-oriented design: struct with public data, free functions operate on data.
//
// Header order is part of a client's fingerprint, so no operation here ever
// reorders the headers it leaves in place.

#ifndef H2MIMIC_HTTP_ORDERED_HEADERS_H_
#define H2MIMIC_HTTP_ORDERED_HEADERS_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "h2mimic/types.h"

namespace h2mimic {
namespace http {
namespace headers {

// Header lists are short; lookups are linear scans with ASCII
// case-insensitive name comparison.
struct OrderedHeaders {
  std::vector<Header> headers;
};

// === Single-value operations (upsert) ===

// Set header (replaces first match in place, appends if absent)
void Set(OrderedHeaders& h, std::string_view name, std::string_view value);

// Get first value (empty if not found)
std::string_view Get(const OrderedHeaders& h, std::string_view name);

bool Has(const OrderedHeaders& h, std::string_view name);

// Remove every header with this name (returns true if any removed)
bool Delete(OrderedHeaders& h, std::string_view name);

// Remove every header with this name and return the first value
std::optional<std::string> Take(OrderedHeaders& h, std::string_view name);

// === Multi-value operations ===

// Add header (allows duplicates, appends to end)
void Add(OrderedHeaders& h, std::string_view name, std::string_view value);

// All values for a name, in order
std::vector<std::string_view> GetAll(const OrderedHeaders& h,
                                     std::string_view name);

// === Utility ===

void Clear(OrderedHeaders& h);

OrderedHeaders FromVector(Headers headers);

}  // namespace headers
}  // namespace http
}  // namespace h2mimic

#endif  // H2MIMIC_HTTP_ORDERED_HEADERS_H_
