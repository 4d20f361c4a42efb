// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/http/ordered_headers.h"

#include <algorithm>
#include <utility>

#include "h2mimic/base/sv_util.h"

namespace h2mimic {
namespace http {
namespace headers {

namespace {

auto FindFirst(const std::vector<Header>& headers, std::string_view name) {
  return std::find_if(headers.begin(), headers.end(), [&](const Header& hdr) {
    return sv::EqualsIgnoreCase(hdr.name, name);
  });
}

}  // namespace

void Set(OrderedHeaders& h, std::string_view name, std::string_view value) {
  auto it = std::find_if(h.headers.begin(), h.headers.end(),
                         [&](const Header& hdr) {
                           return sv::EqualsIgnoreCase(hdr.name, name);
                         });
  if (it != h.headers.end()) {
    // Update existing - preserve position
    it->value = std::string(value);
    return;
  }
  h.headers.push_back({std::string(name), std::string(value)});
}

std::string_view Get(const OrderedHeaders& h, std::string_view name) {
  auto it = FindFirst(h.headers, name);
  if (it != h.headers.end()) {
    return it->value;
  }
  return {};
}

bool Has(const OrderedHeaders& h, std::string_view name) {
  return FindFirst(h.headers, name) != h.headers.end();
}

bool Delete(OrderedHeaders& h, std::string_view name) {
  // std::erase_if is stable, so survivors keep their relative order
  size_t removed = std::erase_if(h.headers, [&](const Header& hdr) {
    return sv::EqualsIgnoreCase(hdr.name, name);
  });
  return removed > 0;
}

std::optional<std::string> Take(OrderedHeaders& h, std::string_view name) {
  auto it = FindFirst(h.headers, name);
  if (it == h.headers.end()) {
    return std::nullopt;
  }
  std::string value = it->value;
  Delete(h, name);
  return value;
}

void Add(OrderedHeaders& h, std::string_view name, std::string_view value) {
  h.headers.push_back({std::string(name), std::string(value)});
}

std::vector<std::string_view> GetAll(const OrderedHeaders& h,
                                     std::string_view name) {
  std::vector<std::string_view> result;
  for (const auto& hdr : h.headers) {
    if (sv::EqualsIgnoreCase(hdr.name, name)) {
      result.push_back(hdr.value);
    }
  }
  return result;
}

void Clear(OrderedHeaders& h) { h.headers.clear(); }

OrderedHeaders FromVector(Headers headers) {
  return OrderedHeaders{std::move(headers)};
}

}  // namespace headers
}  // namespace http
}  // namespace h2mimic
