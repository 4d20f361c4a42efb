// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_HTTP2_REQUEST_HEADERS_H_
#define H2MIMIC_HTTP2_REQUEST_HEADERS_H_

#include <nghttp2/nghttp2.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "h2mimic/frame/priority.h"
#include "h2mimic/http/ordered_headers.h"
#include "h2mimic/http2/pseudo_header.h"
#include "h2mimic/profile/client_context.h"
#include "h2mimic/types.h"

namespace h2mimic {
namespace http2 {

// Builds a request header list in the impersonated client's wire order.
//
// Pseudo-headers come first in the profile's order, followed by regular
// headers exactly in insertion order. nghttp2 sends the nv array as given,
// so this order is what the peer observes.
//
// Usage:
//   auto ctx = profile::ResolveClientContext(headers, config);
//   RequestHeaderBuilder builder(ctx);
//   builder.SetMethod("GET").SetAuthority("example.com").SetPath("/");
//   builder.AddHeaders(headers);
//   auto nva = builder.Build();
//   auto pri = builder.PrioritySpec();
//   nghttp2_submit_request(session, &pri, nva.data(), nva.size(), ...);
//
class RequestHeaderBuilder {
 public:
  explicit RequestHeaderBuilder(const profile::ClientContext& context);

  // Uses the calling thread's client slot (Chrome if unset)
  RequestHeaderBuilder();

  RequestHeaderBuilder& SetMethod(std::string_view method);
  RequestHeaderBuilder& SetScheme(std::string_view scheme);  // default: https
  RequestHeaderBuilder& SetAuthority(std::string_view authority);
  RequestHeaderBuilder& SetPath(std::string_view path);

  // Append a regular header. Names are lowercased. The sentinel header and
  // pseudo-header names are dropped.
  RequestHeaderBuilder& AddHeader(std::string_view name,
                                  std::string_view value);
  RequestHeaderBuilder& AddHeaders(
      const http::headers::OrderedHeaders& headers);

  // Build the nghttp2_nv array.
  // IMPORTANT: entries point into this builder; it must outlive the array.
  std::vector<nghttp2_nv> Build() const;

  // Same order as Build(), as owned strings
  Headers BuildHeaderList() const;

  // Priority to send with the HEADERS frame
  nghttp2_priority_spec PrioritySpec() const;

  const profile::ClientContext& context() const { return context_; }
  size_t HeaderCount() const { return kPseudoCount + headers_.size(); }

 private:
  static constexpr size_t kPseudoCount = 4;

  static nghttp2_nv MakeNv(std::string_view name, const std::string& value);

  profile::ClientContext context_;

  // Pseudo-header values indexed by PseudoType
  std::array<std::string, kPseudoCount> pseudo_values_;

  // Regular headers (lowercase names), insertion order
  std::vector<Header> headers_;
};

// Map a stream dependency to nghttp2's priority spec (weight 1-256)
nghttp2_priority_spec ToNghttp2PrioritySpec(
    const frame::StreamDependency& dependency);

}  // namespace http2
}  // namespace h2mimic

#endif  // H2MIMIC_HTTP2_REQUEST_HEADERS_H_
