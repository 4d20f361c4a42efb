// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/http2/request_headers.h"

#include <cstdint>

#include "h2mimic/base/log.h"
#include "h2mimic/base/sv_util.h"

namespace h2mimic {
namespace http2 {

namespace {

size_t PseudoIndex(PseudoType type) { return static_cast<size_t>(type); }

}  // namespace

RequestHeaderBuilder::RequestHeaderBuilder(
    const profile::ClientContext& context)
    : context_(context) {
  pseudo_values_[PseudoIndex(PseudoType::kScheme)] = "https";
}

RequestHeaderBuilder::RequestHeaderBuilder()
    : RequestHeaderBuilder(
          profile::ClientContext::ForProfile(profile::ActiveAgentProfile())) {}

RequestHeaderBuilder& RequestHeaderBuilder::SetMethod(std::string_view method) {
  pseudo_values_[PseudoIndex(PseudoType::kMethod)] = std::string(method);
  return *this;
}

RequestHeaderBuilder& RequestHeaderBuilder::SetScheme(std::string_view scheme) {
  pseudo_values_[PseudoIndex(PseudoType::kScheme)] = std::string(scheme);
  return *this;
}

RequestHeaderBuilder& RequestHeaderBuilder::SetAuthority(
    std::string_view authority) {
  pseudo_values_[PseudoIndex(PseudoType::kAuthority)] = std::string(authority);
  return *this;
}

RequestHeaderBuilder& RequestHeaderBuilder::SetPath(std::string_view path) {
  pseudo_values_[PseudoIndex(PseudoType::kPath)] = std::string(path);
  return *this;
}

RequestHeaderBuilder& RequestHeaderBuilder::AddHeader(std::string_view name,
                                                      std::string_view value) {
  if (sv::EqualsIgnoreCase(name, profile::kProfileHeaderName)) {
    H2MIMIC_LOG(DEBUG, "dropping {} from request headers",
                profile::kProfileHeaderName);
    return *this;
  }
  if (sv::StartsWith(name, ":")) {
    H2MIMIC_LOG(DEBUG, "dropping pseudo-header {} passed as regular header",
                name);
    return *this;
  }

  // HTTP/2 requires lowercase field names
  headers_.push_back({sv::ToLower(name), std::string(value)});
  return *this;
}

RequestHeaderBuilder& RequestHeaderBuilder::AddHeaders(
    const http::headers::OrderedHeaders& headers) {
  for (const auto& hdr : headers.headers) {
    AddHeader(hdr.name, hdr.value);
  }
  return *this;
}

nghttp2_nv RequestHeaderBuilder::MakeNv(std::string_view name,
                                        const std::string& value) {
  nghttp2_nv nv;
  nv.name = reinterpret_cast<uint8_t*>(const_cast<char*>(name.data()));
  nv.namelen = name.size();
  nv.value = reinterpret_cast<uint8_t*>(const_cast<char*>(value.data()));
  nv.valuelen = value.size();
  nv.flags = NGHTTP2_NV_FLAG_NO_COPY_NAME | NGHTTP2_NV_FLAG_NO_COPY_VALUE;
  return nv;
}

std::vector<nghttp2_nv> RequestHeaderBuilder::Build() const {
  std::vector<nghttp2_nv> nva;
  nva.reserve(HeaderCount());

  for (PseudoType type : context_.pseudo_order()) {
    nva.push_back(
        MakeNv(PseudoTypeName(type), pseudo_values_[PseudoIndex(type)]));
  }
  for (const auto& hdr : headers_) {
    nva.push_back(MakeNv(hdr.name, hdr.value));
  }

  H2MIMIC_LOG(TRACE, "built {} request headers for profile {}", nva.size(),
              profile::AgentProfileToString(context_.profile()));
  return nva;
}

Headers RequestHeaderBuilder::BuildHeaderList() const {
  Headers result;
  result.reserve(HeaderCount());

  for (PseudoType type : context_.pseudo_order()) {
    result.push_back({std::string(PseudoTypeName(type)),
                      pseudo_values_[PseudoIndex(type)]});
  }
  result.insert(result.end(), headers_.begin(), headers_.end());
  return result;
}

nghttp2_priority_spec RequestHeaderBuilder::PrioritySpec() const {
  return ToNghttp2PrioritySpec(context_.dependency());
}

nghttp2_priority_spec ToNghttp2PrioritySpec(
    const frame::StreamDependency& dependency) {
  nghttp2_priority_spec spec;
  nghttp2_priority_spec_init(
      &spec, static_cast<int32_t>(dependency.dependency_id().value()),
      static_cast<int32_t>(dependency.effective_weight()),
      dependency.is_exclusive() ? 1 : 0);
  return spec;
}

}  // namespace http2
}  // namespace h2mimic
