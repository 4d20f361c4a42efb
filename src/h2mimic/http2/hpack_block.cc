// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/http2/hpack_block.h"

#include <string>
#include <utility>

#include "h2mimic/base/log.h"

namespace h2mimic {
namespace http2 {

Result<HpackEncoder> HpackEncoder::Create(size_t max_table_size) {
  nghttp2_hd_deflater* deflater_raw = nullptr;
  int rv = nghttp2_hd_deflate_new(&deflater_raw, max_table_size);
  if (rv != 0) {
    return Result<HpackEncoder>::Err(Error::Internal(
        std::string("Failed to create HPACK deflater: ") +
        nghttp2_strerror(rv)));
  }
  return Result<HpackEncoder>::Ok(HpackEncoder(NgDeflaterPtr(deflater_raw)));
}

Result<size_t> HpackEncoder::Encode(const std::vector<nghttp2_nv>& nva,
                                    core::IoBuffer& dst) {
  size_t bound =
      nghttp2_hd_deflate_bound(deflater_.get(), nva.data(), nva.size());
  uint8_t* out = dst.Reserve(bound);

  ssize_t written = nghttp2_hd_deflate_hd(deflater_.get(), out, bound,
                                          nva.data(), nva.size());
  if (written < 0) {
    dst.Commit(0);
    H2MIMIC_LOG(WARN, "HPACK deflate failed: {}",
                nghttp2_strerror(static_cast<int>(written)));
    return Result<size_t>::Err(
        Error::Hpack(std::string("nghttp2_hd_deflate_hd failed: ") +
                     nghttp2_strerror(static_cast<int>(written))));
  }

  dst.Commit(static_cast<size_t>(written));
  H2MIMIC_LOG(TRACE, "HPACK encoded {} fields into {} bytes", nva.size(),
              written);
  return Result<size_t>::Ok(static_cast<size_t>(written));
}

Result<HpackDecoder> HpackDecoder::Create() {
  nghttp2_hd_inflater* inflater_raw = nullptr;
  int rv = nghttp2_hd_inflate_new(&inflater_raw);
  if (rv != 0) {
    return Result<HpackDecoder>::Err(Error::Internal(
        std::string("Failed to create HPACK inflater: ") +
        nghttp2_strerror(rv)));
  }
  return Result<HpackDecoder>::Ok(HpackDecoder(NgInflaterPtr(inflater_raw)));
}

Result<Headers> HpackDecoder::Decode(std::span<const uint8_t> block) {
  Headers headers;
  const uint8_t* in = block.data();
  size_t inlen = block.size();

  for (;;) {
    nghttp2_nv nv;
    int inflate_flags = 0;

    ssize_t rv = nghttp2_hd_inflate_hd2(inflater_.get(), &nv, &inflate_flags,
                                        in, inlen, /*in_final=*/1);
    if (rv < 0) {
      H2MIMIC_LOG(WARN, "HPACK inflate failed: {}",
                  nghttp2_strerror(static_cast<int>(rv)));
      return Result<Headers>::Err(
          Error::Hpack(std::string("nghttp2_hd_inflate_hd2 failed: ") +
                       nghttp2_strerror(static_cast<int>(rv))));
    }

    in += rv;
    inlen -= static_cast<size_t>(rv);

    if (inflate_flags & NGHTTP2_HD_INFLATE_EMIT) {
      headers.push_back(
          {std::string(reinterpret_cast<const char*>(nv.name), nv.namelen),
           std::string(reinterpret_cast<const char*>(nv.value),
                       nv.valuelen)});
    }

    if (inflate_flags & NGHTTP2_HD_INFLATE_FINAL) {
      nghttp2_hd_inflate_end_headers(inflater_.get());
      break;
    }

    if ((inflate_flags & NGHTTP2_HD_INFLATE_EMIT) == 0 && inlen == 0) {
      break;
    }
  }

  return Result<Headers>::Ok(std::move(headers));
}

}  // namespace http2
}  // namespace h2mimic
