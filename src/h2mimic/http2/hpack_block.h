// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_HTTP2_HPACK_BLOCK_H_
#define H2MIMIC_HTTP2_HPACK_BLOCK_H_

#include <nghttp2/nghttp2.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "h2mimic/core/io_buffer.h"
#include "h2mimic/types.h"

namespace h2mimic {
namespace http2 {

struct NgDeflaterDeleter {
  void operator()(nghttp2_hd_deflater* deflater) const {
    if (deflater != nullptr) {
      nghttp2_hd_deflate_del(deflater);
    }
  }
};

struct NgInflaterDeleter {
  void operator()(nghttp2_hd_inflater* inflater) const {
    if (inflater != nullptr) {
      nghttp2_hd_inflate_del(inflater);
    }
  }
};

using NgDeflaterPtr = std::unique_ptr<nghttp2_hd_deflater, NgDeflaterDeleter>;
using NgInflaterPtr = std::unique_ptr<nghttp2_hd_inflater, NgInflaterDeleter>;

// HPACK header block encoder (one per connection direction).
// Emits fields in exactly the order of the nv array.
class HpackEncoder {
 public:
  static Result<HpackEncoder> Create(size_t max_table_size = 4096);

  // Append the encoded block to dst; returns bytes written
  Result<size_t> Encode(const std::vector<nghttp2_nv>& nva,
                        core::IoBuffer& dst);

 private:
  explicit HpackEncoder(NgDeflaterPtr deflater)
      : deflater_(std::move(deflater)) {}

  NgDeflaterPtr deflater_;
};

// HPACK header block decoder (one per connection direction)
class HpackDecoder {
 public:
  static Result<HpackDecoder> Create();

  // Decode a complete header block; fields are returned in wire order
  Result<Headers> Decode(std::span<const uint8_t> block);

 private:
  explicit HpackDecoder(NgInflaterPtr inflater)
      : inflater_(std::move(inflater)) {}

  NgInflaterPtr inflater_;
};

}  // namespace http2
}  // namespace h2mimic

#endif  // H2MIMIC_HTTP2_HPACK_BLOCK_H_
