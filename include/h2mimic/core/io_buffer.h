// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_CORE_IO_BUFFER_H_
#define H2MIMIC_CORE_IO_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace h2mimic {
namespace core {

// Append-only byte sink used by the frame encoders.
// Storage is contiguous; bytes are consumed from the front with a read cursor.
class IoBuffer {
 public:
  IoBuffer();
  explicit IoBuffer(size_t initial_capacity);
  ~IoBuffer();

  // Move-only
  IoBuffer(IoBuffer&& other) noexcept;
  IoBuffer& operator=(IoBuffer&& other) noexcept;
  IoBuffer(const IoBuffer&) = delete;
  IoBuffer& operator=(const IoBuffer&) = delete;

  // Write operations (append to end)
  void Append(const uint8_t* data, size_t len);
  void Append(std::span<const uint8_t> bytes);
  void Append(std::string_view sv);
  void AppendByte(uint8_t b);

  // Reserve space for writing and get pointer
  // Use Commit() after writing to mark space as used
  uint8_t* Reserve(size_t len);
  void Commit(size_t len);

  // Read operations (consume from front)
  size_t Read(uint8_t* dest, size_t max_len);

  // Peek without consuming
  const uint8_t* Peek(size_t* available) const;

  // Readable bytes as a span, valid until next modification
  std::span<const uint8_t> Readable() const;

  // Skip bytes (consume without copying)
  void Skip(size_t len);

  size_t Size() const { return data_.size() - read_pos_ - reserved_; }
  bool Empty() const { return Size() == 0; }

  // Clear all data
  void Clear();

  // Move readable data out; buffer is left empty
  std::vector<uint8_t> TakeContiguous();

 private:
  void Compact();
  void DropReservation();

  std::vector<uint8_t> data_;
  size_t read_pos_ = 0;
  size_t reserved_ = 0;  // Bytes handed out by Reserve() not yet committed
};

}  // namespace core
}  // namespace h2mimic

#endif  // H2MIMIC_CORE_IO_BUFFER_H_
