// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/core/io_buffer.h"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <utility>

namespace h2mimic {
namespace core {

namespace {

// Compact once the consumed prefix dominates the buffer
constexpr size_t kCompactThreshold = 4096;

}  // namespace

IoBuffer::IoBuffer() = default;

IoBuffer::IoBuffer(size_t initial_capacity) { data_.reserve(initial_capacity); }

IoBuffer::~IoBuffer() = default;

IoBuffer::IoBuffer(IoBuffer&& other) noexcept
    : data_(std::move(other.data_)),
      read_pos_(other.read_pos_),
      reserved_(other.reserved_) {
  other.data_.clear();
  other.read_pos_ = 0;
  other.reserved_ = 0;
}

IoBuffer& IoBuffer::operator=(IoBuffer&& other) noexcept {
  if (this != &other) {
    data_ = std::move(other.data_);
    read_pos_ = other.read_pos_;
    reserved_ = other.reserved_;
    other.data_.clear();
    other.read_pos_ = 0;
    other.reserved_ = 0;
  }
  return *this;
}

void IoBuffer::Append(const uint8_t* data, size_t len) {
  if (len == 0) {
    return;
  }
  DropReservation();
  data_.insert(data_.end(), data, data + len);
}

void IoBuffer::Append(std::span<const uint8_t> bytes) {
  Append(bytes.data(), bytes.size());
}

void IoBuffer::Append(std::string_view sv) {
  Append(reinterpret_cast<const uint8_t*>(sv.data()), sv.size());
}

void IoBuffer::AppendByte(uint8_t b) {
  DropReservation();
  data_.push_back(b);
}

uint8_t* IoBuffer::Reserve(size_t len) {
  if (len == 0) {
    return nullptr;
  }

  // A new reservation replaces any uncommitted one
  DropReservation();

  size_t start = data_.size();
  data_.resize(start + len);
  reserved_ = len;
  return data_.data() + start;
}

void IoBuffer::Commit(size_t len) {
  if (reserved_ == 0) {
    return;
  }
  size_t actual = std::min(len, reserved_);
  data_.resize(data_.size() - (reserved_ - actual));
  reserved_ = 0;
}

size_t IoBuffer::Read(uint8_t* dest, size_t max_len) {
  size_t to_read = std::min(max_len, Size());
  if (to_read == 0) {
    return 0;
  }

  std::memcpy(dest, data_.data() + read_pos_, to_read);
  Skip(to_read);
  return to_read;
}

const uint8_t* IoBuffer::Peek(size_t* available) const {
  *available = Size();
  if (*available == 0) {
    return nullptr;
  }
  return data_.data() + read_pos_;
}

std::span<const uint8_t> IoBuffer::Readable() const {
  return {data_.data() + read_pos_, Size()};
}

void IoBuffer::Skip(size_t len) {
  read_pos_ += std::min(len, Size());
  if (Size() == 0 && reserved_ == 0) {
    data_.clear();
    read_pos_ = 0;
  } else if (reserved_ == 0 && read_pos_ >= kCompactThreshold &&
             read_pos_ * 2 >= data_.size()) {
    Compact();
  }
}

void IoBuffer::Clear() {
  data_.clear();
  read_pos_ = 0;
  reserved_ = 0;
}

std::vector<uint8_t> IoBuffer::TakeContiguous() {
  DropReservation();
  Compact();
  std::vector<uint8_t> result = std::move(data_);
  Clear();
  return result;
}

void IoBuffer::Compact() {
  if (read_pos_ == 0) {
    return;
  }
  data_.erase(data_.begin(),
              data_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
  read_pos_ = 0;
}

void IoBuffer::DropReservation() {
  if (reserved_ == 0) {
    return;
  }
  data_.resize(data_.size() - reserved_);
  reserved_ = 0;
}

}  // namespace core
}  // namespace h2mimic
