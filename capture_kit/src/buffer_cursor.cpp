/*
 *    buffer_cursor.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <limits>

#include "include/capture_kit/buffer_cursor.hpp"

using namespace ck;

BufferCursor::BufferCursor(std::span<const byte_t> region) noexcept
    : region_(region) {}

auto BufferCursor::Read(std::uint8_t *buf, std::size_t buf_size) noexcept
    -> int {
  auto count = std::min({buf_size, Remaining(),
                         static_cast<std::size_t>(std::numeric_limits<int>::max())});
  if (count == 0) {
    return 0;
  }
  std::memcpy(buf, region_.data() + position_, count);
  position_ += count;
  return static_cast<int>(count);
}

auto BufferCursor::Seek(std::int64_t offset, int whence) noexcept
    -> std::int64_t {
  std::int64_t base = 0;
  switch (whence) {
    case SEEK_SET:
      base = 0;
      break;
    case SEEK_CUR:
      base = static_cast<std::int64_t>(position_);
      break;
    case SEEK_END:
      base = static_cast<std::int64_t>(region_.size());
      break;
    default:
      return -1;
  }
  auto target = base + offset;
  if (target < 0 || target > static_cast<std::int64_t>(region_.size())) {
    return -1;
  }
  position_ = static_cast<std::size_t>(target);
  return target;
}

auto BufferCursor::ReadAt(std::size_t position) const noexcept
    -> std::optional<byte_t> {
  if (position >= region_.size()) {
    return std::nullopt;
  }
  return region_[position];
}

auto BufferCursor::ReadU32LE() noexcept -> std::optional<std::uint32_t> {
  if (Remaining() < 4) {
    return std::nullopt;
  }
  auto p = region_.data() + position_;
  position_ += 4;
  return static_cast<std::uint32_t>(p[0]) |
         (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) |
         (static_cast<std::uint32_t>(p[3]) << 24);
}
