/*
 *    buffer_cursor.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_BUFFER_CURSOR_HPP
#define CAPTURE_KIT_BUFFER_CURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

// Read position inside a locked region. Valid only while the guard that
// produced it is held.
class CAPTURE_KIT_API BufferCursor {
 public:
  BufferCursor() noexcept = default;
  explicit BufferCursor(std::span<const byte_t> region) noexcept;

  // Bytes copied into `buf`, 0 at the end of the region.
  auto Read(std::uint8_t *buf, std::size_t buf_size) noexcept -> int;
  // `whence` is SEEK_SET, SEEK_CUR or SEEK_END. Returns the new position,
  // -1 when it would fall outside the region.
  auto Seek(std::int64_t offset, int whence) noexcept -> std::int64_t;
  auto ReadAt(std::size_t position) const noexcept -> std::optional<byte_t>;
  auto ReadU32LE() noexcept -> std::optional<std::uint32_t>;

  auto Position() const noexcept -> std::size_t { return position_; }
  auto Size() const noexcept -> std::size_t { return region_.size(); }
  auto Remaining() const noexcept -> std::size_t {
    return region_.size() - position_;
  }

 private:
  std::span<const byte_t> region_;
  std::size_t position_ = 0;
};

}  // namespace ck

#endif  // CAPTURE_KIT_BUFFER_CURSOR_HPP
