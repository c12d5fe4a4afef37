/*
 *    pixel_buffer_pool.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_PIXEL_BUFFER_POOL_HPP
#define CAPTURE_KIT_PIXEL_BUFFER_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

extern "C" {
#include <libavutil/pixfmt.h>
}

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/pixel_buffer.hpp"
#include "include/capture_kit/ref_counted.hpp"
#include "include/capture_kit/shared_ptr.hpp"

namespace ck {

struct PixelBufferPoolOptions {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  AVPixelFormat format = AV_PIX_FMT_NONE;
  // 0 for no limit.
  std::size_t max_buffers = 0;
};

// Recycles same-sized CPU pixel buffers. A buffer goes back to the pool
// when its last reference is released.
class CAPTURE_KIT_API PixelBufferPool : public RefCounted {
 public:
  virtual ~PixelBufferPool() noexcept {}

  // Absent when max_buffers are in use or memory runs out.
  virtual auto CreatePixelBuffer() -> std::optional<PixelBuffer> = 0;
  // Frees idle buffers. Buffers in use stay valid and are freed on their
  // last release instead of being recycled.
  virtual auto Flush() -> void = 0;

  virtual auto Options() const noexcept -> const PixelBufferPoolOptions & = 0;
  // Size of one pooled allocation.
  virtual auto BufferSize() const noexcept -> std::size_t = 0;
  // Allocations alive right now, idle or handed out.
  virtual auto AllocatedCount() const noexcept -> std::size_t = 0;
};

// Empty for hardware formats and zero dimensions.
CAPTURE_KIT_API auto CreatePixelBufferPool(const PixelBufferPoolOptions &options)
    -> SharedPtr<PixelBufferPool>;

}  // namespace ck

#endif  // CAPTURE_KIT_PIXEL_BUFFER_POOL_HPP
