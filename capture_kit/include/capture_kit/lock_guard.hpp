/*
 *    lock_guard.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_LOCK_GUARD_HPP
#define CAPTURE_KIT_LOCK_GUARD_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

extern "C" {
#include <libavutil/frame.h>
}

#include "include/capture_kit/buffer_cursor.hpp"
#include "include/capture_kit/config.hpp"
#include "include/capture_kit/errors.hpp"
#include "include/capture_kit/pixel_buffer.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/surface.hpp"
#include "include/capture_kit/surface_backend.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

namespace impl {

struct PlaneView {
  byte_t *data = nullptr;
  std::size_t bytes_per_row = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::size_t bytes_per_element = 0;
  std::size_t size = 0;
};

// Views over memory that stays mapped while the owning guard is held.
// Mutable views exist only for LockMode::ReadWrite.
class CAPTURE_KIT_API LockedRegion {
 public:
  auto IsLocked() const noexcept -> bool { return locked_; }
  auto Mode() const noexcept -> LockMode { return mode_; }
  auto Width() const noexcept -> std::uint32_t;
  auto Height() const noexcept -> std::uint32_t;
  auto BytesPerRow() const noexcept -> std::size_t;
  auto PlaneCount() const noexcept -> std::size_t { return plane_count_; }

  auto AsSlice() const noexcept -> std::span<const byte_t>;
  auto AsMutSlice() const noexcept -> std::optional<std::span<byte_t>>;
  auto Row(std::uint32_t y) const noexcept
      -> std::optional<std::span<const byte_t>>;
  auto RowMut(std::uint32_t y) const noexcept
      -> std::optional<std::span<byte_t>>;
  auto Plane(std::size_t index) const noexcept
      -> std::optional<std::span<const byte_t>>;
  auto PlaneMut(std::size_t index) const noexcept
      -> std::optional<std::span<byte_t>>;
  auto PlaneRow(std::size_t index, std::uint32_t y) const noexcept
      -> std::optional<std::span<const byte_t>>;
  // Bytes of the pixel at (x, y) on the first plane.
  auto PixelAt(std::uint32_t x, std::uint32_t y) const noexcept
      -> std::optional<std::span<const byte_t>>;
  auto Cursor() const noexcept -> BufferCursor;

 protected:
  LockedRegion() noexcept = default;
  LockedRegion(LockedRegion &&other) noexcept;
  auto operator=(LockedRegion &&other) noexcept -> LockedRegion &;
  ~LockedRegion() = default;

  auto Assign(LockMode mode, std::span<byte_t> whole,
              std::vector<PlaneView> planes, std::size_t plane_count) -> void;
  // Copies the views of a region this one wraps.
  auto ShareViews(const LockedRegion &other) -> void;
  auto Clear() noexcept -> void;

 private:
  auto ViewOf(std::size_t index) const noexcept -> const PlaneView *;

  bool locked_ = false;
  LockMode mode_ = LockMode::ReadOnly;
  std::span<byte_t> whole_;
  std::vector<PlaneView> planes_;
  std::size_t plane_count_ = 0;
};

}  // namespace impl

class CAPTURE_KIT_API SurfaceLockGuard : public impl::LockedRegion {
 public:
  SurfaceLockGuard() noexcept = default;
  SurfaceLockGuard(const SurfaceLockGuard &other) = delete;
  SurfaceLockGuard(SurfaceLockGuard &&other) noexcept;
  auto operator=(const SurfaceLockGuard &other) = delete;
  auto operator=(SurfaceLockGuard &&other) noexcept -> SurfaceLockGuard &;
  ~SurfaceLockGuard();

  // Ends CPU access with the mode used to lock. Safe to call twice.
  auto Unlock() noexcept -> LockErrors;
  auto Source() const noexcept -> const Surface * { return surface_; }

 private:
  friend class Surface;

  struct Mapping {
    int fd = -1;
    void *address = nullptr;
    std::size_t size = 0;
    bool access_begun = false;
  };

  const Surface *surface_ = nullptr;
  SharedPtr<SurfaceBackend> backend_;
  std::vector<Mapping> mappings_;
};

class CAPTURE_KIT_API PixelBufferLockGuard : public impl::LockedRegion {
 public:
  PixelBufferLockGuard() noexcept = default;
  PixelBufferLockGuard(const PixelBufferLockGuard &other) = delete;
  PixelBufferLockGuard(PixelBufferLockGuard &&other) noexcept;
  auto operator=(const PixelBufferLockGuard &other) = delete;
  auto operator=(PixelBufferLockGuard &&other) noexcept
      -> PixelBufferLockGuard &;
  ~PixelBufferLockGuard();

  auto Unlock() noexcept -> LockErrors;
  auto Source() const noexcept -> const PixelBuffer * { return pixel_buffer_; }

 private:
  friend class PixelBuffer;

  const PixelBuffer *pixel_buffer_ = nullptr;
  // Result of av_hwframe_map() for hardware frames.
  AVFrame *mapped_frame_ = nullptr;
  // DRM PRIME frames lock through their surface.
  std::unique_ptr<Surface> surface_;
  SurfaceLockGuard surface_guard_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_LOCK_GUARD_HPP
