/*
 *    pixel_buffer.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_PIXEL_BUFFER_HPP
#define CAPTURE_KIT_PIXEL_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

extern "C" {
#include <libavutil/pixfmt.h>
}

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/errors.hpp"
#include "include/capture_kit/frame_ref.hpp"
#include "include/capture_kit/plane.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

class PixelBufferLockGuard;
class Surface;

// The image of a video sample. Software frames, hardware frames and DRM
// PRIME frames are all accepted.
class CAPTURE_KIT_API PixelBuffer {
 public:
  using RawFrameType = impl::FrameRef::RawFrameType;

  PixelBuffer(const PixelBuffer &other) = delete;
  PixelBuffer(PixelBuffer &&other) noexcept = default;
  auto operator=(const PixelBuffer &other) = delete;
  auto operator=(PixelBuffer &&other) noexcept -> PixelBuffer & = default;
  ~PixelBuffer();

  // Fresh CPU-backed image with FFmpeg's default alignment. Hardware
  // formats are rejected.
  static auto Create(std::uint32_t width, std::uint32_t height,
                     AVPixelFormat format) -> std::optional<PixelBuffer>;
  // Takes a new reference on the surface's frame.
  static auto FromSurface(const Surface &surface) -> std::optional<PixelBuffer>;
  static auto Retain(const RawFrameType *raw_frame) -> std::optional<PixelBuffer>;
  // Audio frames are freed and nothing is returned.
  static auto AttachRawFrame(RawFrameType *raw_frame) -> std::optional<PixelBuffer>;

  auto Clone() const -> PixelBuffer;

  auto RawFramePtr() const noexcept -> RawFrameType *;
  auto Identity() const noexcept -> const void *;
  auto ReferenceCount() const noexcept -> int;
  auto IsValid() const noexcept -> bool;

  auto Width() const noexcept -> std::uint32_t;
  auto Height() const noexcept -> std::uint32_t;
  auto PixelFormat() const noexcept -> AVPixelFormat;
  // Layout of the pixels: the frames context's software format for
  // hardware frames, PixelFormat() otherwise.
  auto SoftwareFormat() const noexcept -> AVPixelFormat;
  auto IsHardware() const noexcept -> bool;
  auto IsDrmPrime() const noexcept -> bool;
  auto BytesPerRow() const noexcept -> std::size_t;
  // 0 for single-plane formats.
  auto PlaneCount() const noexcept -> std::size_t;
  auto IsPlanar() const noexcept -> bool;
  auto Plane(std::size_t index) const -> std::optional<PlaneDescriptor>;
  // Bytes of backing memory, padding included.
  auto DataSize() const noexcept -> std::size_t;

  // New handle on the backing hardware surface. Absent for software frames
  // and for hardware frames that cannot be exported as DRM PRIME.
  auto IoSurface() const -> std::optional<Surface>;
  auto IsBackedBySurface() const -> bool;

  auto Lock(LockMode mode, PixelBufferLockGuard &guard) const -> LockErrors;

 private:
  explicit PixelBuffer(impl::FrameRef frame_ref) noexcept;

  impl::FrameRef frame_ref_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_PIXEL_BUFFER_HPP
