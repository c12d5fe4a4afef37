/*
 *    surface.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_SURFACE_HPP
#define CAPTURE_KIT_SURFACE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

extern "C" {
#include <libavutil/hwcontext_drm.h>
}

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/errors.hpp"
#include "include/capture_kit/frame_ref.hpp"
#include "include/capture_kit/plane.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/surface_backend.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

class SurfaceLockGuard;

namespace impl {

// Where one plane lives inside the descriptor's memory objects.
struct DrmPlaneRef {
  int object_index = 0;
  std::size_t offset = 0;
  std::size_t pitch = 0;
};

struct DrmLayout {
  std::uint32_t fourcc = 0;
  std::uint64_t modifier = 0;
  std::vector<DrmPlaneRef> planes;
};

// Flattens the layers of `desc`. Surfaces exported as one layer per plane
// report the combined format (R8 + GR88 is NV12). Absent when the
// descriptor references objects it does not have.
CAPTURE_KIT_API auto ParseDrmDescriptor(const AVDRMFrameDescriptor *desc)
    -> std::optional<DrmLayout>;

}  // namespace impl

// Hardware surface: a DRM PRIME frame whose memory lives in dma-buf objects.
class CAPTURE_KIT_API Surface {
 public:
  using RawFrameType = impl::FrameRef::RawFrameType;

  Surface(const Surface &other) = delete;
  Surface(Surface &&other) noexcept = default;
  auto operator=(const Surface &other) = delete;
  auto operator=(Surface &&other) noexcept -> Surface & = default;
  ~Surface();

  // `raw_frame` must be an AV_PIX_FMT_DRM_PRIME frame with a descriptor.
  // A null backend selects SurfaceBackend::Default().
  static auto Retain(const RawFrameType *raw_frame,
                     SurfaceBackend *backend = nullptr)
      -> std::optional<Surface>;
  // Adopts the caller's reference. A frame that is not a DRM PRIME frame is
  // freed and nothing is returned.
  static auto AttachRawFrame(RawFrameType *raw_frame,
                             SurfaceBackend *backend = nullptr)
      -> std::optional<Surface>;

  auto Clone() const -> Surface;

  auto RawFramePtr() const noexcept -> RawFrameType *;
  auto Descriptor() const noexcept -> const AVDRMFrameDescriptor *;
  auto Backend() const noexcept -> SurfaceBackend *;
  auto ReferenceCount() const noexcept -> int;
  auto IsValid() const noexcept -> bool;

  // Inode of the first memory object, stable across processes.
  auto Id() const noexcept -> std::uint64_t;
  auto Width() const noexcept -> std::uint32_t;
  auto Height() const noexcept -> std::uint32_t;
  // DRM fourcc of the whole image.
  auto PixelFormat() const noexcept -> std::uint32_t;
  auto Modifier() const noexcept -> std::uint64_t;
  auto Range() const noexcept -> ColorRange;
  auto IsFullRange() const noexcept -> bool;
  auto BytesPerRow() const noexcept -> std::size_t;
  auto BytesPerElement() const noexcept -> std::size_t;
  auto AllocSize() const noexcept -> std::size_t;
  // 0 for single-plane formats.
  auto PlaneCount() const noexcept -> std::size_t;
  auto Plane(std::size_t index) const -> std::optional<PlaneDescriptor>;
  auto IsBiplanar() const noexcept -> bool;

  // Object fd and byte offset of a plane; plane 0 is the whole image for
  // single-plane formats.
  auto PlaneObjectFd(std::size_t index) const noexcept -> int;
  auto PlaneOffset(std::size_t index) const noexcept -> std::size_t;
  auto PlanePitch(std::size_t index) const noexcept -> std::size_t;

  auto Lock(LockMode mode, SurfaceLockGuard &guard) const -> LockErrors;

 private:
  Surface(impl::FrameRef frame_ref, SharedPtr<SurfaceBackend> backend,
          impl::DrmLayout layout);

  static auto FromFrameRef(impl::FrameRef frame_ref, SurfaceBackend *backend)
      -> std::optional<Surface>;

  impl::FrameRef frame_ref_;
  SharedPtr<SurfaceBackend> backend_;
  impl::DrmLayout layout_;
  std::uint64_t id_ = 0;
  std::vector<PlaneDescriptor> planes_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_SURFACE_HPP
