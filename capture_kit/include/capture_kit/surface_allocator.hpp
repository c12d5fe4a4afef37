/*
 *    surface_allocator.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_SURFACE_ALLOCATOR_HPP
#define CAPTURE_KIT_SURFACE_ALLOCATOR_HPP

#include <cstdint>
#include <optional>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/options.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/surface.hpp"
#include "include/capture_kit/surface_backend.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

// Producer side: creates linear surfaces in shared memory. Each allocation
// is a memfd, turned into a dma-buf through /dev/udmabuf when possible.
class CAPTURE_KIT_API SurfaceAllocator {
 public:
  explicit SurfaceAllocator(AllocatorOptions options = {},
                            SurfaceBackend *backend = nullptr);
  ~SurfaceAllocator();

  // Absent for unknown fourccs, zero sizes or allocation failures.
  auto Allocate(std::uint32_t width, std::uint32_t height,
                std::uint32_t fourcc,
                ColorRange range = ColorRange::Video) -> std::optional<Surface>;

 private:
  AllocatorOptions options_;
  SharedPtr<SurfaceBackend> backend_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_SURFACE_ALLOCATOR_HPP
