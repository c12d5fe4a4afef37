/*
 *    surface_backend.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_SURFACE_BACKEND_HPP
#define CAPTURE_KIT_SURFACE_BACKEND_HPP

#include <cstddef>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/ref_counted.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

// CPU access to the memory objects behind a Surface. Every successful
// BeginAccess is followed by exactly one EndAccess with the same mode.
class CAPTURE_KIT_API SurfaceBackend : public RefCounted {
 public:
  virtual ~SurfaceBackend() noexcept {}

  // nullptr on failure.
  virtual auto Map(int fd, std::size_t size, LockMode mode) noexcept
      -> void * = 0;
  virtual auto Unmap(void *address, std::size_t size) noexcept -> void = 0;
  // 0 on success, a negative errno value otherwise.
  virtual auto BeginAccess(int fd, LockMode mode) noexcept -> int = 0;
  virtual auto EndAccess(int fd, LockMode mode) noexcept -> int = 0;

  // Process-wide dma-buf backend.
  static auto Default() -> SurfaceBackend *;
};

}  // namespace ck

#endif  // CAPTURE_KIT_SURFACE_BACKEND_HPP
