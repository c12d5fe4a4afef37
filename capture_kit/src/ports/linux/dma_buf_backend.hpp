/*
 *    dma_buf_backend.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_DMA_BUF_BACKEND_HPP
#define CAPTURE_KIT_DMA_BUF_BACKEND_HPP

#include "include/capture_kit/surface_backend.hpp"

namespace ck::ports::linux_dmabuf {

// mmap() plus DMA_BUF_IOCTL_SYNC. Objects that are plain shared memory
// (memfd) reject the ioctl with ENOTTY and need no cache maintenance.
class DmaBufBackend : public SurfaceBackend {
 public:
  auto Map(int fd, std::size_t size, LockMode mode) noexcept
      -> void * override;
  auto Unmap(void *address, std::size_t size) noexcept -> void override;
  auto BeginAccess(int fd, LockMode mode) noexcept -> int override;
  auto EndAccess(int fd, LockMode mode) noexcept -> int override;

  // Lives for the whole process.
  auto AddRef() -> std::int64_t override { return 1; }
  auto Release() -> void override {}
};

}  // namespace ck::ports::linux_dmabuf

#endif  // CAPTURE_KIT_DMA_BUF_BACKEND_HPP
