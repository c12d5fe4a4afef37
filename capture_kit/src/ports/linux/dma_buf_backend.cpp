/*
 *    dma_buf_backend.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cerrno>

#include <linux/dma-buf.h>
#include <sys/ioctl.h>
#include <sys/mman.h>

#include "src/log.hpp"
#include "src/ports/linux/dma_buf_backend.hpp"

using namespace ck::ports::linux_dmabuf;

namespace {

auto SyncFlags(ck::LockMode mode) noexcept -> __u64 {
  return mode == ck::LockMode::ReadWrite ? DMA_BUF_SYNC_RW : DMA_BUF_SYNC_READ;
}

auto Sync(int fd, __u64 flags) noexcept -> int {
  struct dma_buf_sync sync = {};
  sync.flags = flags;
  int ret;
  do {
    ret = ioctl(fd, DMA_BUF_IOCTL_SYNC, &sync);
  } while (ret == -1 && errno == EINTR);
  if (ret == 0) {
    return 0;
  }
  if (errno == ENOTTY) {
    return 0;
  }
  return -errno;
}

}  // namespace

auto DmaBufBackend::Map(int fd, std::size_t size, LockMode mode) noexcept
    -> void * {
  auto prot = PROT_READ;
  if (mode == LockMode::ReadWrite) {
    prot |= PROT_WRITE;
  }
  auto address = mmap(nullptr, size, prot, MAP_SHARED, fd, 0);
  if (address == MAP_FAILED) {
    CK_LOG_ERROR(Surface, "mmap(fd %d, %zu bytes) failed: errno %d\n", fd,
                 size, errno);
    return nullptr;
  }
  return address;
}

auto DmaBufBackend::Unmap(void *address, std::size_t size) noexcept -> void {
  if (address != nullptr && munmap(address, size) != 0) {
    CK_LOG_WARNING(Surface, "munmap failed: errno %d\n", errno);
  }
}

auto DmaBufBackend::BeginAccess(int fd, LockMode mode) noexcept -> int {
  return Sync(fd, DMA_BUF_SYNC_START | SyncFlags(mode));
}

auto DmaBufBackend::EndAccess(int fd, LockMode mode) noexcept -> int {
  return Sync(fd, DMA_BUF_SYNC_END | SyncFlags(mode));
}

namespace ck {

auto SurfaceBackend::Default() -> SurfaceBackend * {
  static DmaBufBackend instance;
  return &instance;
}

}  // namespace ck
