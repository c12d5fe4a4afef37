/*
 *    surface_allocator.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cerrno>
#include <new>

#include <fcntl.h>
#include <linux/udmabuf.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <drm_fourcc.h>

extern "C" {
#include <libavutil/buffer.h>
#include <libavutil/hwcontext_drm.h>
#include <libavutil/mem.h>
#include <libavutil/pixfmt.h>
}

#include "include/capture_kit/plane.hpp"
#include "include/capture_kit/surface_allocator.hpp"
#include "src/log.hpp"

using namespace ck;

namespace {

auto AlignUp(std::size_t value, std::size_t alignment) -> std::size_t {
  return (value + alignment - 1) / alignment * alignment;
}

auto FreeDescriptor(void* /*opaque*/, std::uint8_t* data) -> void {
  auto desc = reinterpret_cast<AVDRMFrameDescriptor*>(data);
  for (int i = 0; i < desc->nb_objects; ++i) {
    if (desc->objects[i].fd >= 0) {
      close(desc->objects[i].fd);
    }
  }
  av_free(desc);
}

// Wraps a sealed memfd in a dma-buf. Returns -1 when udmabuf is unavailable.
auto ExportUdmabuf(int memfd, std::size_t size) -> int {
  auto dev = open("/dev/udmabuf", O_RDWR | O_CLOEXEC);
  if (dev < 0) {
    return -1;
  }
  struct udmabuf_create create = {};
  create.memfd = static_cast<__u32>(memfd);
  create.flags = UDMABUF_FLAGS_CLOEXEC;
  create.offset = 0;
  create.size = size;
  auto fd = ioctl(dev, UDMABUF_CREATE, &create);
  close(dev);
  return fd;
}

auto CreateSharedMemory(std::size_t size, bool use_udmabuf) -> int {
  auto memfd = memfd_create("ck-surface", MFD_CLOEXEC | MFD_ALLOW_SEALING);
  if (memfd < 0) {
    CK_LOG_ERROR(Allocator, "memfd_create failed: errno %d\n", errno);
    return -1;
  }
  if (ftruncate(memfd, static_cast<off_t>(size)) != 0) {
    CK_LOG_ERROR(Allocator, "ftruncate(%zu) failed: errno %d\n", size, errno);
    close(memfd);
    return -1;
  }
  if (!use_udmabuf) {
    return memfd;
  }
  if (fcntl(memfd, F_ADD_SEALS, F_SEAL_SHRINK) != 0) {
    return memfd;
  }
  auto dmabuf = ExportUdmabuf(memfd, size);
  if (dmabuf < 0) {
    CK_LOG_DEBUG(Allocator, "udmabuf unavailable, using plain memfd\n");
    return memfd;
  }
  close(memfd);
  return dmabuf;
}

}  // namespace

SurfaceAllocator::SurfaceAllocator(AllocatorOptions options,
                                   SurfaceBackend* backend)
    : options_(options),
      backend_(backend != nullptr ? backend : SurfaceBackend::Default(),
               true) {
  if (options_.row_alignment <= 0) {
    options_.row_alignment = 1;
  }
}

SurfaceAllocator::~SurfaceAllocator() {}

auto SurfaceAllocator::Allocate(std::uint32_t width, std::uint32_t height,
                                std::uint32_t fourcc, ColorRange range)
    -> std::optional<Surface> {
  auto layout = FindFourccLayout(fourcc);
  if (layout == nullptr || width == 0 || height == 0) {
    CK_LOG_ERROR(Allocator, "cannot allocate %ux%u surface of format %s\n",
                 width, height, FourccToString(fourcc).c_str());
    return std::nullopt;
  }

  std::size_t pitches[4] = {};
  std::size_t offsets[4] = {};
  std::size_t total = 0;
  for (int i = 0; i < layout->planes; ++i) {
    auto plane_width = PlaneWidth(*layout, i, width);
    auto plane_height = PlaneHeight(*layout, i, height);
    pitches[i] = AlignUp(plane_width * layout->bytes_per_element[i],
                         static_cast<std::size_t>(options_.row_alignment));
    offsets[i] = total;
    total += pitches[i] * plane_height;
  }
  total = AlignUp(total, static_cast<std::size_t>(sysconf(_SC_PAGESIZE)));

  auto fd = CreateSharedMemory(total, options_.use_udmabuf);
  if (fd < 0) {
    return std::nullopt;
  }

  auto desc = reinterpret_cast<AVDRMFrameDescriptor*>(
      av_mallocz(sizeof(AVDRMFrameDescriptor)));
  if (desc == nullptr) {
    close(fd);
    return std::nullopt;
  }
  desc->nb_objects = 1;
  desc->objects[0].fd = fd;
  desc->objects[0].size = total;
  desc->objects[0].format_modifier = DRM_FORMAT_MOD_LINEAR;
  desc->nb_layers = 1;
  desc->layers[0].format = fourcc;
  desc->layers[0].nb_planes = layout->planes;
  for (int i = 0; i < layout->planes; ++i) {
    desc->layers[0].planes[i].object_index = 0;
    desc->layers[0].planes[i].offset = static_cast<ptrdiff_t>(offsets[i]);
    desc->layers[0].planes[i].pitch = static_cast<ptrdiff_t>(pitches[i]);
  }

  auto buf = av_buffer_create(reinterpret_cast<std::uint8_t*>(desc),
                              sizeof(AVDRMFrameDescriptor), &FreeDescriptor,
                              nullptr, 0);
  if (buf == nullptr) {
    FreeDescriptor(nullptr, reinterpret_cast<std::uint8_t*>(desc));
    return std::nullopt;
  }
  auto frame = av_frame_alloc();
  if (frame == nullptr) {
    av_buffer_unref(&buf);
    return std::nullopt;
  }
  frame->format = AV_PIX_FMT_DRM_PRIME;
  frame->width = static_cast<int>(width);
  frame->height = static_cast<int>(height);
  frame->buf[0] = buf;
  frame->data[0] = reinterpret_cast<std::uint8_t*>(desc);
  switch (range) {
    case ColorRange::Full:
      frame->color_range = AVCOL_RANGE_JPEG;
      break;
    case ColorRange::Video:
      frame->color_range = AVCOL_RANGE_MPEG;
      break;
    default:
      frame->color_range = AVCOL_RANGE_UNSPECIFIED;
      break;
  }
  CK_LOG_TRACE(Allocator, "allocated %ux%u %s surface, %zu bytes\n", width,
               height, FourccToString(fourcc).c_str(), total);
  return Surface::AttachRawFrame(frame, backend_.get());
}
