/*
 *    surface_test.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include <drm_fourcc.h>

#include "include/capture_kit/buffer_cursor.hpp"
#include "include/capture_kit/dispatcher.hpp"
#include "include/capture_kit/handler_registry.hpp"
#include "include/capture_kit/lock_guard.hpp"
#include "include/capture_kit/pixel_buffer.hpp"
#include "include/capture_kit/sample_buffer.hpp"
#include "include/capture_kit/stream_output.hpp"
#include "include/capture_kit/surface.hpp"
#include "include/capture_kit/surface_allocator.hpp"
#include "tests/test_harness.hpp"
#include "tests/test_support.hpp"

using namespace ck;
using ck::test::CountingBackend;
using ck::test::MakeVideoFrame;

namespace {

auto MemfdOptions() -> AllocatorOptions {
  AllocatorOptions options;
  options.use_udmabuf = false;
  return options;
}

// First luma byte, or -1 when the row is blank.
auto FirstLumaByte(const Surface &surface) -> int {
  SurfaceLockGuard guard;
  if (surface.Lock(LockMode::ReadOnly, guard) != LockErrors::Ok) {
    return -2;
  }
  auto luma = guard.Plane(0);
  if (!luma || (*luma)[0] == 0) {
    return -1;
  }
  return (*luma)[0];
}

}  // namespace

TEST(allocate_biplanar) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(1920, 1080, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());
  ASSERT(surface->IsValid());
  ASSERT_EQ(surface->Width(), 1920u);
  ASSERT_EQ(surface->Height(), 1080u);
  ASSERT_EQ(surface->PixelFormat(), static_cast<std::uint32_t>(DRM_FORMAT_NV12));
  ASSERT_EQ(surface->PlaneCount(), 2u);
  ASSERT(surface->IsBiplanar());
  ASSERT_EQ(surface->BytesPerRow(), 1920u);

  auto luma = surface->Plane(0);
  auto chroma = surface->Plane(1);
  ASSERT(luma.has_value());
  ASSERT(chroma.has_value());
  ASSERT_EQ(luma->width, 1920u);
  ASSERT_EQ(luma->height, 1080u);
  ASSERT_EQ(chroma->width, 960u);
  ASSERT_EQ(chroma->height, 540u);
  ASSERT_EQ(chroma->bytes_per_element, 2u);
  ASSERT(!surface->Plane(2).has_value());

  ASSERT(surface->PlaneObjectFd(0) >= 0);
  ASSERT_EQ(surface->PlaneObjectFd(0), surface->PlaneObjectFd(1));
  ASSERT_EQ(surface->PlaneOffset(1), 1920u * 1080u);
  ASSERT(surface->AllocSize() >= 1920u * 1080u * 3 / 2);
  ASSERT(surface->Range() == ColorRange::Video);
  ASSERT(surface->Id() != 0);
}

TEST(allocate_packed) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(100, 10, DRM_FORMAT_ARGB8888,
                                    ColorRange::Full);
  ASSERT(surface.has_value());
  ASSERT_EQ(surface->PlaneCount(), 0u);
  ASSERT(!surface->IsBiplanar());
  ASSERT(!surface->Plane(0).has_value());
  ASSERT_EQ(surface->BytesPerElement(), 4u);
  ASSERT_EQ(surface->BytesPerRow(), 448u);
  ASSERT(surface->IsFullRange());
}

TEST(allocate_rejects_bad_requests) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  ASSERT(!allocator.Allocate(0, 10, DRM_FORMAT_NV12).has_value());
  ASSERT(!allocator.Allocate(10, 0, DRM_FORMAT_NV12).has_value());
  ASSERT(!allocator.Allocate(16, 16, fourcc_code('Z', 'Z', 'Z', 'Z'))
              .has_value());
}

TEST(surface_clone_counts) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(64, 64, DRM_FORMAT_XRGB8888);
  ASSERT(surface.has_value());
  ASSERT_EQ(surface->ReferenceCount(), 1);
  {
    auto clone = surface->Clone();
    ASSERT_EQ(surface->ReferenceCount(), 2);
    ASSERT_EQ(clone.Id(), surface->Id());
    ASSERT(clone.Backend() == &backend);
  }
  ASSERT_EQ(surface->ReferenceCount(), 1);

  auto retained = Surface::Retain(surface->RawFramePtr(), &backend);
  ASSERT(retained.has_value());
  ASSERT_EQ(surface->ReferenceCount(), 2);
}

TEST(clone_of_moved_from_surface_is_empty) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(32, 32, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());
  auto moved = std::move(*surface);
  ASSERT(moved.IsValid());

  auto clone = surface->Clone();
  ASSERT(!clone.IsValid());
  ASSERT_EQ(clone.Id(), 0u);
  ASSERT_EQ(clone.PlaneCount(), 0u);
  ASSERT_EQ(clone.Width(), 0u);
  ASSERT_EQ(moved.ReferenceCount(), 1);
}

TEST(retain_rejects_software_frame) {
  auto frame = MakeVideoFrame(16, 16, AV_PIX_FMT_BGRA);
  ASSERT(frame);
  ASSERT(!Surface::Retain(frame.get()).has_value());
}

TEST(read_lock_pairs_access) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(64, 32, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());

  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadOnly, guard) == LockErrors::Ok);
  ASSERT(guard.IsLocked());
  ASSERT(guard.Mode() == LockMode::ReadOnly);
  ASSERT(guard.Source() == &*surface);
  ASSERT_EQ(backend.begin_read, 1);
  ASSERT_EQ(backend.end_read, 0);

  ASSERT(!guard.AsMutSlice().has_value());
  ASSERT(!guard.PlaneMut(0).has_value());
  ASSERT(!guard.RowMut(0).has_value());
  ASSERT(!guard.AsSlice().empty());

  ASSERT(guard.Unlock() == LockErrors::Ok);
  ASSERT_EQ(backend.end_read, 1);
  ASSERT(guard.Unlock() == LockErrors::NotLocked);
  ASSERT_EQ(backend.end_read, 1);
  ASSERT(backend.Balanced());
  ASSERT_EQ(backend.begin_write, 0);
}

TEST(guard_destructor_unlocks) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(32, 32, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());
  for (int i = 0; i < 10; ++i) {
    SurfaceLockGuard guard;
    auto mode = i % 2 == 0 ? LockMode::ReadOnly : LockMode::ReadWrite;
    ASSERT(surface->Lock(mode, guard) == LockErrors::Ok);
  }
  ASSERT_EQ(backend.begin_read, 5);
  ASSERT_EQ(backend.begin_write, 5);
  ASSERT(backend.Balanced());
}

TEST(throwing_output_unlocks) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(32, 32, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());

  HandlerRegistry registry;
  Dispatcher dispatcher(registry, "lock");
  auto mode = LockMode::ReadOnly;
  auto locked = 0;
  registry.Register(OutputType::Screen,
                    MakeOutput([&](SampleBuffer sample, OutputType) {
                      auto view = Surface::Retain(sample.RawFramePtr(), &backend);
                      if (!view) {
                        return;
                      }
                      SurfaceLockGuard guard;
                      if (view->Lock(mode, guard) == LockErrors::Ok) {
                        ++locked;
                      }
                      throw std::runtime_error("consumer failed");
                    }));

  for (auto m : {LockMode::ReadOnly, LockMode::ReadWrite, LockMode::ReadOnly}) {
    mode = m;
    auto threw = false;
    try {
      dispatcher.Dispatch(*SampleBuffer::Retain(surface->RawFramePtr()),
                          OutputType::Screen);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    ASSERT(threw);
  }
  ASSERT_EQ(locked, 3);
  ASSERT_EQ(backend.begin_read, 2);
  ASSERT_EQ(backend.end_read, 2);
  ASSERT_EQ(backend.begin_write, 1);
  ASSERT_EQ(backend.end_write, 1);
  ASSERT_EQ(backend.maps, backend.unmaps);
  ASSERT(backend.Balanced());
  ASSERT_EQ(surface->ReferenceCount(), 1);

  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
}

TEST(early_return_unlocks) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(16, 16, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());

  ASSERT_EQ(FirstLumaByte(*surface), -1);
  {
    SurfaceLockGuard guard;
    ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
    (*guard.PlaneMut(0))[0] = 0x42;
  }
  for (int i = 0; i < 4; ++i) {
    ASSERT_EQ(FirstLumaByte(*surface), 0x42);
  }
  ASSERT_EQ(backend.begin_read, 5);
  ASSERT_EQ(backend.end_read, 5);
  ASSERT_EQ(backend.begin_write, 1);
  ASSERT_EQ(backend.end_write, 1);
  ASSERT(backend.Balanced());
}

TEST(moved_guard_unlocks_once) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(32, 32, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());
  {
    SurfaceLockGuard outer;
    {
      SurfaceLockGuard inner;
      ASSERT(surface->Lock(LockMode::ReadOnly, inner) == LockErrors::Ok);
      outer = std::move(inner);
      ASSERT(!inner.IsLocked());
    }
    ASSERT(outer.IsLocked());
    ASSERT_EQ(backend.end_read, 0);
  }
  ASSERT_EQ(backend.end_read, 1);
  ASSERT(backend.Balanced());
}

TEST(lock_twice_is_rejected) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(32, 32, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());
  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadOnly, guard) == LockErrors::Ok);
  ASSERT(surface->Lock(LockMode::ReadWrite, guard) ==
         LockErrors::AlreadyLocked);
  ASSERT_EQ(backend.begin_read, 1);
  ASSERT_EQ(backend.begin_write, 0);
}

TEST(failed_begin_rolls_back) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(32, 32, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());

  backend.fail_begin = -EBUSY;
  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Busy);
  ASSERT(!guard.IsLocked());
  ASSERT(backend.Balanced());

  backend.fail_begin = -EIO;
  ASSERT(surface->Lock(LockMode::ReadOnly, guard) == LockErrors::SyncFailed);
  ASSERT(backend.Balanced());
}

TEST(write_then_read_back) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(64, 48, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());
  {
    SurfaceLockGuard guard;
    ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
    auto luma = guard.PlaneMut(0);
    auto chroma = guard.PlaneMut(1);
    ASSERT(luma.has_value());
    ASSERT(chroma.has_value());
    ASSERT(!guard.PlaneMut(2).has_value());
    (*luma)[0] = 0x10;
    (*chroma)[0] = 0x80;
    (*chroma)[1] = 0x7f;
  }
  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadOnly, guard) == LockErrors::Ok);
  ASSERT_EQ(guard.PlaneCount(), 2u);
  auto chroma_row = guard.PlaneRow(1, 0);
  ASSERT(chroma_row.has_value());
  ASSERT_EQ((*chroma_row)[0], 0x80);
  ASSERT_EQ((*chroma_row)[1], 0x7f);
  ASSERT(!guard.PlaneRow(1, 24).has_value());
  ASSERT_EQ((*guard.Plane(0))[0], 0x10);
  ASSERT_EQ(guard.Plane(1)->size(), surface->Plane(1)->size);
}

TEST(packed_rows_and_pixels) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(100, 10, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());
  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
  ASSERT_EQ(guard.PlaneCount(), 0u);
  ASSERT(!guard.Plane(0).has_value());
  ASSERT_EQ(guard.Width(), 100u);
  ASSERT_EQ(guard.Height(), 10u);
  ASSERT_EQ(guard.BytesPerRow(), surface->BytesPerRow());

  auto row = guard.RowMut(3);
  ASSERT(row.has_value());
  ASSERT_EQ(row->size(), surface->BytesPerRow());
  (*row)[4 * 7 + 2] = 0xab;
  ASSERT(!guard.Row(10).has_value());

  auto pixel = guard.PixelAt(7, 3);
  ASSERT(pixel.has_value());
  ASSERT_EQ(pixel->size(), 4u);
  ASSERT_EQ((*pixel)[2], 0xab);
  ASSERT(!guard.PixelAt(100, 0).has_value());
}

TEST(cursor_over_locked_region) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(16, 16, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());
  SurfaceLockGuard guard;
  ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
  auto bytes = *guard.AsMutSlice();
  bytes[0] = 0x78;
  bytes[1] = 0x56;
  bytes[2] = 0x34;
  bytes[3] = 0x12;

  auto cursor = guard.Cursor();
  ASSERT_EQ(cursor.Size(), bytes.size());
  ASSERT_EQ(*cursor.ReadU32LE(), 0x12345678u);
  ASSERT_EQ(cursor.Position(), 4u);
  ASSERT_EQ(cursor.Seek(0, SEEK_END), static_cast<std::int64_t>(bytes.size()));
  std::uint8_t buf[8];
  ASSERT_EQ(cursor.Read(buf, sizeof(buf)), 0);
  ASSERT_EQ(cursor.Seek(1, SEEK_CUR), -1);
  ASSERT_EQ(cursor.Seek(1, SEEK_SET), 1);
  ASSERT_EQ(*cursor.ReadAt(2), 0x34);
  ASSERT(!cursor.ReadAt(bytes.size()).has_value());
}

TEST(pixel_buffer_software_lock) {
  auto frame = MakeVideoFrame(64, 48, AV_PIX_FMT_NV12);
  ASSERT(frame);
  auto owned = PixelBuffer::AttachRawFrame(frame.release());
  ASSERT(owned.has_value());
  {
    PixelBufferLockGuard guard;
    ASSERT(owned->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
    ASSERT_EQ(guard.PlaneCount(), 2u);
    ASSERT(guard.PlaneMut(1).has_value());
    ASSERT(guard.Source() == &*owned);
  }

  auto shared = owned->Clone();
  PixelBufferLockGuard guard;
  ASSERT(shared.Lock(LockMode::ReadWrite, guard) == LockErrors::Busy);
  ASSERT(!guard.IsLocked());
  ASSERT(shared.Lock(LockMode::ReadOnly, guard) == LockErrors::Ok);
  ASSERT(!guard.AsMutSlice().has_value());
  ASSERT(guard.Unlock() == LockErrors::Ok);
  ASSERT(guard.Unlock() == LockErrors::NotLocked);
}

TEST(pixel_buffer_over_surface) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(64, 48, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());
  {
    SurfaceLockGuard guard;
    ASSERT(surface->Lock(LockMode::ReadWrite, guard) == LockErrors::Ok);
    (*guard.PlaneMut(1))[0] = 0x42;
  }

  auto image = PixelBuffer::Retain(surface->RawFramePtr());
  ASSERT(image.has_value());
  ASSERT(image->IsDrmPrime());
  ASSERT_EQ(image->PlaneCount(), 2u);
  ASSERT_EQ(image->Plane(1)->width, 32u);
  auto io_surface = image->IoSurface();
  ASSERT(io_surface.has_value());
  ASSERT_EQ(io_surface->Id(), surface->Id());

  PixelBufferLockGuard guard;
  ASSERT(image->Lock(LockMode::ReadOnly, guard) == LockErrors::Ok);
  ASSERT_EQ((*guard.Plane(1))[0], 0x42);
  ASSERT(guard.Unlock() == LockErrors::Ok);
}

TEST(pixel_buffer_from_surface) {
  CountingBackend backend;
  SurfaceAllocator allocator(MemfdOptions(), &backend);
  auto surface = allocator.Allocate(64, 48, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());
  ASSERT_EQ(surface->ReferenceCount(), 1);
  {
    auto image = PixelBuffer::FromSurface(*surface);
    ASSERT(image.has_value());
    ASSERT_EQ(surface->ReferenceCount(), 2);
    ASSERT_EQ(image->Identity(),
              static_cast<const void *>(surface->RawFramePtr()->buf[0]->data));
    ASSERT(image->IsBackedBySurface());
    ASSERT_EQ(image->DataSize(), surface->AllocSize());
    ASSERT_EQ(image->Width(), surface->Width());
  }
  ASSERT_EQ(surface->ReferenceCount(), 1);

  auto moved = std::move(*surface);
  ASSERT(!PixelBuffer::FromSurface(*surface).has_value());

  auto software = PixelBuffer::Create(16, 16, AV_PIX_FMT_BGRA);
  ASSERT(software.has_value());
  ASSERT(!software->IsBackedBySurface());
}

int main() {
  ck::test::Quiet();

  RUN_TEST(allocate_biplanar);
  RUN_TEST(allocate_packed);
  RUN_TEST(allocate_rejects_bad_requests);
  RUN_TEST(surface_clone_counts);
  RUN_TEST(clone_of_moved_from_surface_is_empty);
  RUN_TEST(retain_rejects_software_frame);
  RUN_TEST(read_lock_pairs_access);
  RUN_TEST(guard_destructor_unlocks);
  RUN_TEST(throwing_output_unlocks);
  RUN_TEST(early_return_unlocks);
  RUN_TEST(moved_guard_unlocks_once);
  RUN_TEST(lock_twice_is_rejected);
  RUN_TEST(failed_begin_rolls_back);
  RUN_TEST(write_then_read_back);
  RUN_TEST(packed_rows_and_pixels);
  RUN_TEST(cursor_over_locked_region);
  RUN_TEST(pixel_buffer_software_lock);
  RUN_TEST(pixel_buffer_over_surface);
  RUN_TEST(pixel_buffer_from_surface);

  return ck::test::Summary();
}
