/*
 *    texture_test.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <utility>

#include <drm_fourcc.h>

#include "include/capture_kit/surface_allocator.hpp"
#include "include/capture_kit/texture.hpp"
#include "tests/test_harness.hpp"
#include "tests/test_support.hpp"

using namespace ck;
using ck::test::CountingBackend;
using ck::test::RecordingAllocator;

namespace {

auto AllocateSurface(CountingBackend &backend, std::uint32_t width,
                     std::uint32_t height, std::uint32_t fourcc)
    -> std::optional<Surface> {
  AllocatorOptions options;
  options.use_udmabuf = false;
  SurfaceAllocator allocator(options, &backend);
  return allocator.Allocate(width, height, fourcc);
}

}  // namespace

TEST(bind_biplanar_1080p) {
  CountingBackend backend;
  RecordingAllocator textures;
  auto surface = AllocateSurface(backend, 1920, 1080, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());

  TextureBinder binder(&textures);
  auto set = binder.Bind(*surface);
  ASSERT(set.has_value());
  ASSERT(set->IsBiplanar());
  ASSERT_EQ(set->Width(), 1920u);
  ASSERT_EQ(set->Height(), 1080u);
  ASSERT_EQ(set->PixelFormat(), static_cast<std::uint32_t>(DRM_FORMAT_NV12));

  const auto &luma = set->Primary();
  ASSERT(luma.format == TextureFormat::R8Unorm);
  ASSERT_EQ(luma.width, 1920u);
  ASSERT_EQ(luma.height, 1080u);

  const auto &chroma = *set->Secondary();
  ASSERT(chroma.format == TextureFormat::RG8Unorm);
  ASSERT_EQ(chroma.width, 960u);
  ASSERT_EQ(chroma.height, 540u);

  ASSERT_EQ(textures.imports.size(), 2u);
  ASSERT_EQ(textures.imports[0].drm_format,
            static_cast<std::uint32_t>(DRM_FORMAT_R8));
  ASSERT_EQ(textures.imports[1].drm_format,
            static_cast<std::uint32_t>(DRM_FORMAT_GR88));
  ASSERT_EQ(textures.imports[1].offset, surface->PlaneOffset(1));
  ASSERT_EQ(textures.imports[1].pitch, surface->PlanePitch(1));
  ASSERT_EQ(textures.imports[0].fd, surface->PlaneObjectFd(0));
}

TEST(texture_set_keeps_surface) {
  CountingBackend backend;
  RecordingAllocator textures;
  auto surface = AllocateSurface(backend, 64, 64, DRM_FORMAT_XRGB8888);
  ASSERT(surface.has_value());
  TextureBinder binder(&textures);
  {
    auto set = binder.Bind(*surface);
    ASSERT(set.has_value());
    ASSERT(!set->IsBiplanar());
    ASSERT(set->Primary().format == TextureFormat::BGRA8Unorm);
    ASSERT_EQ(surface->ReferenceCount(), 2);
    ASSERT_EQ(textures.live, 1);

    auto moved = std::move(*set);
    ASSERT_EQ(surface->ReferenceCount(), 2);
    ASSERT_EQ(textures.live, 1);
  }
  ASSERT_EQ(surface->ReferenceCount(), 1);
  ASSERT_EQ(textures.live, 0);
}

TEST(bind_ten_bit) {
  CountingBackend backend;
  RecordingAllocator textures;
  auto surface = AllocateSurface(backend, 32, 32, DRM_FORMAT_XRGB2101010);
  ASSERT(surface.has_value());
  TextureBinder binder(&textures);
  auto set = binder.Bind(*surface);
  ASSERT(set.has_value());
  ASSERT(set->Primary().format == TextureFormat::RGB10A2Unorm);
}

TEST(bind_unknown_format_falls_back) {
  CountingBackend backend;
  RecordingAllocator textures;
  auto surface = AllocateSurface(backend, 32, 16, DRM_FORMAT_YUYV);
  ASSERT(surface.has_value());
  TextureBinder binder(&textures);
  auto first = binder.Bind(*surface);
  auto second = binder.Bind(*surface);
  ASSERT(first.has_value());
  ASSERT(second.has_value());
  ASSERT(first->Primary().format == TextureFormat::BGRA8Unorm);
  ASSERT(first->Primary().format == second->Primary().format);
  ASSERT_EQ(textures.imports[0].drm_format,
            static_cast<std::uint32_t>(DRM_FORMAT_ARGB8888));
  ASSERT_EQ(textures.imports[0].drm_format, textures.imports[1].drm_format);
}

TEST(bind_three_plane_falls_back) {
  CountingBackend backend;
  RecordingAllocator textures;
  auto surface = AllocateSurface(backend, 64, 48, DRM_FORMAT_YUV420);
  ASSERT(surface.has_value());
  ASSERT_EQ(surface->PlaneCount(), 3u);
  TextureBinder binder(&textures);
  auto set = binder.Bind(*surface);
  ASSERT(set.has_value());
  ASSERT(set->Primary().format == TextureFormat::BGRA8Unorm);
  ASSERT(!set->Secondary().has_value());
  ASSERT_EQ(textures.imports.size(), 1u);
  ASSERT_EQ(textures.imports[0].drm_format,
            static_cast<std::uint32_t>(DRM_FORMAT_ARGB8888));
  ASSERT_EQ(textures.imports[0].width, 64u);
  ASSERT_EQ(textures.imports[0].height, 48u);
}

TEST(failed_secondary_releases_primary) {
  CountingBackend backend;
  RecordingAllocator textures;
  textures.fail_at = 1;
  auto surface = AllocateSurface(backend, 64, 32, DRM_FORMAT_NV12);
  ASSERT(surface.has_value());
  TextureBinder binder(&textures);
  ASSERT(!binder.Bind(*surface).has_value());
  ASSERT_EQ(textures.live, 0);
  ASSERT_EQ(surface->ReferenceCount(), 1);
}

TEST(bind_without_allocator) {
  CountingBackend backend;
  auto surface = AllocateSurface(backend, 16, 16, DRM_FORMAT_ARGB8888);
  ASSERT(surface.has_value());
  TextureBinder binder(nullptr);
  ASSERT(!binder.Bind(*surface).has_value());
}

int main() {
  ck::test::Quiet();

  RUN_TEST(bind_biplanar_1080p);
  RUN_TEST(texture_set_keeps_surface);
  RUN_TEST(bind_ten_bit);
  RUN_TEST(bind_unknown_format_falls_back);
  RUN_TEST(bind_three_plane_falls_back);
  RUN_TEST(failed_secondary_releases_primary);
  RUN_TEST(bind_without_allocator);

  return ck::test::Summary();
}
