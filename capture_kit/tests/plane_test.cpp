/*
 *    plane_test.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <drm_fourcc.h>

#include "include/capture_kit/plane.hpp"
#include "include/capture_kit/texture.hpp"
#include "tests/test_harness.hpp"

using namespace ck;

TEST(known_layouts) {
  auto nv12 = FindFourccLayout(DRM_FORMAT_NV12);
  ASSERT(nv12 != nullptr);
  ASSERT_EQ(nv12->planes, 2);
  ASSERT_EQ(nv12->bytes_per_element[0], 1u);
  ASSERT_EQ(nv12->bytes_per_element[1], 2u);

  auto bgra = FindFourccLayout(DRM_FORMAT_ARGB8888);
  ASSERT(bgra != nullptr);
  ASSERT_EQ(bgra->planes, 1);
  ASSERT_EQ(bgra->bytes_per_element[0], 4u);

  ASSERT(FindFourccLayout(DRM_FORMAT_P010) != nullptr);
  ASSERT(FindFourccLayout(fourcc_code('Z', 'Z', 'Z', 'Z')) == nullptr);
}

TEST(chroma_plane_rounds_up) {
  auto nv12 = FindFourccLayout(DRM_FORMAT_NV12);
  ASSERT(nv12 != nullptr);
  for (std::uint32_t w = 1; w <= 64; ++w) {
    for (std::uint32_t h = 1; h <= 64; ++h) {
      ASSERT_EQ(PlaneWidth(*nv12, 0, w), w);
      ASSERT_EQ(PlaneHeight(*nv12, 0, h), h);
      ASSERT_EQ(PlaneWidth(*nv12, 1, w), (w + 1) / 2);
      ASSERT_EQ(PlaneHeight(*nv12, 1, h), (h + 1) / 2);
    }
  }
  ASSERT_EQ(PlaneWidth(*nv12, 1, 1919), 960u);
  ASSERT_EQ(PlaneHeight(*nv12, 1, 1079), 540u);
}

TEST(describe_biplanar_1080p) {
  std::size_t pitches[2] = {1920, 1920};
  std::size_t offsets[2] = {0, 1920 * 1080};
  auto planes = DescribePlanes(DRM_FORMAT_NV12, 1920, 1080, pitches, offsets, 2);
  ASSERT_EQ(planes.size(), 2u);

  ASSERT_EQ(planes[0].index, 0u);
  ASSERT_EQ(planes[0].width, 1920u);
  ASSERT_EQ(planes[0].height, 1080u);
  ASSERT_EQ(planes[0].bytes_per_element, 1u);
  ASSERT_EQ(planes[0].size, 1920u * 1080u);

  ASSERT_EQ(planes[1].index, 1u);
  ASSERT_EQ(planes[1].width, 960u);
  ASSERT_EQ(planes[1].height, 540u);
  ASSERT_EQ(planes[1].bytes_per_element, 2u);
  ASSERT_EQ(planes[1].bytes_per_row, 1920u);
  ASSERT_EQ(planes[1].offset, 1920u * 1080u);
  ASSERT_EQ(planes[1].size, 1920u * 540u);
}

TEST(describe_packed_has_no_planes) {
  std::size_t pitches[1] = {256};
  std::size_t offsets[1] = {0};
  auto planes =
      DescribePlanes(DRM_FORMAT_ARGB8888, 64, 64, pitches, offsets, 1);
  ASSERT(planes.empty());
}

TEST(describe_three_planes) {
  std::size_t pitches[3] = {64, 32, 32};
  std::size_t offsets[3] = {0, 64 * 48, 64 * 48 + 32 * 24};
  auto planes = DescribePlanes(DRM_FORMAT_YUV420, 64, 48, pitches, offsets, 3);
  ASSERT_EQ(planes.size(), 3u);
  ASSERT_EQ(planes[2].width, 32u);
  ASSERT_EQ(planes[2].height, 24u);
  ASSERT_EQ(planes[2].offset, offsets[2]);
}

TEST(fourcc_to_string) {
  ASSERT_EQ(FourccToString(DRM_FORMAT_NV12), std::string("NV12"));
  ASSERT_EQ(FourccToString(DRM_FORMAT_ARGB8888), std::string("AR24"));
  ASSERT_EQ(FourccToString(0), std::string("????"));
}

TEST(bind_plan_biplanar) {
  auto plan = TextureBinder::PlanFor(DRM_FORMAT_NV12, 2);
  ASSERT(plan.primary_format == TextureFormat::R8Unorm);
  ASSERT(plan.secondary_format.has_value());
  ASSERT(*plan.secondary_format == TextureFormat::RG8Unorm);
  ASSERT_EQ(plan.primary_drm_format, static_cast<std::uint32_t>(DRM_FORMAT_R8));
  ASSERT_EQ(plan.secondary_drm_format,
            static_cast<std::uint32_t>(DRM_FORMAT_GR88));
  ASSERT(!plan.fallback);

  auto p010 = TextureBinder::PlanFor(DRM_FORMAT_P010, 2);
  ASSERT(p010.primary_format == TextureFormat::R16Unorm);
  ASSERT(*p010.secondary_format == TextureFormat::RG16Unorm);
}

TEST(bind_plan_packed) {
  auto bgra = TextureBinder::PlanFor(DRM_FORMAT_ARGB8888, 0);
  ASSERT(bgra.primary_format == TextureFormat::BGRA8Unorm);
  ASSERT(!bgra.secondary_format.has_value());
  ASSERT(!bgra.fallback);

  auto ten_bit = TextureBinder::PlanFor(DRM_FORMAT_XRGB2101010, 0);
  ASSERT(ten_bit.primary_format == TextureFormat::RGB10A2Unorm);
  ASSERT(!ten_bit.fallback);
}

TEST(bind_plan_fallback_is_stable) {
  struct {
    std::uint32_t fourcc;
    std::size_t planes;
  } unknown[] = {
      {DRM_FORMAT_YUYV, 0},
      {DRM_FORMAT_RGB565, 0},
      {fourcc_code('Z', 'Z', 'Z', 'Z'), 0},
      {DRM_FORMAT_YUV420, 3},
      {DRM_FORMAT_NV21, 2},
      {fourcc_code('Z', 'Z', 'Z', 'Z'), 2},
  };
  for (const auto &[fourcc, planes] : unknown) {
    auto first = TextureBinder::PlanFor(fourcc, planes);
    auto second = TextureBinder::PlanFor(fourcc, planes);
    ASSERT(first.fallback);
    ASSERT(first.primary_format == TextureFormat::BGRA8Unorm);
    ASSERT_EQ(first.primary_drm_format,
              static_cast<std::uint32_t>(DRM_FORMAT_ARGB8888));
    ASSERT(first.primary_format == second.primary_format);
    ASSERT_EQ(first.primary_drm_format, second.primary_drm_format);
    ASSERT(!first.secondary_format.has_value());
  }
}

int main() {
  ck::test::Quiet();

  RUN_TEST(known_layouts);
  RUN_TEST(chroma_plane_rounds_up);
  RUN_TEST(describe_biplanar_1080p);
  RUN_TEST(describe_packed_has_no_planes);
  RUN_TEST(describe_three_planes);
  RUN_TEST(fourcc_to_string);
  RUN_TEST(bind_plan_biplanar);
  RUN_TEST(bind_plan_packed);
  RUN_TEST(bind_plan_fallback_is_stable);

  return ck::test::Summary();
}
