/*
 *    plane.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <algorithm>
#include <iterator>

#include <drm_fourcc.h>

#include "include/capture_kit/plane.hpp"

namespace {

using ck::FourccLayout;

const FourccLayout kLayouts[] = {
    {DRM_FORMAT_ARGB8888, 1, {4}, 0, 0},
    {DRM_FORMAT_XRGB8888, 1, {4}, 0, 0},
    {DRM_FORMAT_ABGR8888, 1, {4}, 0, 0},
    {DRM_FORMAT_XBGR8888, 1, {4}, 0, 0},
    {DRM_FORMAT_RGBA8888, 1, {4}, 0, 0},
    {DRM_FORMAT_BGRA8888, 1, {4}, 0, 0},
    {DRM_FORMAT_ARGB2101010, 1, {4}, 0, 0},
    {DRM_FORMAT_XRGB2101010, 1, {4}, 0, 0},
    {DRM_FORMAT_ABGR2101010, 1, {4}, 0, 0},
    {DRM_FORMAT_XBGR2101010, 1, {4}, 0, 0},
    {DRM_FORMAT_RGB565, 1, {2}, 0, 0},
    {DRM_FORMAT_YUYV, 1, {2}, 0, 0},
    {DRM_FORMAT_UYVY, 1, {2}, 0, 0},
    {DRM_FORMAT_R8, 1, {1}, 0, 0},
    {DRM_FORMAT_GR88, 1, {2}, 0, 0},
    {DRM_FORMAT_R16, 1, {2}, 0, 0},
    {DRM_FORMAT_GR1616, 1, {4}, 0, 0},
    {DRM_FORMAT_NV12, 2, {1, 2}, 1, 1},
    {DRM_FORMAT_NV21, 2, {1, 2}, 1, 1},
    {DRM_FORMAT_NV16, 2, {1, 2}, 1, 0},
    {DRM_FORMAT_P010, 2, {2, 4}, 1, 1},
    {DRM_FORMAT_YUV420, 3, {1, 1, 1}, 1, 1},
};

auto SubsampledSize(std::uint32_t size, int shift) noexcept -> std::uint32_t {
  return (size + (1u << shift) - 1) >> shift;
}

}  // namespace

namespace ck {

auto FindFourccLayout(std::uint32_t fourcc) -> const FourccLayout * {
  auto it = std::find_if(std::begin(kLayouts), std::end(kLayouts),
                         [fourcc](const FourccLayout &layout) {
                           return layout.fourcc == fourcc;
                         });
  return it == std::end(kLayouts) ? nullptr : &*it;
}

auto PlaneWidth(const FourccLayout &layout, int plane,
                std::uint32_t width) noexcept -> std::uint32_t {
  return plane == 0 ? width : SubsampledSize(width, layout.chroma_shift_x);
}

auto PlaneHeight(const FourccLayout &layout, int plane,
                 std::uint32_t height) noexcept -> std::uint32_t {
  return plane == 0 ? height : SubsampledSize(height, layout.chroma_shift_y);
}

auto DescribePlanes(std::uint32_t fourcc, std::uint32_t width,
                    std::uint32_t height, const std::size_t *pitches,
                    const std::size_t *offsets, int nb_planes)
    -> std::vector<PlaneDescriptor> {
  std::vector<PlaneDescriptor> planes;
  auto layout = FindFourccLayout(fourcc);
  auto count = layout != nullptr ? std::min(layout->planes, nb_planes)
                                 : nb_planes;
  if (count <= 1) {
    return planes;
  }
  planes.reserve(count);
  for (int i = 0; i < count; ++i) {
    PlaneDescriptor plane;
    plane.index = static_cast<std::size_t>(i);
    plane.bytes_per_row = pitches[i];
    plane.offset = offsets[i];
    if (layout != nullptr) {
      plane.width = PlaneWidth(*layout, i, width);
      plane.height = PlaneHeight(*layout, i, height);
      plane.bytes_per_element = layout->bytes_per_element[i];
    } else {
      plane.width = width;
      plane.height = height;
      plane.bytes_per_element = width > 0 ? pitches[i] / width : 0;
    }
    plane.size = plane.bytes_per_row * plane.height;
    planes.push_back(plane);
  }
  return planes;
}

auto FourccToString(std::uint32_t fourcc) -> std::string {
  std::string text(4, '?');
  for (int i = 0; i < 4; ++i) {
    auto c = static_cast<char>((fourcc >> (8 * i)) & 0x7f);
    if (c >= 0x20 && c < 0x7f) {
      text[i] = c;
    }
  }
  return text;
}

}  // namespace ck
