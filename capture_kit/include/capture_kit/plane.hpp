/*
 *    plane.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_PLANE_HPP
#define CAPTURE_KIT_PLANE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "include/capture_kit/config.hpp"

namespace ck {

struct PlaneDescriptor {
  std::size_t index = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::size_t bytes_per_row = 0;
  std::size_t bytes_per_element = 0;
  // Byte offset from the start of the allocation holding the plane.
  std::size_t offset = 0;
  std::size_t size = 0;
};

// Memory layout of one DRM fourcc.
struct FourccLayout {
  std::uint32_t fourcc = 0;
  // 1 for packed formats.
  int planes = 1;
  std::size_t bytes_per_element[4] = {};
  // log2 of the horizontal and vertical subsampling of planes 1..n.
  int chroma_shift_x = 0;
  int chroma_shift_y = 0;
};

// Null for formats the library does not know.
CAPTURE_KIT_API auto FindFourccLayout(std::uint32_t fourcc)
    -> const FourccLayout *;

// Chroma planes are rounded up, so 1919x1079 4:2:0 gives 960x540.
CAPTURE_KIT_API auto PlaneWidth(const FourccLayout &layout, int plane,
                                std::uint32_t width) noexcept
    -> std::uint32_t;
CAPTURE_KIT_API auto PlaneHeight(const FourccLayout &layout, int plane,
                                 std::uint32_t height) noexcept
    -> std::uint32_t;

// Geometry of every plane given the pitches and offsets the allocation uses.
// Empty for single-plane formats, which report a plane count of 0.
CAPTURE_KIT_API auto DescribePlanes(std::uint32_t fourcc, std::uint32_t width,
                                    std::uint32_t height,
                                    const std::size_t *pitches,
                                    const std::size_t *offsets,
                                    int nb_planes)
    -> std::vector<PlaneDescriptor>;

CAPTURE_KIT_API auto FourccToString(std::uint32_t fourcc) -> std::string;

}  // namespace ck

#endif  // CAPTURE_KIT_PLANE_HPP
