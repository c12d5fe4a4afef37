/*
 *    types.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_TYPES_HPP
#define CAPTURE_KIT_TYPES_HPP

#include <cstdint>

namespace ck {

struct Size {
  std::uint32_t width;
  std::uint32_t height;
};

struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  auto IsEmpty() const noexcept -> bool { return width <= 0.0 || height <= 0.0; }
};

using byte_t = unsigned char;

using HandlerId = std::uint64_t;

// Channel a sample was produced for.
enum class OutputType : int {
  Screen = 0,
  Audio = 1,
  Microphone = 2,
};

constexpr int kOutputTypeCount = 3;

enum class LockMode {
  ReadOnly,
  ReadWrite,
};

// Matches AVColorRange for the two values a capture source reports.
enum class ColorRange {
  Unspecified,
  Video,
  Full,
};

auto ToString(OutputType type) noexcept -> const char *;
auto ToString(LockMode mode) noexcept -> const char *;

}  // namespace ck

#endif  // CAPTURE_KIT_TYPES_HPP
