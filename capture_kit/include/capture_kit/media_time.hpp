/*
 *    media_time.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_MEDIA_TIME_HPP
#define CAPTURE_KIT_MEDIA_TIME_HPP

#include <cstdint>

extern "C" {
#include <libavutil/rational.h>
}

namespace ck {

// Rational timestamp: value / timescale seconds.
struct MediaTime {
  static constexpr std::uint32_t kFlagValid = 1u << 0;
  static constexpr std::uint32_t kFlagPositiveInfinity = 1u << 2;
  static constexpr std::uint32_t kFlagNegativeInfinity = 1u << 3;
  static constexpr std::uint32_t kFlagIndefinite = 1u << 4;

  std::int64_t value = 0;
  std::int32_t timescale = 0;
  std::uint32_t flags = 0;

  static auto Invalid() noexcept -> MediaTime { return MediaTime{}; }
  static auto Make(std::int64_t value, std::int32_t timescale) noexcept
      -> MediaTime;
  // AV_NOPTS_VALUE or an unusable time base give an invalid time.
  static auto FromRational(std::int64_t value, AVRational time_base) noexcept
      -> MediaTime;

  auto IsValid() const noexcept -> bool;
  auto IsIndefinite() const noexcept -> bool;
  auto Seconds() const noexcept -> double;
  auto Rescale(std::int32_t new_timescale) const noexcept -> MediaTime;

  friend auto operator==(const MediaTime &a, const MediaTime &b) noexcept
      -> bool;
  friend auto operator<(const MediaTime &a, const MediaTime &b) noexcept
      -> bool;
};

}  // namespace ck

#endif  // CAPTURE_KIT_MEDIA_TIME_HPP
