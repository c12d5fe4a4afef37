/*
 *    media_time.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cmath>

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/mathematics.h>
}

#include "include/capture_kit/media_time.hpp"

namespace ck {

auto MediaTime::Make(std::int64_t value, std::int32_t timescale) noexcept
    -> MediaTime {
  if (timescale <= 0) {
    return Invalid();
  }
  return MediaTime{value, timescale, kFlagValid};
}

auto MediaTime::FromRational(std::int64_t value, AVRational time_base) noexcept
    -> MediaTime {
  if (value == AV_NOPTS_VALUE || time_base.num <= 0 || time_base.den <= 0) {
    return Invalid();
  }
  if (time_base.num == 1) {
    return Make(value, time_base.den);
  }
  // Fold num into the value so the timescale stays the denominator.
  auto scaled = av_rescale_q(value, time_base, AVRational{1, time_base.den});
  return Make(scaled, time_base.den);
}

auto MediaTime::IsValid() const noexcept -> bool {
  return (flags & kFlagValid) != 0 && timescale > 0;
}

auto MediaTime::IsIndefinite() const noexcept -> bool {
  return (flags & kFlagIndefinite) != 0;
}

auto MediaTime::Seconds() const noexcept -> double {
  if (!IsValid()) {
    return NAN;
  }
  if ((flags & kFlagPositiveInfinity) != 0) {
    return INFINITY;
  }
  if ((flags & kFlagNegativeInfinity) != 0) {
    return -INFINITY;
  }
  return static_cast<double>(value) / static_cast<double>(timescale);
}

auto MediaTime::Rescale(std::int32_t new_timescale) const noexcept
    -> MediaTime {
  if (!IsValid() || new_timescale <= 0) {
    return Invalid();
  }
  auto rescaled = av_rescale_rnd(value, new_timescale, timescale,
                                 AV_ROUND_NEAR_INF);
  return MediaTime{rescaled, new_timescale, flags};
}

auto operator==(const MediaTime& a, const MediaTime& b) noexcept -> bool {
  if (!a.IsValid() || !b.IsValid()) {
    return a.IsValid() == b.IsValid();
  }
  return av_compare_ts(a.value, AVRational{1, a.timescale}, b.value,
                       AVRational{1, b.timescale}) == 0;
}

auto operator<(const MediaTime& a, const MediaTime& b) noexcept -> bool {
  if (!a.IsValid() || !b.IsValid()) {
    return false;
  }
  return av_compare_ts(a.value, AVRational{1, a.timescale}, b.value,
                       AVRational{1, b.timescale}) < 0;
}

}  // namespace ck
