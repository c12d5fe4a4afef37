/*
 *    frame_status.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_FRAME_STATUS_HPP
#define CAPTURE_KIT_FRAME_STATUS_HPP

namespace ck {

enum class FrameStatus : int {
  Complete = 0,
  Idle = 1,
  Blank = 2,
  Suspended = 3,
  Started = 4,
  Stopped = 5,
};

// Complete and Started frames carry new pixels.
constexpr auto HasContent(FrameStatus status) noexcept -> bool {
  return status == FrameStatus::Complete || status == FrameStatus::Started;
}

constexpr auto IsComplete(FrameStatus status) noexcept -> bool {
  return status == FrameStatus::Complete;
}

auto ToString(FrameStatus status) noexcept -> const char *;

}  // namespace ck

#endif  // CAPTURE_KIT_FRAME_STATUS_HPP
