/*
 *    frame_info.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_FRAME_INFO_HPP
#define CAPTURE_KIT_FRAME_INFO_HPP

#include <cstdint>
#include <vector>

extern "C" {
#include <libavutil/frame.h>
}

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/frame_status.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

// Per-frame metadata reported by the capture source. Travels with the frame
// through AVFrame::opaque_ref, so every reference made with av_frame_ref()
// sees the same values.
struct FrameInfo {
  FrameStatus status = FrameStatus::Complete;
  std::uint64_t display_time_ns = 0;
  double scale_factor = 1.0;
  double content_scale = 1.0;
  Rect content_rect;
  Rect screen_rect;
  Rect bounding_rect;
  std::vector<Rect> dirty_rects;
};

// Replaces any attachment already on the frame. Returns 0 or an AVERROR code.
CAPTURE_KIT_API auto AttachFrameInfo(AVFrame *frame, const FrameInfo &info)
    -> int;

// Null when the frame carries no FrameInfo.
CAPTURE_KIT_API auto FindFrameInfo(const AVFrame *frame) -> const FrameInfo *;

}  // namespace ck

#endif  // CAPTURE_KIT_FRAME_INFO_HPP
