/*
 *    frame_info.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <new>

extern "C" {
#include <libavutil/buffer.h>
#include <libavutil/error.h>
}

#include "include/capture_kit/frame_info.hpp"

namespace {

constexpr std::uint32_t kFrameInfoMagic = 0x636b6669;  // "ckfi"

struct FrameInfoHost {
  std::uint32_t magic = kFrameInfoMagic;
  ck::FrameInfo info;
};

auto FreeFrameInfoHost(void* /*opaque*/, std::uint8_t* data) -> void {
  delete reinterpret_cast<FrameInfoHost*>(data);
}

}  // namespace

namespace ck {

auto AttachFrameInfo(AVFrame* frame, const FrameInfo& info) -> int {
  if (frame == nullptr) {
    return AVERROR(EINVAL);
  }
  auto host = new (std::nothrow) FrameInfoHost{};
  if (host == nullptr) {
    return AVERROR(ENOMEM);
  }
  try {
    host->info = info;
  } catch (const std::bad_alloc&) {
    delete host;
    return AVERROR(ENOMEM);
  }
  auto ref = av_buffer_create(reinterpret_cast<std::uint8_t*>(host),
                              sizeof(FrameInfoHost), &FreeFrameInfoHost,
                              nullptr, AV_BUFFER_FLAG_READONLY);
  if (ref == nullptr) {
    delete host;
    return AVERROR(ENOMEM);
  }
  av_buffer_unref(&frame->opaque_ref);
  frame->opaque_ref = ref;
  return 0;
}

auto FindFrameInfo(const AVFrame* frame) -> const FrameInfo* {
  if (frame == nullptr || frame->opaque_ref == nullptr ||
      frame->opaque_ref->size != sizeof(FrameInfoHost)) {
    return nullptr;
  }
  auto host = reinterpret_cast<const FrameInfoHost*>(frame->opaque_ref->data);
  if (host->magic != kFrameInfoMagic) {
    return nullptr;
  }
  return &host->info;
}

}  // namespace ck
