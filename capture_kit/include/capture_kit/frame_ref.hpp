/*
 *    frame_ref.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_FRAME_REF_HPP
#define CAPTURE_KIT_FRAME_REF_HPP

extern "C" {
#include <libavutil/frame.h>
}

namespace ck {

namespace impl {

// Owns one AVFrame and therefore one reference on each of its AVBufferRefs.
class FrameRef {
 public:
  using RawFrameType = AVFrame;

  FrameRef() noexcept = default;
  explicit FrameRef(RawFrameType *raw_frame) noexcept;
  FrameRef(const FrameRef &other) = delete;
  FrameRef(FrameRef &&other) noexcept;
  auto operator=(const FrameRef &other) = delete;
  auto operator=(FrameRef &&other) noexcept -> FrameRef &;

  ~FrameRef();

  // New reference on the same buffers. Throws std::bad_alloc.
  auto Clone() const -> FrameRef;
  auto Reset() noexcept -> void;

  auto RawFramePtr() const noexcept -> RawFrameType *;
  // Count on buf[0]; 0 when empty.
  auto ReferenceCount() const noexcept -> int;
  auto Identity() const noexcept -> const void *;

  explicit operator bool() const noexcept { return raw_frame_ != nullptr; }

  // Adds one reference to `raw_frame`. Empty on failure.
  static auto Ref(const RawFrameType *raw_frame) noexcept -> FrameRef;

 private:
  RawFrameType *raw_frame_ = nullptr;
};

}  // namespace impl

}  // namespace ck

#endif  // CAPTURE_KIT_FRAME_REF_HPP
