/*
 *    sample_buffer.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_SAMPLE_BUFFER_HPP
#define CAPTURE_KIT_SAMPLE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/frame_info.hpp"
#include "include/capture_kit/frame_ref.hpp"
#include "include/capture_kit/frame_status.hpp"
#include "include/capture_kit/media_time.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

class PixelBuffer;

// One plane of an audio sample. Interleaved audio has a single view holding
// every channel; planar audio has one view per channel.
struct AudioBufferView {
  int channels = 0;
  const byte_t *data = nullptr;
  std::size_t size = 0;
};

// A captured unit (video frame or audio chunk) together with its timing and
// capture metadata. Owns exactly one reference on the underlying frame.
class CAPTURE_KIT_API SampleBuffer {
 public:
  using RawFrameType = impl::FrameRef::RawFrameType;

  SampleBuffer(const SampleBuffer &other) = delete;
  SampleBuffer(SampleBuffer &&other) noexcept = default;
  auto operator=(const SampleBuffer &other) = delete;
  auto operator=(SampleBuffer &&other) noexcept -> SampleBuffer & = default;
  ~SampleBuffer();

  // Takes a new reference; the caller keeps its own.
  static auto Retain(const RawFrameType *raw_frame) -> std::optional<SampleBuffer>;
  // Adopts the caller's reference; `raw_frame` is freed with the handle.
  static auto AttachRawFrame(RawFrameType *raw_frame) -> std::optional<SampleBuffer>;

  auto Clone() const -> SampleBuffer;

  auto RawFramePtr() const noexcept -> RawFrameType *;
  auto Identity() const noexcept -> const void *;
  auto ReferenceCount() const noexcept -> int;
  auto IsValid() const noexcept -> bool;
  auto IsVideo() const noexcept -> bool;
  auto IsAudio() const noexcept -> bool;

  auto Width() const noexcept -> std::uint32_t;
  auto Height() const noexcept -> std::uint32_t;
  auto PresentationTimestamp() const noexcept -> MediaTime;
  auto Duration() const noexcept -> MediaTime;

  auto Info() const noexcept -> const FrameInfo *;
  auto Status() const noexcept -> std::optional<FrameStatus>;
  auto DisplayTime() const noexcept -> std::optional<std::uint64_t>;
  auto ScaleFactor() const noexcept -> std::optional<double>;
  auto ContentRect() const noexcept -> std::optional<Rect>;
  auto DirtyRects() const -> std::vector<Rect>;

  auto NumSamples() const noexcept -> int;
  auto SampleRate() const noexcept -> int;
  auto ChannelCount() const noexcept -> int;
  auto AudioBuffers() const -> std::vector<AudioBufferView>;

  // New handle on the image part; absent for audio or empty samples.
  auto ImageBuffer() const -> std::optional<PixelBuffer>;

 private:
  explicit SampleBuffer(impl::FrameRef frame_ref) noexcept;

  impl::FrameRef frame_ref_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_SAMPLE_BUFFER_HPP
