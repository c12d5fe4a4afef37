/*
 *    capture_stream.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_CAPTURE_STREAM_HPP
#define CAPTURE_KIT_CAPTURE_STREAM_HPP

#include <cstdint>
#include <memory>

extern "C" {
#include <libavutil/frame.h>
}

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/errors.hpp"
#include "include/capture_kit/executor.hpp"
#include "include/capture_kit/handler_registry.hpp"
#include "include/capture_kit/options.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/stream_delegate.hpp"
#include "include/capture_kit/stream_output.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

namespace impl {
class StreamCore;
}  // namespace impl

// Receiving end of one capture stream. The producer calls DeliverSample (or
// the C entry points below) once per captured unit; the stream acquires its
// own reference and fans the sample out to the registered outputs.
class CAPTURE_KIT_API CaptureStream {
 public:
  explicit CaptureStream(StreamOptions options = {});
  ~CaptureStream();

  CaptureStream(const CaptureStream &other) = delete;
  auto operator=(const CaptureStream &other) = delete;

  auto AddOutputHandler(StreamOutput *output, OutputType type) -> HandlerId;
  auto AddOutputHandler(OutputCallback callback, OutputType type)
      -> HandlerId;
  auto RemoveOutputHandler(HandlerId id, OutputType type) -> bool;
  auto SetDelegate(StreamDelegate *delegate) -> void;

  auto Start() -> StreamErrors;
  auto Stop() -> StreamErrors;
  auto IsRunning() const noexcept -> bool;

  // `frame` is borrowed for the duration of the call.
  auto DeliverSample(const AVFrame *frame, OutputType type) noexcept
      -> StreamErrors;
  auto NotifyStopped(StreamErrors reason) noexcept -> void;
  auto NotifyActive(bool active) noexcept -> void;
  auto NotifyVideoEffect(bool started) noexcept -> void;

  auto Registry() const noexcept -> const HandlerRegistry &;
  auto DeliveredCount() const noexcept -> std::uint64_t;

 private:
  // Held here rather than in the core so that the queue is never destroyed
  // from its own worker thread. Destroying the stream drains queued samples.
  SharedPtr<Executor> delivery_queue_;
  std::shared_ptr<impl::StreamCore> core_;
};

}  // namespace ck

extern "C" {

// `stream` is a ck::CaptureStream*. `output_type` takes ck::OutputType values.
CAPTURE_KIT_API int ck_stream_did_output(void *stream, const AVFrame *frame,
                                         int output_type);
CAPTURE_KIT_API void ck_stream_did_stop(void *stream, int error);
CAPTURE_KIT_API void ck_stream_did_change_state(void *stream, int active);
CAPTURE_KIT_API void ck_stream_video_effect(void *stream, int started);

}

#endif  // CAPTURE_KIT_CAPTURE_STREAM_HPP
