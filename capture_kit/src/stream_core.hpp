/*
 *    stream_core.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_STREAM_CORE_HPP
#define CAPTURE_KIT_STREAM_CORE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

extern "C" {
#include <libavutil/frame.h>
}

#include "include/capture_kit/dispatcher.hpp"
#include "include/capture_kit/errors.hpp"
#include "include/capture_kit/executor.hpp"
#include "include/capture_kit/handler_registry.hpp"
#include "include/capture_kit/sample_buffer.hpp"
#include "include/capture_kit/stream_delegate.hpp"
#include "include/capture_kit/types.hpp"

namespace ck::impl {

// State shared between a CaptureStream and the work it has queued. Queued
// deliveries keep the core alive after the stream itself is gone.
class StreamCore : public std::enable_shared_from_this<StreamCore> {
 public:
  explicit StreamCore(std::string name);
  ~StreamCore();

  auto Start() -> StreamErrors;
  auto Stop() -> StreamErrors;
  auto IsRunning() const noexcept -> bool;

  auto SetDelegate(StreamDelegate *delegate) -> void;

  auto Deliver(const AVFrame *frame, OutputType type, Executor *queue) noexcept
      -> StreamErrors;
  auto DispatchNow(SampleBuffer sample, OutputType type) noexcept
      -> StreamErrors;

  auto OnStopped(StreamErrors reason) noexcept -> void;
  auto OnActive(bool active) noexcept -> void;
  auto OnVideoEffect(bool started) noexcept -> void;

  auto Registry() noexcept -> HandlerRegistry & { return registry_; }
  auto DeliveredCount() const noexcept -> std::uint64_t;

 private:
  auto ReportError(StreamErrors error, const std::string &message) noexcept
      -> void;

  std::string name_;
  HandlerRegistry registry_;
  Dispatcher dispatcher_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> delivered_{0};
  // Held while a delegate callback runs. Callbacks must not call
  // SetDelegate.
  std::mutex delegate_mutex_;
  StreamDelegate *delegate_ = nullptr;
};

}  // namespace ck::impl

#endif  // CAPTURE_KIT_STREAM_CORE_HPP
