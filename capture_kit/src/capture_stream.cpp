/*
 *    capture_stream.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/capture_kit/capture_stream.hpp"

#include "src/log.hpp"
#include "src/stream_core.hpp"

namespace ck {

CaptureStream::CaptureStream(StreamOptions options)
    : delivery_queue_(options.delivery_queue, true),
      core_(std::make_shared<impl::StreamCore>(std::move(options.name))) {}

CaptureStream::~CaptureStream() {
  core_->SetDelegate(nullptr);
  core_->Stop();
}

auto CaptureStream::AddOutputHandler(StreamOutput *output, OutputType type)
    -> HandlerId {
  return core_->Registry().Register(type, output);
}

auto CaptureStream::AddOutputHandler(OutputCallback callback, OutputType type)
    -> HandlerId {
  return core_->Registry().Register(type, MakeOutput(std::move(callback)));
}

auto CaptureStream::RemoveOutputHandler(HandlerId id, OutputType type)
    -> bool {
  return core_->Registry().Unregister(id, type);
}

auto CaptureStream::SetDelegate(StreamDelegate *delegate) -> void {
  core_->SetDelegate(delegate);
}

auto CaptureStream::Start() -> StreamErrors { return core_->Start(); }

auto CaptureStream::Stop() -> StreamErrors { return core_->Stop(); }

auto CaptureStream::IsRunning() const noexcept -> bool {
  return core_->IsRunning();
}

auto CaptureStream::DeliverSample(const AVFrame *frame,
                                  OutputType type) noexcept -> StreamErrors {
  return core_->Deliver(frame, type, delivery_queue_.get());
}

auto CaptureStream::NotifyStopped(StreamErrors reason) noexcept -> void {
  core_->OnStopped(reason);
}

auto CaptureStream::NotifyActive(bool active) noexcept -> void {
  core_->OnActive(active);
}

auto CaptureStream::NotifyVideoEffect(bool started) noexcept -> void {
  core_->OnVideoEffect(started);
}

auto CaptureStream::Registry() const noexcept -> const HandlerRegistry & {
  return core_->Registry();
}

auto CaptureStream::DeliveredCount() const noexcept -> std::uint64_t {
  return core_->DeliveredCount();
}

}  // namespace ck

namespace {

auto ToOutputType(int output_type, ck::OutputType &type) noexcept -> bool {
  if (output_type < 0 || output_type >= ck::kOutputTypeCount) {
    return false;
  }
  type = static_cast<ck::OutputType>(output_type);
  return true;
}

}  // namespace

extern "C" {

int ck_stream_did_output(void *stream, const AVFrame *frame,
                         int output_type) {
  if (stream == nullptr) {
    return static_cast<int>(ck::StreamErrors::Other);
  }
  ck::OutputType type;
  if (!ToOutputType(output_type, type)) {
    CK_LOG_WARNING(Stream, "unknown output type %d\n", output_type);
    return static_cast<int>(ck::StreamErrors::InvalidSample);
  }
  auto result =
      static_cast<ck::CaptureStream *>(stream)->DeliverSample(frame, type);
  return static_cast<int>(result);
}

void ck_stream_did_stop(void *stream, int error) {
  if (stream == nullptr) {
    return;
  }
  auto reason = ck::StreamErrors::Other;
  if (error == 0) {
    reason = ck::StreamErrors::StoppedBySource;
  } else if (error > 0 &&
             error <= static_cast<int>(ck::StreamErrors::StoppedBySource)) {
    reason = static_cast<ck::StreamErrors>(error);
  }
  static_cast<ck::CaptureStream *>(stream)->NotifyStopped(reason);
}

void ck_stream_did_change_state(void *stream, int active) {
  if (stream == nullptr) {
    return;
  }
  static_cast<ck::CaptureStream *>(stream)->NotifyActive(active != 0);
}

void ck_stream_video_effect(void *stream, int started) {
  if (stream == nullptr) {
    return;
  }
  static_cast<ck::CaptureStream *>(stream)->NotifyVideoEffect(started != 0);
}

}
