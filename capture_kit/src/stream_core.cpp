/*
 *    stream_core.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "src/stream_core.hpp"

#include <exception>
#include <new>

#include "src/log.hpp"

using namespace ck;
using namespace ck::impl;

StreamCore::StreamCore(std::string name)
    : name_(std::move(name)), dispatcher_(registry_, name_) {}

StreamCore::~StreamCore() {
  CK_LOG_DEBUG(Stream, "%s: released after %llu samples (%llu dropped)\n",
               name_.c_str(),
               static_cast<unsigned long long>(DeliveredCount()),
               static_cast<unsigned long long>(dispatcher_.DroppedCount()));
}

auto StreamCore::Start() -> StreamErrors {
  if (running_.exchange(true)) {
    return StreamErrors::AlreadyRunning;
  }
  CK_LOG_INFO(Stream, "%s: started\n", name_.c_str());
  return StreamErrors::Ok;
}

auto StreamCore::Stop() -> StreamErrors {
  if (!running_.exchange(false)) {
    return StreamErrors::NotRunning;
  }
  CK_LOG_INFO(Stream, "%s: stopped\n", name_.c_str());
  return StreamErrors::Ok;
}

auto StreamCore::IsRunning() const noexcept -> bool {
  return running_.load();
}

auto StreamCore::SetDelegate(StreamDelegate *delegate) -> void {
  std::lock_guard lg(delegate_mutex_);
  delegate_ = delegate;
}

auto StreamCore::Deliver(const AVFrame *frame, OutputType type,
                         Executor *queue) noexcept -> StreamErrors {
  if (!IsRunning()) {
    return StreamErrors::NotRunning;
  }
  if (frame == nullptr) {
    CK_LOG_WARNING(Stream, "%s: null %s sample\n", name_.c_str(),
                   ToString(type));
    return StreamErrors::InvalidSample;
  }

  try {
    // The producer's reference stays with the producer.
    auto sample = SampleBuffer::Retain(frame);
    if (!sample) {
      CK_LOG_WARNING(Stream, "%s: %s sample has no buffer\n", name_.c_str(),
                     ToString(type));
      return StreamErrors::InvalidSample;
    }
    delivered_.fetch_add(1, std::memory_order_relaxed);

    if (queue == nullptr) {
      return DispatchNow(std::move(*sample), type);
    }
    auto holder = std::make_shared<SampleBuffer>(std::move(*sample));
    queue->Dispatch([self = shared_from_this(), holder, type]() {
      self->DispatchNow(std::move(*holder), type);
    });
    return StreamErrors::Ok;
  } catch (const std::bad_alloc &) {
    CK_LOG_ERROR(Stream, "%s: out of memory delivering %s sample\n",
                 name_.c_str(), ToString(type));
    return StreamErrors::Other;
  }
}

auto StreamCore::DispatchNow(SampleBuffer sample, OutputType type) noexcept
    -> StreamErrors {
  try {
    dispatcher_.Dispatch(std::move(sample), type);
    return StreamErrors::Ok;
  } catch (const std::exception &e) {
    CK_LOG_ERROR(Stream, "%s: %s output threw: %s\n", name_.c_str(),
                 ToString(type), e.what());
    ReportError(StreamErrors::HandlerFailed, e.what());
    return StreamErrors::HandlerFailed;
  } catch (...) {
    CK_LOG_ERROR(Stream, "%s: %s output threw a non-standard exception\n",
                 name_.c_str(), ToString(type));
    ReportError(StreamErrors::HandlerFailed, "unknown exception");
    return StreamErrors::HandlerFailed;
  }
}

auto StreamCore::OnStopped(StreamErrors reason) noexcept -> void {
  running_.store(false);
  CK_LOG_INFO(Stream, "%s: stopped by source: %s\n", name_.c_str(),
              ToString(reason));
  std::lock_guard lg(delegate_mutex_);
  if (delegate_) {
    try {
      delegate_->OnStreamStopped(reason);
    } catch (const std::exception &e) {
      CK_LOG_ERROR(Stream, "%s: OnStreamStopped threw: %s\n", name_.c_str(),
                   e.what());
    }
  }
}

auto StreamCore::OnActive(bool active) noexcept -> void {
  std::lock_guard lg(delegate_mutex_);
  if (delegate_) {
    try {
      if (active) {
        delegate_->OnStreamActive();
      } else {
        delegate_->OnStreamInactive();
      }
    } catch (const std::exception &e) {
      CK_LOG_ERROR(Stream, "%s: state callback threw: %s\n", name_.c_str(),
                   e.what());
    }
  }
}

auto StreamCore::OnVideoEffect(bool started) noexcept -> void {
  std::lock_guard lg(delegate_mutex_);
  if (delegate_) {
    try {
      if (started) {
        delegate_->OnVideoEffectStarted();
      } else {
        delegate_->OnVideoEffectStopped();
      }
    } catch (const std::exception &e) {
      CK_LOG_ERROR(Stream, "%s: video effect callback threw: %s\n",
                   name_.c_str(), e.what());
    }
  }
}

auto StreamCore::DeliveredCount() const noexcept -> std::uint64_t {
  return delivered_.load(std::memory_order_relaxed);
}

auto StreamCore::ReportError(StreamErrors error,
                             const std::string &message) noexcept -> void {
  std::lock_guard lg(delegate_mutex_);
  if (delegate_) {
    try {
      delegate_->OnStreamError(error, message);
    } catch (const std::exception &e) {
      CK_LOG_ERROR(Stream, "%s: OnStreamError threw: %s\n", name_.c_str(),
                   e.what());
    }
  }
}
