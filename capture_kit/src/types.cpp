/*
 *    types.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/capture_kit/errors.hpp"
#include "include/capture_kit/frame_status.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

auto ToString(OutputType type) noexcept -> const char* {
  switch (type) {
    case OutputType::Screen:
      return "screen";
    case OutputType::Audio:
      return "audio";
    case OutputType::Microphone:
      return "microphone";
  }
  return "unknown";
}

auto ToString(LockMode mode) noexcept -> const char* {
  return mode == LockMode::ReadWrite ? "read-write" : "read-only";
}

auto ToString(FrameStatus status) noexcept -> const char* {
  switch (status) {
    case FrameStatus::Complete:
      return "complete";
    case FrameStatus::Idle:
      return "idle";
    case FrameStatus::Blank:
      return "blank";
    case FrameStatus::Suspended:
      return "suspended";
    case FrameStatus::Started:
      return "started";
    case FrameStatus::Stopped:
      return "stopped";
  }
  return "unknown";
}

auto ToString(LockErrors err) noexcept -> const char* {
  switch (err) {
    case LockErrors::Ok:
      return "ok";
    case LockErrors::Other:
      return "other";
    case LockErrors::InvalidBuffer:
      return "invalid buffer";
    case LockErrors::AlreadyLocked:
      return "already locked";
    case LockErrors::NotLocked:
      return "not locked";
    case LockErrors::Busy:
      return "busy";
    case LockErrors::MapFailed:
      return "map failed";
    case LockErrors::SyncFailed:
      return "sync failed";
    case LockErrors::OutOfMemory:
      return "out of memory";
  }
  return "unknown";
}

auto ToString(StreamErrors err) noexcept -> const char* {
  switch (err) {
    case StreamErrors::Ok:
      return "ok";
    case StreamErrors::Other:
      return "other";
    case StreamErrors::NotRunning:
      return "not running";
    case StreamErrors::AlreadyRunning:
      return "already running";
    case StreamErrors::InvalidSample:
      return "invalid sample";
    case StreamErrors::HandlerFailed:
      return "handler failed";
    case StreamErrors::StoppedBySource:
      return "stopped by source";
  }
  return "unknown";
}

}  // namespace ck
