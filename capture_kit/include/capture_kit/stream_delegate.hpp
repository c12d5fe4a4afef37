/*
 *    stream_delegate.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_STREAM_DELEGATE_HPP
#define CAPTURE_KIT_STREAM_DELEGATE_HPP

#include <string>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/errors.hpp"

namespace ck {

class CAPTURE_KIT_API StreamDelegate {
 public:
  virtual ~StreamDelegate(){};
  virtual auto OnStreamStopped(StreamErrors reason) -> void = 0;
  virtual auto OnStreamError(StreamErrors error, const std::string &message)
      -> void = 0;
  virtual auto OnStreamActive() -> void {}
  virtual auto OnStreamInactive() -> void {}
  virtual auto OnVideoEffectStarted() -> void {}
  virtual auto OnVideoEffectStopped() -> void {}
};

}  // namespace ck

#endif  // CAPTURE_KIT_STREAM_DELEGATE_HPP
