/*
 *    log.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_LOG_HPP
#define CAPTURE_KIT_LOG_HPP

#include <string>

extern "C" {
#include <libavutil/log.h>
}

namespace ck::log {

enum class Component {
  Stream,
  Dispatcher,
  Registry,
  Buffer,
  Surface,
  Allocator,
  Texture,
};

// av_log() context: an AVClass pointer as the first member, as FFmpeg
// expects. The class name is the component prefix printed by the default
// callback.
struct Context {
  const AVClass *av_class;
};

auto ContextFor(Component component) noexcept -> void *;

// av_strerror() text for an AVERROR code.
auto ErrorString(int errnum) -> std::string;

}  // namespace ck::log

#define CK_LOG(component, level, ...)                                  \
  av_log(::ck::log::ContextFor(::ck::log::Component::component), level, \
         __VA_ARGS__)

#define CK_LOG_ERROR(component, ...) CK_LOG(component, AV_LOG_ERROR, __VA_ARGS__)
#define CK_LOG_WARNING(component, ...) \
  CK_LOG(component, AV_LOG_WARNING, __VA_ARGS__)
#define CK_LOG_INFO(component, ...) CK_LOG(component, AV_LOG_INFO, __VA_ARGS__)
#define CK_LOG_DEBUG(component, ...) CK_LOG(component, AV_LOG_DEBUG, __VA_ARGS__)
#define CK_LOG_TRACE(component, ...) CK_LOG(component, AV_LOG_TRACE, __VA_ARGS__)

#endif  // CAPTURE_KIT_LOG_HPP
