/*
 *    log.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

extern "C" {
#include <libavutil/error.h>
#include <libavutil/version.h>
}

#include "src/log.hpp"

namespace {

auto ClassName(void *ctx) -> const char * {
  return (*reinterpret_cast<const AVClass **>(ctx))->class_name;
}

auto MakeClass(const char *class_name, AVClassCategory category) -> AVClass {
  AVClass av_class{};
  av_class.class_name = class_name;
  av_class.item_name = &ClassName;
  av_class.version = LIBAVUTIL_VERSION_INT;
  av_class.category = category;
  return av_class;
}

const AVClass kStreamClass = MakeClass("ck_stream", AV_CLASS_CATEGORY_INPUT);
const AVClass kDispatcherClass =
    MakeClass("ck_dispatcher", AV_CLASS_CATEGORY_NA);
const AVClass kRegistryClass = MakeClass("ck_registry", AV_CLASS_CATEGORY_NA);
const AVClass kBufferClass = MakeClass("ck_buffer", AV_CLASS_CATEGORY_NA);
const AVClass kSurfaceClass =
    MakeClass("ck_surface", AV_CLASS_CATEGORY_HWDEVICE);
const AVClass kAllocatorClass =
    MakeClass("ck_allocator", AV_CLASS_CATEGORY_HWDEVICE);
const AVClass kTextureClass =
    MakeClass("ck_texture", AV_CLASS_CATEGORY_HWDEVICE);

ck::log::Context stream_ctx{&kStreamClass};
ck::log::Context dispatcher_ctx{&kDispatcherClass};
ck::log::Context registry_ctx{&kRegistryClass};
ck::log::Context buffer_ctx{&kBufferClass};
ck::log::Context surface_ctx{&kSurfaceClass};
ck::log::Context allocator_ctx{&kAllocatorClass};
ck::log::Context texture_ctx{&kTextureClass};

}  // namespace

namespace ck::log {

auto ContextFor(Component component) noexcept -> void * {
  switch (component) {
    case Component::Stream:
      return &stream_ctx;
    case Component::Dispatcher:
      return &dispatcher_ctx;
    case Component::Registry:
      return &registry_ctx;
    case Component::Buffer:
      return &buffer_ctx;
    case Component::Surface:
      return &surface_ctx;
    case Component::Allocator:
      return &allocator_ctx;
    case Component::Texture:
      return &texture_ctx;
  }
  return nullptr;
}

auto ErrorString(int errnum) -> std::string {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {};
  if (av_strerror(errnum, buf, sizeof(buf)) < 0) {
    return "error " + std::to_string(errnum);
  }
  return buf;
}

}  // namespace ck::log
