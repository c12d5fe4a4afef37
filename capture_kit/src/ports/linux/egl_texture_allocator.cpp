/*
 *    egl_texture_allocator.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>

#include <drm_fourcc.h>
#include <EGL/egl.h>
#include <EGL/eglext.h>
#include <GLES2/gl2.h>
#include <GLES2/gl2ext.h>

#include "include/capture_kit/egl_texture_allocator.hpp"
#include "src/log.hpp"

namespace ck::ports::linux_dmabuf {

namespace {

auto HasExtension(const char* extensions, const char* name) -> bool {
  if (extensions == nullptr) {
    return false;
  }
  auto len = std::strlen(name);
  for (auto p = std::strstr(extensions, name); p != nullptr;
       p = std::strstr(p + len, name)) {
    auto starts = p == extensions || p[-1] == ' ';
    auto ends = p[len] == '\0' || p[len] == ' ';
    if (starts && ends) {
      return true;
    }
  }
  return false;
}

}  // namespace

class EglTextureAllocator : public TextureAllocator {
 public:
  EglTextureAllocator(EGLDisplay display,
                      PFNEGLCREATEIMAGEKHRPROC create_image,
                      PFNEGLDESTROYIMAGEKHRPROC destroy_image,
                      PFNGLEGLIMAGETARGETTEXTURE2DOESPROC image_target,
                      bool has_modifiers)
      : display_(display),
        create_image_(create_image),
        destroy_image_(destroy_image),
        image_target_(image_target),
        has_modifiers_(has_modifiers) {}

  auto CreateTexture(const PlaneImport& plane, TextureFormat format)
      -> std::optional<Texture> override {
    std::vector<EGLint> attribs = {
        EGL_WIDTH,
        static_cast<EGLint>(plane.width),
        EGL_HEIGHT,
        static_cast<EGLint>(plane.height),
        EGL_LINUX_DRM_FOURCC_EXT,
        static_cast<EGLint>(plane.drm_format),
        EGL_DMA_BUF_PLANE0_FD_EXT,
        plane.fd,
        EGL_DMA_BUF_PLANE0_OFFSET_EXT,
        static_cast<EGLint>(plane.offset),
        EGL_DMA_BUF_PLANE0_PITCH_EXT,
        static_cast<EGLint>(plane.pitch),
    };
    if (has_modifiers_ && plane.modifier != DRM_FORMAT_MOD_INVALID) {
      attribs.push_back(EGL_DMA_BUF_PLANE0_MODIFIER_LO_EXT);
      attribs.push_back(static_cast<EGLint>(plane.modifier & 0xffffffff));
      attribs.push_back(EGL_DMA_BUF_PLANE0_MODIFIER_HI_EXT);
      attribs.push_back(static_cast<EGLint>(plane.modifier >> 32));
    }
    attribs.push_back(EGL_NONE);

    auto image = create_image_(display_, EGL_NO_CONTEXT, EGL_LINUX_DMA_BUF_EXT,
                               nullptr, attribs.data());
    if (image == EGL_NO_IMAGE_KHR) {
      CK_LOG_ERROR(Texture, "eglCreateImageKHR failed: 0x%x\n", eglGetError());
      return std::nullopt;
    }

    GLuint name = 0;
    glGenTextures(1, &name);
    glBindTexture(GL_TEXTURE_2D, name);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    image_target_(GL_TEXTURE_2D, static_cast<GLeglImageOES>(image));
    auto gl_error = glGetError();
    glBindTexture(GL_TEXTURE_2D, 0);
    if (gl_error != GL_NO_ERROR) {
      CK_LOG_ERROR(Texture, "glEGLImageTargetTexture2DOES failed: 0x%x\n",
                   gl_error);
      glDeleteTextures(1, &name);
      destroy_image_(display_, image);
      return std::nullopt;
    }

    Texture texture;
    texture.name = name;
    texture.width = plane.width;
    texture.height = plane.height;
    texture.format = format;
    texture.image = image;
    return texture;
  }

  auto DestroyTexture(const Texture& texture) noexcept -> void override {
    if (texture.name != 0) {
      GLuint name = texture.name;
      glDeleteTextures(1, &name);
    }
    if (texture.image != nullptr) {
      destroy_image_(display_, static_cast<EGLImageKHR>(texture.image));
    }
  }

 private:
  EGLDisplay display_;
  PFNEGLCREATEIMAGEKHRPROC create_image_;
  PFNEGLDESTROYIMAGEKHRPROC destroy_image_;
  PFNGLEGLIMAGETARGETTEXTURE2DOESPROC image_target_;
  bool has_modifiers_;
};

}  // namespace ck::ports::linux_dmabuf

namespace ck {

auto CreateEglTextureAllocator(void* egl_display)
    -> SharedPtr<TextureAllocator> {
  auto display = static_cast<EGLDisplay>(egl_display);
  auto extensions = eglQueryString(display, EGL_EXTENSIONS);
  if (!ports::linux_dmabuf::HasExtension(extensions,
                                         "EGL_EXT_image_dma_buf_import")) {
    CK_LOG_ERROR(Texture, "EGL_EXT_image_dma_buf_import is not supported\n");
    return {};
  }
  auto create_image = reinterpret_cast<PFNEGLCREATEIMAGEKHRPROC>(
      eglGetProcAddress("eglCreateImageKHR"));
  auto destroy_image = reinterpret_cast<PFNEGLDESTROYIMAGEKHRPROC>(
      eglGetProcAddress("eglDestroyImageKHR"));
  auto image_target = reinterpret_cast<PFNGLEGLIMAGETARGETTEXTURE2DOESPROC>(
      eglGetProcAddress("glEGLImageTargetTexture2DOES"));
  if (create_image == nullptr || destroy_image == nullptr ||
      image_target == nullptr) {
    CK_LOG_ERROR(Texture, "EGL image entry points are missing\n");
    return {};
  }
  auto has_modifiers = ports::linux_dmabuf::HasExtension(
      extensions, "EGL_EXT_image_dma_buf_import_modifiers");
  return MakeShared<ports::linux_dmabuf::EglTextureAllocator>(
      display, create_image, destroy_image, image_target, has_modifiers);
}

}  // namespace ck
