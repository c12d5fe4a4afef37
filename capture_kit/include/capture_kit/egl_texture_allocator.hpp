/*
 *    egl_texture_allocator.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_EGL_TEXTURE_ALLOCATOR_HPP
#define CAPTURE_KIT_EGL_TEXTURE_ALLOCATOR_HPP

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/texture.hpp"

namespace ck {

// Imports dma-bufs with EGL_EXT_image_dma_buf_import. `egl_display` is an
// EGLDisplay; textures are created in the GLES context current on the
// calling thread. Null when the display lacks the extension.
CAPTURE_KIT_API auto CreateEglTextureAllocator(void *egl_display)
    -> SharedPtr<TextureAllocator>;

}  // namespace ck

#endif  // CAPTURE_KIT_EGL_TEXTURE_ALLOCATOR_HPP
