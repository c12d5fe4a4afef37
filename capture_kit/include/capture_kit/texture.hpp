/*
 *    texture.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_TEXTURE_HPP
#define CAPTURE_KIT_TEXTURE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/ref_counted.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/surface.hpp"

namespace ck {

enum class TextureFormat {
  BGRA8Unorm,
  RGB10A2Unorm,
  R8Unorm,
  RG8Unorm,
  R16Unorm,
  RG16Unorm,
};

auto ToString(TextureFormat format) noexcept -> const char *;

struct Texture {
  std::uint32_t name = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  TextureFormat format = TextureFormat::BGRA8Unorm;
  // Allocator specific, an EGLImage for the EGL allocator.
  void *image = nullptr;
};

// One plane of a dma-buf as the GPU should see it.
struct PlaneImport {
  int fd = -1;
  std::uint32_t drm_format = 0;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::size_t offset = 0;
  std::size_t pitch = 0;
  std::uint64_t modifier = 0;
};

// Creates textures that sample the imported memory directly.
class CAPTURE_KIT_API TextureAllocator : public RefCounted {
 public:
  virtual ~TextureAllocator() noexcept {}
  virtual auto CreateTexture(const PlaneImport &plane, TextureFormat format)
      -> std::optional<Texture> = 0;
  virtual auto DestroyTexture(const Texture &texture) noexcept -> void = 0;
};

// Textures bound to one surface. Keeps the surface referenced so the
// producer cannot recycle the memory while the textures are alive.
class CAPTURE_KIT_API TextureSet {
 public:
  TextureSet(const TextureSet &other) = delete;
  TextureSet(TextureSet &&other) noexcept;
  auto operator=(const TextureSet &other) = delete;
  auto operator=(TextureSet &&other) noexcept -> TextureSet &;
  ~TextureSet();

  auto Primary() const noexcept -> const Texture & { return primary_; }
  auto Secondary() const noexcept -> const std::optional<Texture> & {
    return secondary_;
  }
  auto PixelFormat() const noexcept -> std::uint32_t { return pixel_format_; }
  auto Width() const noexcept -> std::uint32_t { return width_; }
  auto Height() const noexcept -> std::uint32_t { return height_; }
  auto IsBiplanar() const noexcept -> bool { return secondary_.has_value(); }

 private:
  friend class TextureBinder;

  TextureSet(SharedPtr<TextureAllocator> allocator, Surface source,
             Texture primary, std::optional<Texture> secondary);
  auto Release() noexcept -> void;

  SharedPtr<TextureAllocator> allocator_;
  std::optional<Surface> source_;
  Texture primary_;
  std::optional<Texture> secondary_;
  std::uint32_t pixel_format_ = 0;
  std::uint32_t width_ = 0;
  std::uint32_t height_ = 0;
};

// Per-plane formats chosen for a surface.
struct BindPlan {
  TextureFormat primary_format = TextureFormat::BGRA8Unorm;
  std::uint32_t primary_drm_format = 0;
  std::optional<TextureFormat> secondary_format;
  std::uint32_t secondary_drm_format = 0;
  // The surface format was not recognized and the packed 8-bit path is used.
  bool fallback = false;
};

class CAPTURE_KIT_API TextureBinder {
 public:
  explicit TextureBinder(TextureAllocator *allocator);
  ~TextureBinder();

  static auto PlanFor(std::uint32_t fourcc, std::size_t plane_count) noexcept
      -> BindPlan;

  // Absent when the allocator fails to import a plane.
  auto Bind(const Surface &surface) -> std::optional<TextureSet>;

 private:
  SharedPtr<TextureAllocator> allocator_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_TEXTURE_HPP
