/*
 *    texture_binder.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <utility>

#include <drm_fourcc.h>

#include "include/capture_kit/texture.hpp"
#include "src/log.hpp"

namespace ck {

auto ToString(TextureFormat format) noexcept -> const char* {
  switch (format) {
    case TextureFormat::BGRA8Unorm:
      return "bgra8unorm";
    case TextureFormat::RGB10A2Unorm:
      return "rgb10a2unorm";
    case TextureFormat::R8Unorm:
      return "r8unorm";
    case TextureFormat::RG8Unorm:
      return "rg8unorm";
    case TextureFormat::R16Unorm:
      return "r16unorm";
    case TextureFormat::RG16Unorm:
      return "rg16unorm";
  }
  return "unknown";
}

TextureSet::TextureSet(SharedPtr<TextureAllocator> allocator, Surface source,
                       Texture primary, std::optional<Texture> secondary)
    : allocator_(std::move(allocator)),
      source_(std::move(source)),
      primary_(primary),
      secondary_(secondary) {
  pixel_format_ = source_->PixelFormat();
  width_ = source_->Width();
  height_ = source_->Height();
}

TextureSet::TextureSet(TextureSet&& other) noexcept
    : allocator_(std::move(other.allocator_)),
      source_(std::move(other.source_)),
      primary_(other.primary_),
      secondary_(std::exchange(other.secondary_, std::nullopt)),
      pixel_format_(other.pixel_format_),
      width_(other.width_),
      height_(other.height_) {
  other.source_.reset();
  other.primary_ = Texture{};
}

auto TextureSet::operator=(TextureSet&& other) noexcept -> TextureSet& {
  if (this != &other) {
    Release();
    allocator_ = std::move(other.allocator_);
    source_ = std::move(other.source_);
    other.source_.reset();
    primary_ = std::exchange(other.primary_, Texture{});
    secondary_ = std::exchange(other.secondary_, std::nullopt);
    pixel_format_ = other.pixel_format_;
    width_ = other.width_;
    height_ = other.height_;
  }
  return *this;
}

TextureSet::~TextureSet() { Release(); }

auto TextureSet::Release() noexcept -> void {
  if (allocator_) {
    if (secondary_) {
      allocator_->DestroyTexture(*secondary_);
    }
    allocator_->DestroyTexture(primary_);
    allocator_.Reset();
  }
  secondary_.reset();
  primary_ = Texture{};
  source_.reset();
}

TextureBinder::TextureBinder(TextureAllocator* allocator)
    : allocator_(allocator, true) {}

TextureBinder::~TextureBinder() {}

auto TextureBinder::PlanFor(std::uint32_t fourcc,
                            std::size_t plane_count) noexcept -> BindPlan {
  BindPlan plan;
  // Only biplanar YCbCr gets a luma and an interleaved chroma texture. Other
  // multi-planar layouts (I420, NV21) take the packed fallback below.
  if (plane_count >= 2 && fourcc == DRM_FORMAT_NV12) {
    plan.primary_format = TextureFormat::R8Unorm;
    plan.primary_drm_format = DRM_FORMAT_R8;
    plan.secondary_format = TextureFormat::RG8Unorm;
    plan.secondary_drm_format = DRM_FORMAT_GR88;
    return plan;
  }
  if (plane_count >= 2 && fourcc == DRM_FORMAT_P010) {
    plan.primary_format = TextureFormat::R16Unorm;
    plan.primary_drm_format = DRM_FORMAT_R16;
    plan.secondary_format = TextureFormat::RG16Unorm;
    plan.secondary_drm_format = DRM_FORMAT_GR1616;
    return plan;
  }
  switch (fourcc) {
    case DRM_FORMAT_ARGB8888:
    case DRM_FORMAT_XRGB8888:
    case DRM_FORMAT_ABGR8888:
    case DRM_FORMAT_XBGR8888:
      plan.primary_format = TextureFormat::BGRA8Unorm;
      plan.primary_drm_format = fourcc;
      break;
    case DRM_FORMAT_ARGB2101010:
    case DRM_FORMAT_XRGB2101010:
    case DRM_FORMAT_ABGR2101010:
    case DRM_FORMAT_XBGR2101010:
      plan.primary_format = TextureFormat::RGB10A2Unorm;
      plan.primary_drm_format = fourcc;
      break;
    default:
      // Colors may come out wrong but the image still renders.
      plan.primary_format = TextureFormat::BGRA8Unorm;
      plan.primary_drm_format = DRM_FORMAT_ARGB8888;
      plan.fallback = true;
      break;
  }
  return plan;
}

auto TextureBinder::Bind(const Surface& surface) -> std::optional<TextureSet> {
  if (!surface.IsValid() || !allocator_) {
    return std::nullopt;
  }
  auto plan = PlanFor(surface.PixelFormat(), surface.PlaneCount());
  if (plan.fallback) {
    CK_LOG_WARNING(Texture,
                   "surface %llu has unrecognized format %s, binding as %s\n",
                   static_cast<unsigned long long>(surface.Id()),
                   FourccToString(surface.PixelFormat()).c_str(),
                   ToString(plan.primary_format));
  }

  auto import_plane = [&](std::size_t index, std::uint32_t drm_format) {
    PlaneImport import;
    import.fd = surface.PlaneObjectFd(index);
    import.drm_format = drm_format;
    import.offset = surface.PlaneOffset(index);
    import.pitch = surface.PlanePitch(index);
    import.modifier = surface.Modifier();
    auto plane = surface.Plane(index);
    import.width = plane ? plane->width : surface.Width();
    import.height = plane ? plane->height : surface.Height();
    return import;
  };

  auto primary = allocator_->CreateTexture(
      import_plane(0, plan.primary_drm_format), plan.primary_format);
  if (!primary) {
    CK_LOG_ERROR(Texture, "failed to import plane 0 of surface %llu\n",
                 static_cast<unsigned long long>(surface.Id()));
    return std::nullopt;
  }
  std::optional<Texture> secondary;
  if (plan.secondary_format) {
    secondary = allocator_->CreateTexture(
        import_plane(1, plan.secondary_drm_format), *plan.secondary_format);
    if (!secondary) {
      CK_LOG_ERROR(Texture, "failed to import plane 1 of surface %llu\n",
                   static_cast<unsigned long long>(surface.Id()));
      allocator_->DestroyTexture(*primary);
      return std::nullopt;
    }
  }
  return TextureSet{allocator_, surface.Clone(), *primary, secondary};
}

}  // namespace ck
