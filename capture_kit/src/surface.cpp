/*
 *    surface.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cerrno>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

#include <drm_fourcc.h>

extern "C" {
#include <libavutil/pixfmt.h>
}

#include "include/capture_kit/lock_guard.hpp"
#include "include/capture_kit/surface.hpp"
#include "src/log.hpp"

namespace ck::impl {

auto ParseDrmDescriptor(const AVDRMFrameDescriptor* desc) -> std::optional<DrmLayout>
{
    if (desc == nullptr || desc->nb_objects <= 0 || desc->nb_layers <= 0 ||
        desc->nb_objects > AV_DRM_MAX_PLANES || desc->nb_layers > AV_DRM_MAX_PLANES) {
        return std::nullopt;
    }
    DrmLayout layout;
    layout.modifier = desc->objects[0].format_modifier;
    for (int l = 0; l < desc->nb_layers; ++l) {
        const auto& layer = desc->layers[l];
        for (int p = 0; p < layer.nb_planes; ++p) {
            const auto& plane = layer.planes[p];
            if (plane.object_index < 0 || plane.object_index >= desc->nb_objects) {
                return std::nullopt;
            }
            layout.planes.push_back(DrmPlaneRef{
                plane.object_index,
                static_cast<std::size_t>(plane.offset),
                static_cast<std::size_t>(plane.pitch)});
        }
    }
    if (layout.planes.empty()) {
        return std::nullopt;
    }
    layout.fourcc = desc->layers[0].format;
    if (desc->nb_layers == 2) {
        auto second = desc->layers[1].format;
        if (layout.fourcc == DRM_FORMAT_R8 && second == DRM_FORMAT_GR88) {
            layout.fourcc = DRM_FORMAT_NV12;
        } else if (layout.fourcc == DRM_FORMAT_R16 && second == DRM_FORMAT_GR1616) {
            layout.fourcc = DRM_FORMAT_P010;
        }
    } else if (desc->nb_layers == 3 && layout.fourcc == DRM_FORMAT_R8) {
        layout.fourcc = DRM_FORMAT_YUV420;
    }
    return layout;
}

}  // namespace ck::impl

using namespace ck;

Surface::Surface(impl::FrameRef frame_ref, SharedPtr<SurfaceBackend> backend,
                 impl::DrmLayout layout)
    : frame_ref_(std::move(frame_ref))
    , backend_(std::move(backend))
    , layout_(std::move(layout))
{
    auto desc = Descriptor();
    if (desc == nullptr) {
        return;
    }
    struct stat st {};
    if (fstat(desc->objects[0].fd, &st) == 0) {
        id_ = static_cast<std::uint64_t>(st.st_ino);
    }
    std::vector<std::size_t> pitches;
    std::vector<std::size_t> offsets;
    for (const auto& plane : layout_.planes) {
        pitches.push_back(plane.pitch);
        offsets.push_back(plane.offset);
    }
    planes_ = DescribePlanes(layout_.fourcc, Width(), Height(), pitches.data(),
                             offsets.data(), static_cast<int>(layout_.planes.size()));
}

Surface::~Surface()
{
}

auto Surface::FromFrameRef(impl::FrameRef frame_ref, SurfaceBackend* backend)
    -> std::optional<Surface>
{
    auto frame = frame_ref.RawFramePtr();
    if (frame == nullptr) {
        return std::nullopt;
    }
    if (frame->format != AV_PIX_FMT_DRM_PRIME || frame->data[0] == nullptr) {
        CK_LOG_WARNING(Surface, "frame is not a DRM PRIME frame (format %d)\n", frame->format);
        return std::nullopt;
    }
    auto layout = impl::ParseDrmDescriptor(
        reinterpret_cast<const AVDRMFrameDescriptor*>(frame->data[0]));
    if (!layout) {
        CK_LOG_WARNING(Surface, "malformed DRM frame descriptor\n");
        return std::nullopt;
    }
    if (backend == nullptr) {
        backend = SurfaceBackend::Default();
    }
    return Surface{std::move(frame_ref), SharedPtr<SurfaceBackend>(backend, true),
                   std::move(*layout)};
}

auto Surface::Retain(const RawFrameType* raw_frame, SurfaceBackend* backend)
    -> std::optional<Surface>
{
    if (raw_frame == nullptr) {
        return std::nullopt;
    }
    auto frame_ref = impl::FrameRef::Ref(raw_frame);
    if (!frame_ref) {
        CK_LOG_ERROR(Surface, "failed to take a reference on surface frame %p\n", raw_frame);
        return std::nullopt;
    }
    return FromFrameRef(std::move(frame_ref), backend);
}

auto Surface::AttachRawFrame(RawFrameType* raw_frame, SurfaceBackend* backend)
    -> std::optional<Surface>
{
    if (raw_frame == nullptr) {
        return std::nullopt;
    }
    return FromFrameRef(impl::FrameRef{raw_frame}, backend);
}

auto Surface::Clone() const -> Surface
{
    return Surface{frame_ref_.Clone(), backend_, layout_};
}

auto Surface::RawFramePtr() const noexcept -> RawFrameType*
{
    return frame_ref_.RawFramePtr();
}

auto Surface::Descriptor() const noexcept -> const AVDRMFrameDescriptor*
{
    auto frame = RawFramePtr();
    if (frame == nullptr) {
        return nullptr;
    }
    return reinterpret_cast<const AVDRMFrameDescriptor*>(frame->data[0]);
}

auto Surface::Backend() const noexcept -> SurfaceBackend*
{
    return backend_.get();
}

auto Surface::ReferenceCount() const noexcept -> int
{
    return frame_ref_.ReferenceCount();
}

auto Surface::IsValid() const noexcept -> bool
{
    return static_cast<bool>(frame_ref_);
}

auto Surface::Id() const noexcept -> std::uint64_t
{
    return id_;
}

auto Surface::Width() const noexcept -> std::uint32_t
{
    return IsValid() ? static_cast<std::uint32_t>(RawFramePtr()->width) : 0;
}

auto Surface::Height() const noexcept -> std::uint32_t
{
    return IsValid() ? static_cast<std::uint32_t>(RawFramePtr()->height) : 0;
}

auto Surface::PixelFormat() const noexcept -> std::uint32_t
{
    return layout_.fourcc;
}

auto Surface::Modifier() const noexcept -> std::uint64_t
{
    return layout_.modifier;
}

auto Surface::Range() const noexcept -> ColorRange
{
    if (!IsValid()) {
        return ColorRange::Unspecified;
    }
    switch (RawFramePtr()->color_range) {
    case AVCOL_RANGE_JPEG:
        return ColorRange::Full;
    case AVCOL_RANGE_MPEG:
        return ColorRange::Video;
    default:
        return ColorRange::Unspecified;
    }
}

auto Surface::IsFullRange() const noexcept -> bool
{
    return Range() == ColorRange::Full;
}

auto Surface::BytesPerRow() const noexcept -> std::size_t
{
    return layout_.planes.empty() ? 0 : layout_.planes[0].pitch;
}

auto Surface::BytesPerElement() const noexcept -> std::size_t
{
    auto layout = FindFourccLayout(layout_.fourcc);
    if (layout != nullptr) {
        return layout->bytes_per_element[0];
    }
    auto width = Width();
    return width > 0 ? BytesPerRow() / width : 0;
}

auto Surface::AllocSize() const noexcept -> std::size_t
{
    auto desc = Descriptor();
    if (desc == nullptr) {
        return 0;
    }
    std::size_t size = 0;
    for (int i = 0; i < desc->nb_objects; ++i) {
        size += desc->objects[i].size;
    }
    return size;
}

auto Surface::PlaneCount() const noexcept -> std::size_t
{
    return planes_.size();
}

auto Surface::Plane(std::size_t index) const -> std::optional<PlaneDescriptor>
{
    if (index >= planes_.size()) {
        return std::nullopt;
    }
    return planes_[index];
}

auto Surface::IsBiplanar() const noexcept -> bool
{
    return planes_.size() == 2;
}

auto Surface::PlaneObjectFd(std::size_t index) const noexcept -> int
{
    auto desc = Descriptor();
    if (desc == nullptr || index >= layout_.planes.size()) {
        return -1;
    }
    return desc->objects[layout_.planes[index].object_index].fd;
}

auto Surface::PlaneOffset(std::size_t index) const noexcept -> std::size_t
{
    return index < layout_.planes.size() ? layout_.planes[index].offset : 0;
}

auto Surface::PlanePitch(std::size_t index) const noexcept -> std::size_t
{
    return index < layout_.planes.size() ? layout_.planes[index].pitch : 0;
}

namespace {

auto ObjectSize(const AVDRMObjectDescriptor& object) -> std::size_t
{
    if (object.size > 0) {
        return object.size;
    }
    auto end = lseek(object.fd, 0, SEEK_END);
    return end > 0 ? static_cast<std::size_t>(end) : 0;
}

}  // namespace

auto Surface::Lock(LockMode mode, SurfaceLockGuard& guard) const -> LockErrors
{
    if (guard.IsLocked()) {
        return LockErrors::AlreadyLocked;
    }
    if (!IsValid()) {
        return LockErrors::InvalidBuffer;
    }
    if (layout_.modifier != DRM_FORMAT_MOD_LINEAR &&
        layout_.modifier != DRM_FORMAT_MOD_INVALID) {
        CK_LOG_DEBUG(Surface, "surface %llu uses modifier 0x%llx, CPU view is not linear\n",
                     static_cast<unsigned long long>(id_),
                     static_cast<unsigned long long>(layout_.modifier));
    }

    auto desc = Descriptor();
    auto backend = backend_.get();
    std::vector<SurfaceLockGuard::Mapping> mappings(desc->nb_objects);
    auto rollback = [&]() {
        for (auto& mapping : mappings) {
            if (mapping.access_begun) {
                backend->EndAccess(mapping.fd, mode);
            }
            if (mapping.address != nullptr) {
                backend->Unmap(mapping.address, mapping.size);
            }
        }
    };

    for (int i = 0; i < desc->nb_objects; ++i) {
        auto& mapping = mappings[i];
        mapping.fd = desc->objects[i].fd;
        mapping.size = ObjectSize(desc->objects[i]);
        if (mapping.size == 0) {
            rollback();
            return LockErrors::InvalidBuffer;
        }
        mapping.address = backend->Map(mapping.fd, mapping.size, mode);
        if (mapping.address == nullptr) {
            CK_LOG_ERROR(Surface, "mmap of surface %llu object %d failed\n",
                         static_cast<unsigned long long>(id_), i);
            rollback();
            return LockErrors::MapFailed;
        }
        auto ret = backend->BeginAccess(mapping.fd, mode);
        if (ret < 0) {
            CK_LOG_WARNING(Surface, "begin %s access on surface %llu failed: %d\n",
                           ToString(mode), static_cast<unsigned long long>(id_), ret);
            rollback();
            return (ret == -EBUSY || ret == -EAGAIN) ? LockErrors::Busy : LockErrors::SyncFailed;
        }
        mapping.access_begun = true;
    }

    std::vector<impl::PlaneView> views;
    auto add_view = [&](std::size_t index, std::uint32_t width, std::uint32_t height,
                        std::size_t bytes_per_element) -> bool {
        const auto& ref = layout_.planes[index];
        const auto& mapping = mappings[ref.object_index];
        auto size = ref.pitch * height;
        if (ref.offset + size > mapping.size) {
            return false;
        }
        views.push_back(impl::PlaneView{
            static_cast<byte_t*>(mapping.address) + ref.offset,
            ref.pitch, width, height, bytes_per_element, size});
        return true;
    };

    auto ok = true;
    if (planes_.empty()) {
        ok = add_view(0, Width(), Height(), BytesPerElement());
    } else {
        for (const auto& plane : planes_) {
            ok = ok && add_view(plane.index, plane.width, plane.height, plane.bytes_per_element);
        }
    }
    if (!ok) {
        CK_LOG_ERROR(Surface, "surface %llu planes exceed their memory objects\n",
                     static_cast<unsigned long long>(id_));
        rollback();
        return LockErrors::InvalidBuffer;
    }

    auto whole = std::span<byte_t>(static_cast<byte_t*>(mappings[0].address), mappings[0].size);
    guard.Assign(mode, whole, std::move(views), planes_.size());
    guard.surface_ = this;
    guard.backend_ = backend_;
    guard.mappings_ = std::move(mappings);
    return LockErrors::Ok;
}
