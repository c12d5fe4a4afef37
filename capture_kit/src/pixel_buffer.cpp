/*
 *    pixel_buffer.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <algorithm>
#include <memory>
#include <utility>

#include <drm_fourcc.h>

extern "C" {
#include <libavutil/common.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/hwcontext.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

#include "include/capture_kit/lock_guard.hpp"
#include "include/capture_kit/pixel_buffer.hpp"
#include "include/capture_kit/surface.hpp"
#include "src/log.hpp"

using namespace ck;

namespace {

// Pixel layout of a DRM fourcc as FFmpeg names it.
auto FourccToPixelFormat(std::uint32_t fourcc) noexcept -> AVPixelFormat
{
    switch (fourcc) {
    case DRM_FORMAT_ARGB8888:
        return AV_PIX_FMT_BGRA;
    case DRM_FORMAT_XRGB8888:
        return AV_PIX_FMT_BGR0;
    case DRM_FORMAT_ABGR8888:
        return AV_PIX_FMT_RGBA;
    case DRM_FORMAT_XBGR8888:
        return AV_PIX_FMT_RGB0;
    case DRM_FORMAT_XRGB2101010:
        return AV_PIX_FMT_X2RGB10LE;
    case DRM_FORMAT_NV12:
        return AV_PIX_FMT_NV12;
    case DRM_FORMAT_P010:
        return AV_PIX_FMT_P010LE;
    case DRM_FORMAT_YUYV:
        return AV_PIX_FMT_YUYV422;
    case DRM_FORMAT_YUV420:
        return AV_PIX_FMT_YUV420P;
    default:
        return AV_PIX_FMT_NONE;
    }
}

auto DrmLayoutOf(const AVFrame* frame) -> std::optional<impl::DrmLayout>
{
    return impl::ParseDrmDescriptor(reinterpret_cast<const AVDRMFrameDescriptor*>(frame->data[0]));
}

auto DrmPlanes(const AVFrame* frame) -> std::vector<PlaneDescriptor>
{
    auto layout = DrmLayoutOf(frame);
    if (!layout) {
        return {};
    }
    std::vector<std::size_t> pitches;
    std::vector<std::size_t> offsets;
    for (const auto& plane : layout->planes) {
        pitches.push_back(plane.pitch);
        offsets.push_back(plane.offset);
    }
    return DescribePlanes(layout->fourcc, static_cast<std::uint32_t>(frame->width),
                          static_cast<std::uint32_t>(frame->height), pitches.data(),
                          offsets.data(), static_cast<int>(pitches.size()));
}

// Chroma planes of YUV formats are subsampled; alpha and packed planes are not.
auto PlaneDimensions(const AVPixFmtDescriptor* desc, int plane, std::uint32_t width,
                     std::uint32_t height) -> std::pair<std::uint32_t, std::uint32_t>
{
    auto is_chroma = (plane == 1 || plane == 2) && !(desc->flags & AV_PIX_FMT_FLAG_RGB);
    if (!is_chroma) {
        return {width, height};
    }
    return {static_cast<std::uint32_t>(AV_CEIL_RSHIFT(static_cast<int>(width), desc->log2_chroma_w)),
            static_cast<std::uint32_t>(AV_CEIL_RSHIFT(static_cast<int>(height), desc->log2_chroma_h))};
}

auto PlaneElementSize(const AVPixFmtDescriptor* desc, int plane) -> std::size_t
{
    int step = 0;
    for (int c = 0; c < desc->nb_components; ++c) {
        if (desc->comp[c].plane == plane) {
            step = std::max(step, desc->comp[c].step);
        }
    }
    return static_cast<std::size_t>(step);
}

// Views over the planes of a CPU addressable frame.
auto BuildFrameViews(const AVFrame* frame, AVPixelFormat format, std::vector<impl::PlaneView>& views,
                     std::span<byte_t>& whole) -> std::size_t
{
    auto desc = av_pix_fmt_desc_get(format);
    auto count = desc != nullptr ? av_pix_fmt_count_planes(format) : 1;
    if (count <= 0) {
        count = 1;
    }
    auto width = static_cast<std::uint32_t>(frame->width);
    auto height = static_cast<std::uint32_t>(frame->height);
    byte_t* end = nullptr;
    auto contiguous = true;
    for (int i = 0; i < count && frame->data[i] != nullptr; ++i) {
        auto dims = desc != nullptr ? PlaneDimensions(desc, i, width, height)
                                    : std::make_pair(width, height);
        auto pitch = static_cast<std::size_t>(std::max(frame->linesize[i], 0));
        impl::PlaneView view;
        view.data = frame->data[i];
        view.bytes_per_row = pitch;
        view.width = dims.first;
        view.height = dims.second;
        view.bytes_per_element = desc != nullptr ? PlaneElementSize(desc, i) : 0;
        view.size = pitch * dims.second;
        if (end != nullptr && view.data < end) {
            contiguous = false;
        }
        end = view.data + view.size;
        views.push_back(view);
    }
    if (views.empty()) {
        return 0;
    }
    if (contiguous) {
        whole = std::span<byte_t>(views.front().data, static_cast<std::size_t>(end - views.front().data));
    } else {
        whole = std::span<byte_t>(views.front().data, views.front().size);
    }
    return views.size() > 1 ? views.size() : 0;
}

auto MapErrorToLockError(int ret) -> LockErrors
{
    if (ret == AVERROR(EBUSY) || ret == AVERROR(EAGAIN)) {
        return LockErrors::Busy;
    }
    if (ret == AVERROR(ENOMEM)) {
        return LockErrors::OutOfMemory;
    }
    return LockErrors::MapFailed;
}

}  // namespace

PixelBuffer::PixelBuffer(impl::FrameRef frame_ref) noexcept
    : frame_ref_(std::move(frame_ref))
{
}

PixelBuffer::~PixelBuffer()
{
}

auto PixelBuffer::Create(std::uint32_t width, std::uint32_t height, AVPixelFormat format)
    -> std::optional<PixelBuffer>
{
    auto desc = av_pix_fmt_desc_get(format);
    if (desc == nullptr || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL) || width == 0 || height == 0) {
        CK_LOG_WARNING(Buffer, "cannot create a %ux%u pixel buffer of format %d\n", width, height,
                       static_cast<int>(format));
        return std::nullopt;
    }
    auto frame = av_frame_alloc();
    if (frame == nullptr) {
        return std::nullopt;
    }
    frame->format = format;
    frame->width = static_cast<int>(width);
    frame->height = static_cast<int>(height);
    auto ret = av_frame_get_buffer(frame, 0);
    if (ret < 0) {
        CK_LOG_ERROR(Buffer, "failed to allocate a %ux%u %s pixel buffer: %s\n", width, height,
                     desc->name, log::ErrorString(ret).c_str());
        av_frame_free(&frame);
        return std::nullopt;
    }
    return AttachRawFrame(frame);
}

auto PixelBuffer::FromSurface(const Surface& surface) -> std::optional<PixelBuffer>
{
    return Retain(surface.RawFramePtr());
}

auto PixelBuffer::Retain(const RawFrameType* raw_frame) -> std::optional<PixelBuffer>
{
    if (raw_frame == nullptr) {
        return std::nullopt;
    }
    if (raw_frame->width <= 0 || raw_frame->height <= 0) {
        CK_LOG_WARNING(Buffer, "frame %p carries no image\n", raw_frame);
        return std::nullopt;
    }
    auto frame_ref = impl::FrameRef::Ref(raw_frame);
    if (!frame_ref) {
        CK_LOG_ERROR(Buffer, "failed to take a reference on pixel buffer %p\n", raw_frame);
        return std::nullopt;
    }
    return PixelBuffer{std::move(frame_ref)};
}

auto PixelBuffer::AttachRawFrame(RawFrameType* raw_frame) -> std::optional<PixelBuffer>
{
    if (raw_frame == nullptr) {
        return std::nullopt;
    }
    auto frame_ref = impl::FrameRef{raw_frame};
    if (raw_frame->width <= 0 || raw_frame->height <= 0) {
        CK_LOG_WARNING(Buffer, "frame %p carries no image\n", raw_frame);
        return std::nullopt;
    }
    return PixelBuffer{std::move(frame_ref)};
}

auto PixelBuffer::Clone() const -> PixelBuffer
{
    return PixelBuffer{frame_ref_.Clone()};
}

auto PixelBuffer::RawFramePtr() const noexcept -> RawFrameType*
{
    return frame_ref_.RawFramePtr();
}

auto PixelBuffer::Identity() const noexcept -> const void*
{
    return frame_ref_.Identity();
}

auto PixelBuffer::ReferenceCount() const noexcept -> int
{
    return frame_ref_.ReferenceCount();
}

auto PixelBuffer::IsValid() const noexcept -> bool
{
    return static_cast<bool>(frame_ref_);
}

auto PixelBuffer::Width() const noexcept -> std::uint32_t
{
    return IsValid() ? static_cast<std::uint32_t>(RawFramePtr()->width) : 0;
}

auto PixelBuffer::Height() const noexcept -> std::uint32_t
{
    return IsValid() ? static_cast<std::uint32_t>(RawFramePtr()->height) : 0;
}

auto PixelBuffer::PixelFormat() const noexcept -> AVPixelFormat
{
    return IsValid() ? static_cast<AVPixelFormat>(RawFramePtr()->format) : AV_PIX_FMT_NONE;
}

auto PixelBuffer::SoftwareFormat() const noexcept -> AVPixelFormat
{
    if (!IsValid()) {
        return AV_PIX_FMT_NONE;
    }
    auto frame = RawFramePtr();
    if (frame->hw_frames_ctx != nullptr) {
        return reinterpret_cast<const AVHWFramesContext*>(frame->hw_frames_ctx->data)->sw_format;
    }
    if (IsDrmPrime()) {
        auto layout = DrmLayoutOf(frame);
        return layout ? FourccToPixelFormat(layout->fourcc) : AV_PIX_FMT_NONE;
    }
    return PixelFormat();
}

auto PixelBuffer::IsHardware() const noexcept -> bool
{
    return IsValid() && (RawFramePtr()->hw_frames_ctx != nullptr || IsDrmPrime());
}

auto PixelBuffer::IsDrmPrime() const noexcept -> bool
{
    return PixelFormat() == AV_PIX_FMT_DRM_PRIME && RawFramePtr()->data[0] != nullptr;
}

auto PixelBuffer::BytesPerRow() const noexcept -> std::size_t
{
    if (!IsValid()) {
        return 0;
    }
    auto frame = RawFramePtr();
    if (IsDrmPrime()) {
        auto layout = DrmLayoutOf(frame);
        return layout ? layout->planes[0].pitch : 0;
    }
    if (IsHardware()) {
        auto desc = av_pix_fmt_desc_get(SoftwareFormat());
        return desc != nullptr ? Width() * PlaneElementSize(desc, 0) : 0;
    }
    return static_cast<std::size_t>(std::max(frame->linesize[0], 0));
}

auto PixelBuffer::PlaneCount() const noexcept -> std::size_t
{
    if (!IsValid()) {
        return 0;
    }
    if (IsDrmPrime()) {
        return DrmPlanes(RawFramePtr()).size();
    }
    auto count = av_pix_fmt_count_planes(SoftwareFormat());
    return count > 1 ? static_cast<std::size_t>(count) : 0;
}

auto PixelBuffer::IsPlanar() const noexcept -> bool
{
    return PlaneCount() > 1;
}

auto PixelBuffer::Plane(std::size_t index) const -> std::optional<PlaneDescriptor>
{
    if (!IsValid()) {
        return std::nullopt;
    }
    auto frame = RawFramePtr();
    if (IsDrmPrime()) {
        auto planes = DrmPlanes(frame);
        if (index >= planes.size()) {
            return std::nullopt;
        }
        return planes[index];
    }

    auto format = SoftwareFormat();
    auto desc = av_pix_fmt_desc_get(format);
    auto count = av_pix_fmt_count_planes(format);
    if (desc == nullptr || count <= 1 || index >= static_cast<std::size_t>(count)) {
        return std::nullopt;
    }
    std::size_t offset = 0;
    PlaneDescriptor plane;
    for (int i = 0; i <= static_cast<int>(index); ++i) {
        auto dims = PlaneDimensions(desc, i, Width(), Height());
        auto element_size = PlaneElementSize(desc, i);
        auto pitch = IsHardware()
            ? dims.first * element_size
            : static_cast<std::size_t>(std::max(frame->linesize[i], 0));
        if (!IsHardware()) {
            // Planes sharing one allocation report their distance from plane 0.
            auto same_buffer = av_frame_get_plane_buffer(frame, i) == av_frame_get_plane_buffer(frame, 0);
            offset = (same_buffer && frame->data[i] >= frame->data[0])
                ? static_cast<std::size_t>(frame->data[i] - frame->data[0])
                : 0;
        }
        plane = PlaneDescriptor{static_cast<std::size_t>(i), dims.first, dims.second, pitch,
                                element_size, offset, pitch * dims.second};
        if (IsHardware()) {
            offset += plane.size;
        }
    }
    return plane;
}

auto PixelBuffer::DataSize() const noexcept -> std::size_t
{
    if (!IsValid()) {
        return 0;
    }
    auto frame = RawFramePtr();
    if (IsDrmPrime()) {
        auto desc = reinterpret_cast<const AVDRMFrameDescriptor*>(frame->data[0]);
        std::size_t size = 0;
        for (int i = 0; i < desc->nb_objects; ++i) {
            size += desc->objects[i].size;
        }
        return size;
    }
    if (frame->hw_frames_ctx != nullptr) {
        auto size = av_image_get_buffer_size(SoftwareFormat(), frame->width, frame->height, 1);
        return size > 0 ? static_cast<std::size_t>(size) : 0;
    }
    std::size_t size = 0;
    for (int i = 0; i < AV_NUM_DATA_POINTERS && frame->buf[i] != nullptr; ++i) {
        size += frame->buf[i]->size;
    }
    return size;
}

auto PixelBuffer::IoSurface() const -> std::optional<Surface>
{
    if (!IsValid()) {
        return std::nullopt;
    }
    auto frame = RawFramePtr();
    if (IsDrmPrime()) {
        return Surface::Retain(frame);
    }
    if (frame->hw_frames_ctx == nullptr) {
        return std::nullopt;
    }
    auto mapped = av_frame_alloc();
    if (mapped == nullptr) {
        return std::nullopt;
    }
    mapped->format = AV_PIX_FMT_DRM_PRIME;
    auto ret = av_hwframe_map(mapped, frame, AV_HWFRAME_MAP_READ);
    if (ret < 0) {
        CK_LOG_DEBUG(Buffer, "hardware frame cannot be exported as DRM PRIME: %s\n", log::ErrorString(ret).c_str());
        av_frame_free(&mapped);
        return std::nullopt;
    }
    return Surface::AttachRawFrame(mapped);
}

auto PixelBuffer::IsBackedBySurface() const -> bool
{
    if (IsDrmPrime()) {
        return true;
    }
    return IsValid() && RawFramePtr()->hw_frames_ctx != nullptr && IoSurface().has_value();
}

auto PixelBuffer::Lock(LockMode mode, PixelBufferLockGuard& guard) const -> LockErrors
{
    if (guard.IsLocked()) {
        return LockErrors::AlreadyLocked;
    }
    if (!IsValid()) {
        return LockErrors::InvalidBuffer;
    }
    auto frame = RawFramePtr();

    if (IsDrmPrime()) {
        auto surface = IoSurface();
        if (!surface) {
            return LockErrors::InvalidBuffer;
        }
        guard.surface_ = std::make_unique<Surface>(std::move(*surface));
        auto err = guard.surface_->Lock(mode, guard.surface_guard_);
        if (err != LockErrors::Ok) {
            guard.surface_.reset();
            return err;
        }
        guard.ShareViews(guard.surface_guard_);
        guard.pixel_buffer_ = this;
        return LockErrors::Ok;
    }

    std::vector<impl::PlaneView> views;
    std::span<byte_t> whole;
    if (frame->hw_frames_ctx != nullptr) {
        auto mapped = av_frame_alloc();
        if (mapped == nullptr) {
            return LockErrors::OutOfMemory;
        }
        int flags = AV_HWFRAME_MAP_READ;
        if (mode == LockMode::ReadWrite) {
            flags |= AV_HWFRAME_MAP_WRITE;
        }
        auto ret = av_hwframe_map(mapped, frame, flags);
        if (ret < 0) {
            CK_LOG_WARNING(Buffer, "av_hwframe_map failed: %s\n", log::ErrorString(ret).c_str());
            av_frame_free(&mapped);
            return MapErrorToLockError(ret);
        }
        auto plane_count = BuildFrameViews(mapped, static_cast<AVPixelFormat>(mapped->format), views, whole);
        if (views.empty()) {
            av_frame_free(&mapped);
            return LockErrors::MapFailed;
        }
        guard.mapped_frame_ = mapped;
        guard.Assign(mode, whole, std::move(views), plane_count);
        guard.pixel_buffer_ = this;
        return LockErrors::Ok;
    }

    if (mode == LockMode::ReadWrite && !av_frame_is_writable(frame)) {
        // Other handles still see these pixels.
        return LockErrors::Busy;
    }
    auto plane_count = BuildFrameViews(frame, PixelFormat(), views, whole);
    if (views.empty()) {
        return LockErrors::InvalidBuffer;
    }
    guard.Assign(mode, whole, std::move(views), plane_count);
    guard.pixel_buffer_ = this;
    return LockErrors::Ok;
}
