/*
 *    sample_buffer.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <utility>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
}

#include "include/capture_kit/pixel_buffer.hpp"
#include "include/capture_kit/sample_buffer.hpp"
#include "src/log.hpp"

using namespace ck;

SampleBuffer::SampleBuffer(impl::FrameRef frame_ref) noexcept
    : frame_ref_(std::move(frame_ref))
{
}

SampleBuffer::~SampleBuffer()
{
}

auto SampleBuffer::Retain(const RawFrameType* raw_frame) -> std::optional<SampleBuffer>
{
    if (raw_frame == nullptr) {
        return std::nullopt;
    }
    auto frame_ref = impl::FrameRef::Ref(raw_frame);
    if (!frame_ref) {
        CK_LOG_ERROR(Buffer, "failed to take a reference on sample %p\n", raw_frame);
        return std::nullopt;
    }
    return SampleBuffer{std::move(frame_ref)};
}

auto SampleBuffer::AttachRawFrame(RawFrameType* raw_frame) -> std::optional<SampleBuffer>
{
    if (raw_frame == nullptr) {
        return std::nullopt;
    }
    return SampleBuffer{impl::FrameRef{raw_frame}};
}

auto SampleBuffer::Clone() const -> SampleBuffer
{
    return SampleBuffer{frame_ref_.Clone()};
}

auto SampleBuffer::RawFramePtr() const noexcept -> RawFrameType*
{
    return frame_ref_.RawFramePtr();
}

auto SampleBuffer::Identity() const noexcept -> const void*
{
    return frame_ref_.Identity();
}

auto SampleBuffer::ReferenceCount() const noexcept -> int
{
    return frame_ref_.ReferenceCount();
}

auto SampleBuffer::IsValid() const noexcept -> bool
{
    return static_cast<bool>(frame_ref_);
}

auto SampleBuffer::IsVideo() const noexcept -> bool
{
    auto frame = RawFramePtr();
    return frame != nullptr && frame->width > 0 && frame->height > 0;
}

auto SampleBuffer::IsAudio() const noexcept -> bool
{
    auto frame = RawFramePtr();
    return frame != nullptr && frame->nb_samples > 0;
}

auto SampleBuffer::Width() const noexcept -> std::uint32_t
{
    return IsVideo() ? static_cast<std::uint32_t>(RawFramePtr()->width) : 0;
}

auto SampleBuffer::Height() const noexcept -> std::uint32_t
{
    return IsVideo() ? static_cast<std::uint32_t>(RawFramePtr()->height) : 0;
}

auto SampleBuffer::PresentationTimestamp() const noexcept -> MediaTime
{
    auto frame = RawFramePtr();
    if (frame == nullptr) {
        return MediaTime::Invalid();
    }
    return MediaTime::FromRational(frame->pts, frame->time_base);
}

auto SampleBuffer::Duration() const noexcept -> MediaTime
{
    auto frame = RawFramePtr();
    if (frame == nullptr || frame->duration <= 0) {
        return MediaTime::Invalid();
    }
    return MediaTime::FromRational(frame->duration, frame->time_base);
}

auto SampleBuffer::Info() const noexcept -> const FrameInfo*
{
    return FindFrameInfo(RawFramePtr());
}

auto SampleBuffer::Status() const noexcept -> std::optional<FrameStatus>
{
    auto info = Info();
    if (info == nullptr) {
        return std::nullopt;
    }
    return info->status;
}

auto SampleBuffer::DisplayTime() const noexcept -> std::optional<std::uint64_t>
{
    auto info = Info();
    if (info == nullptr) {
        return std::nullopt;
    }
    return info->display_time_ns;
}

auto SampleBuffer::ScaleFactor() const noexcept -> std::optional<double>
{
    auto info = Info();
    if (info == nullptr) {
        return std::nullopt;
    }
    return info->scale_factor;
}

auto SampleBuffer::ContentRect() const noexcept -> std::optional<Rect>
{
    auto info = Info();
    if (info == nullptr) {
        return std::nullopt;
    }
    return info->content_rect;
}

auto SampleBuffer::DirtyRects() const -> std::vector<Rect>
{
    auto info = Info();
    if (info == nullptr) {
        return {};
    }
    return info->dirty_rects;
}

auto SampleBuffer::NumSamples() const noexcept -> int
{
    return IsAudio() ? RawFramePtr()->nb_samples : 0;
}

auto SampleBuffer::SampleRate() const noexcept -> int
{
    return IsAudio() ? RawFramePtr()->sample_rate : 0;
}

auto SampleBuffer::ChannelCount() const noexcept -> int
{
    return IsAudio() ? RawFramePtr()->ch_layout.nb_channels : 0;
}

auto SampleBuffer::AudioBuffers() const -> std::vector<AudioBufferView>
{
    std::vector<AudioBufferView> buffers;
    if (!IsAudio()) {
        return buffers;
    }
    auto frame = RawFramePtr();
    auto format = static_cast<AVSampleFormat>(frame->format);
    auto bytes_per_sample = av_get_bytes_per_sample(format);
    auto channels = frame->ch_layout.nb_channels;
    if (bytes_per_sample <= 0 || channels <= 0 || frame->extended_data == nullptr) {
        return buffers;
    }
    auto samples = static_cast<std::size_t>(frame->nb_samples);
    if (av_sample_fmt_is_planar(format)) {
        buffers.reserve(channels);
        for (int ch = 0; ch < channels; ++ch) {
            buffers.push_back(AudioBufferView{
                1, frame->extended_data[ch], samples * bytes_per_sample});
        }
    } else {
        buffers.push_back(AudioBufferView{
            channels, frame->extended_data[0],
            samples * bytes_per_sample * static_cast<std::size_t>(channels)});
    }
    return buffers;
}

auto SampleBuffer::ImageBuffer() const -> std::optional<PixelBuffer>
{
    if (!IsVideo()) {
        return std::nullopt;
    }
    return PixelBuffer::Retain(RawFramePtr());
}
