/*
 *    frame_ref.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <new>
#include <utility>

extern "C" {
#include <libavutil/buffer.h>
}

#include "include/capture_kit/frame_ref.hpp"

using namespace ck::impl;

FrameRef::FrameRef(RawFrameType* raw_frame) noexcept
    : raw_frame_(raw_frame)
{
}

FrameRef::FrameRef(FrameRef&& other) noexcept
    : raw_frame_(std::exchange(other.raw_frame_, nullptr))
{
}

auto FrameRef::operator=(FrameRef&& other) noexcept -> FrameRef&
{
    if (this != &other) {
        Reset();
        raw_frame_ = std::exchange(other.raw_frame_, nullptr);
    }
    return *this;
}

FrameRef::~FrameRef()
{
    Reset();
}

auto FrameRef::Clone() const -> FrameRef
{
    if (raw_frame_ == nullptr) {
        return FrameRef{};
    }
    auto cloned = av_frame_clone(raw_frame_);
    if (cloned == nullptr) {
        throw std::bad_alloc();
    }
    return FrameRef{cloned};
}

auto FrameRef::Reset() noexcept -> void
{
    if (raw_frame_ != nullptr) {
        av_frame_unref(raw_frame_);
        av_frame_free(&raw_frame_);
    }
}

auto FrameRef::RawFramePtr() const noexcept -> RawFrameType*
{
    return raw_frame_;
}

auto FrameRef::ReferenceCount() const noexcept -> int
{
    if (raw_frame_ == nullptr || raw_frame_->buf[0] == nullptr) {
        return 0;
    }
    return av_buffer_get_ref_count(raw_frame_->buf[0]);
}

auto FrameRef::Identity() const noexcept -> const void*
{
    if (raw_frame_ == nullptr) {
        return nullptr;
    }
    if (raw_frame_->buf[0] != nullptr) {
        return raw_frame_->buf[0]->data;
    }
    return raw_frame_->data[0];
}

auto FrameRef::Ref(const RawFrameType* raw_frame) noexcept -> FrameRef
{
    if (raw_frame == nullptr) {
        return FrameRef{};
    }
    auto dst = av_frame_alloc();
    if (dst == nullptr) {
        return FrameRef{};
    }
    if (av_frame_ref(dst, raw_frame) < 0) {
        av_frame_free(&dst);
        return FrameRef{};
    }
    return FrameRef{dst};
}
