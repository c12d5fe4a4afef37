/*
 *    lock_guard.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <utility>

#include "include/capture_kit/lock_guard.hpp"
#include "src/log.hpp"

namespace ck::impl {

LockedRegion::LockedRegion(LockedRegion&& other) noexcept
    : locked_(std::exchange(other.locked_, false))
    , mode_(other.mode_)
    , whole_(std::exchange(other.whole_, {}))
    , planes_(std::move(other.planes_))
    , plane_count_(std::exchange(other.plane_count_, 0))
{
    other.planes_.clear();
}

auto LockedRegion::operator=(LockedRegion&& other) noexcept -> LockedRegion&
{
    if (this != &other) {
        locked_ = std::exchange(other.locked_, false);
        mode_ = other.mode_;
        whole_ = std::exchange(other.whole_, {});
        planes_ = std::move(other.planes_);
        other.planes_.clear();
        plane_count_ = std::exchange(other.plane_count_, 0);
    }
    return *this;
}

auto LockedRegion::Assign(LockMode mode, std::span<byte_t> whole,
                          std::vector<PlaneView> planes, std::size_t plane_count) -> void
{
    locked_ = true;
    mode_ = mode;
    whole_ = whole;
    planes_ = std::move(planes);
    plane_count_ = plane_count;
}

auto LockedRegion::ShareViews(const LockedRegion& other) -> void
{
    Assign(other.mode_, other.whole_, other.planes_, other.plane_count_);
}

auto LockedRegion::Clear() noexcept -> void
{
    locked_ = false;
    whole_ = {};
    planes_.clear();
    plane_count_ = 0;
}

auto LockedRegion::ViewOf(std::size_t index) const noexcept -> const PlaneView*
{
    if (!locked_ || index >= planes_.size()) {
        return nullptr;
    }
    return &planes_[index];
}

auto LockedRegion::Width() const noexcept -> std::uint32_t
{
    auto view = ViewOf(0);
    return view != nullptr ? view->width : 0;
}

auto LockedRegion::Height() const noexcept -> std::uint32_t
{
    auto view = ViewOf(0);
    return view != nullptr ? view->height : 0;
}

auto LockedRegion::BytesPerRow() const noexcept -> std::size_t
{
    auto view = ViewOf(0);
    return view != nullptr ? view->bytes_per_row : 0;
}

auto LockedRegion::AsSlice() const noexcept -> std::span<const byte_t>
{
    if (!locked_) {
        return {};
    }
    return whole_;
}

auto LockedRegion::AsMutSlice() const noexcept -> std::optional<std::span<byte_t>>
{
    if (!locked_ || mode_ != LockMode::ReadWrite) {
        return std::nullopt;
    }
    return whole_;
}

auto LockedRegion::Row(std::uint32_t y) const noexcept -> std::optional<std::span<const byte_t>>
{
    auto view = ViewOf(0);
    if (view == nullptr || y >= view->height) {
        return std::nullopt;
    }
    return std::span<const byte_t>(view->data + y * view->bytes_per_row, view->bytes_per_row);
}

auto LockedRegion::RowMut(std::uint32_t y) const noexcept -> std::optional<std::span<byte_t>>
{
    if (mode_ != LockMode::ReadWrite) {
        return std::nullopt;
    }
    auto view = ViewOf(0);
    if (view == nullptr || y >= view->height) {
        return std::nullopt;
    }
    return std::span<byte_t>(view->data + y * view->bytes_per_row, view->bytes_per_row);
}

auto LockedRegion::Plane(std::size_t index) const noexcept -> std::optional<std::span<const byte_t>>
{
    if (index >= plane_count_) {
        return std::nullopt;
    }
    auto view = ViewOf(index);
    if (view == nullptr) {
        return std::nullopt;
    }
    return std::span<const byte_t>(view->data, view->size);
}

auto LockedRegion::PlaneMut(std::size_t index) const noexcept -> std::optional<std::span<byte_t>>
{
    if (mode_ != LockMode::ReadWrite || index >= plane_count_) {
        return std::nullopt;
    }
    auto view = ViewOf(index);
    if (view == nullptr) {
        return std::nullopt;
    }
    return std::span<byte_t>(view->data, view->size);
}

auto LockedRegion::PlaneRow(std::size_t index, std::uint32_t y) const noexcept
    -> std::optional<std::span<const byte_t>>
{
    if (index >= plane_count_) {
        return std::nullopt;
    }
    auto view = ViewOf(index);
    if (view == nullptr || y >= view->height) {
        return std::nullopt;
    }
    return std::span<const byte_t>(view->data + y * view->bytes_per_row, view->bytes_per_row);
}

auto LockedRegion::PixelAt(std::uint32_t x, std::uint32_t y) const noexcept
    -> std::optional<std::span<const byte_t>>
{
    auto view = ViewOf(0);
    if (view == nullptr || view->bytes_per_element == 0 || x >= view->width || y >= view->height) {
        return std::nullopt;
    }
    auto offset = y * view->bytes_per_row + x * view->bytes_per_element;
    if (offset + view->bytes_per_element > view->size) {
        return std::nullopt;
    }
    return std::span<const byte_t>(view->data + offset, view->bytes_per_element);
}

auto LockedRegion::Cursor() const noexcept -> BufferCursor
{
    return BufferCursor{AsSlice()};
}

}  // namespace ck::impl

using namespace ck;

SurfaceLockGuard::SurfaceLockGuard(SurfaceLockGuard&& other) noexcept
    : impl::LockedRegion(std::move(other))
    , surface_(std::exchange(other.surface_, nullptr))
    , backend_(std::move(other.backend_))
    , mappings_(std::move(other.mappings_))
{
    other.mappings_.clear();
}

auto SurfaceLockGuard::operator=(SurfaceLockGuard&& other) noexcept -> SurfaceLockGuard&
{
    if (this != &other) {
        Unlock();
        impl::LockedRegion::operator=(std::move(other));
        surface_ = std::exchange(other.surface_, nullptr);
        backend_ = std::move(other.backend_);
        mappings_ = std::move(other.mappings_);
        other.mappings_.clear();
    }
    return *this;
}

SurfaceLockGuard::~SurfaceLockGuard()
{
    Unlock();
}

auto SurfaceLockGuard::Unlock() noexcept -> LockErrors
{
    if (!IsLocked()) {
        return LockErrors::NotLocked;
    }
    auto mode = Mode();
    auto err = LockErrors::Ok;
    for (auto& mapping : mappings_) {
        if (mapping.access_begun && backend_->EndAccess(mapping.fd, mode) < 0) {
            CK_LOG_WARNING(Surface, "end %s access on fd %d failed\n", ToString(mode), mapping.fd);
            err = LockErrors::SyncFailed;
        }
        backend_->Unmap(mapping.address, mapping.size);
    }
    mappings_.clear();
    backend_.Reset();
    surface_ = nullptr;
    Clear();
    return err;
}

PixelBufferLockGuard::PixelBufferLockGuard(PixelBufferLockGuard&& other) noexcept
    : impl::LockedRegion(std::move(other))
    , pixel_buffer_(std::exchange(other.pixel_buffer_, nullptr))
    , mapped_frame_(std::exchange(other.mapped_frame_, nullptr))
    , surface_(std::move(other.surface_))
    , surface_guard_(std::move(other.surface_guard_))
{
}

auto PixelBufferLockGuard::operator=(PixelBufferLockGuard&& other) noexcept -> PixelBufferLockGuard&
{
    if (this != &other) {
        Unlock();
        impl::LockedRegion::operator=(std::move(other));
        pixel_buffer_ = std::exchange(other.pixel_buffer_, nullptr);
        mapped_frame_ = std::exchange(other.mapped_frame_, nullptr);
        surface_ = std::move(other.surface_);
        surface_guard_ = std::move(other.surface_guard_);
    }
    return *this;
}

PixelBufferLockGuard::~PixelBufferLockGuard()
{
    Unlock();
}

auto PixelBufferLockGuard::Unlock() noexcept -> LockErrors
{
    if (!IsLocked()) {
        return LockErrors::NotLocked;
    }
    auto err = LockErrors::Ok;
    if (surface_guard_.IsLocked()) {
        err = surface_guard_.Unlock();
    }
    surface_.reset();
    if (mapped_frame_ != nullptr) {
        // Freeing the mapped frame releases the hardware mapping.
        av_frame_free(&mapped_frame_);
    }
    pixel_buffer_ = nullptr;
    Clear();
    return err;
}
