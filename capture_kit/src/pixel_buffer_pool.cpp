/*
 *    pixel_buffer_pool.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <new>
#include <utility>

extern "C" {
#include <libavutil/buffer.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/mem.h>
#include <libavutil/pixdesc.h>
}

#include "include/capture_kit/pixel_buffer_pool.hpp"
#include "src/log.hpp"

using namespace ck;

namespace {

constexpr int kLinesizeAlign = 64;

// Outlives the pool: buffers handed out before a Flush() or before the pool
// goes away still decrement it when they are finally freed.
struct AllocationCounter {
    std::atomic<std::size_t> live{0};
};

void FreePooledBuffer(void* opaque, std::uint8_t* data)
{
    auto counter = static_cast<std::shared_ptr<AllocationCounter>*>(opaque);
    (*counter)->live.fetch_sub(1, std::memory_order_acq_rel);
    delete counter;
    av_free(data);
}

class PixelBufferPoolImpl : public PixelBufferPool {
public:
    PixelBufferPoolImpl(const PixelBufferPoolOptions& options, std::size_t buffer_size)
        : options_(options)
        , buffer_size_(buffer_size)
        , counter_(std::make_shared<AllocationCounter>())
    {
    }

    ~PixelBufferPoolImpl() noexcept override
    {
        av_buffer_pool_uninit(&pool_);
    }

    auto Init() -> bool
    {
        pool_ = NewPool();
        return pool_ != nullptr;
    }

    auto CreatePixelBuffer() -> std::optional<PixelBuffer> override
    {
        AVBufferRef* buf = nullptr;
        {
            std::lock_guard lg(mutex_);
            buf = av_buffer_pool_get(pool_);
        }
        if (buf == nullptr) {
            CK_LOG_DEBUG(Buffer, "pixel buffer pool exhausted at %zu buffers\n", AllocatedCount());
            return std::nullopt;
        }
        auto frame = av_frame_alloc();
        if (frame == nullptr) {
            av_buffer_unref(&buf);
            return std::nullopt;
        }
        frame->buf[0] = buf;
        frame->format = options_.format;
        frame->width = static_cast<int>(options_.width);
        frame->height = static_cast<int>(options_.height);
        auto ret = av_image_fill_arrays(frame->data, frame->linesize, buf->data, options_.format,
                                        frame->width, frame->height, kLinesizeAlign);
        if (ret < 0) {
            CK_LOG_ERROR(Buffer, "failed to lay out pooled pixel buffer: %s\n",
                         log::ErrorString(ret).c_str());
            av_frame_free(&frame);
            return std::nullopt;
        }
        return PixelBuffer::AttachRawFrame(frame);
    }

    auto Flush() -> void override
    {
        auto fresh = NewPool();
        if (fresh == nullptr) {
            CK_LOG_ERROR(Buffer, "failed to replace pixel buffer pool, idle buffers are kept\n");
            return;
        }
        {
            std::lock_guard lg(mutex_);
            std::swap(pool_, fresh);
        }
        av_buffer_pool_uninit(&fresh);
    }

    auto Options() const noexcept -> const PixelBufferPoolOptions& override
    {
        return options_;
    }

    auto BufferSize() const noexcept -> std::size_t override
    {
        return buffer_size_;
    }

    auto AllocatedCount() const noexcept -> std::size_t override
    {
        return counter_->live.load(std::memory_order_acquire);
    }

private:
    static auto Allocate(void* opaque, std::size_t size) -> AVBufferRef*
    {
        return static_cast<PixelBufferPoolImpl*>(opaque)->AllocateBuffer(size);
    }

    auto NewPool() -> AVBufferPool*
    {
        return av_buffer_pool_init2(buffer_size_, this, &PixelBufferPoolImpl::Allocate, nullptr);
    }

    // Runs under the lock of the AVBufferPool that asked for it.
    auto AllocateBuffer(std::size_t size) -> AVBufferRef*
    {
        auto live = counter_->live.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (options_.max_buffers != 0 && live > options_.max_buffers) {
            counter_->live.fetch_sub(1, std::memory_order_acq_rel);
            return nullptr;
        }
        auto data = static_cast<std::uint8_t*>(av_malloc(size));
        auto holder = data != nullptr ? new (std::nothrow) std::shared_ptr<AllocationCounter>(counter_)
                                      : nullptr;
        auto buf = holder != nullptr ? av_buffer_create(data, size, FreePooledBuffer, holder, 0)
                                     : nullptr;
        if (buf == nullptr) {
            CK_LOG_ERROR(Buffer, "out of memory allocating a %zu byte pixel buffer\n", size);
            delete holder;
            av_free(data);
            counter_->live.fetch_sub(1, std::memory_order_acq_rel);
            return nullptr;
        }
        return buf;
    }

    PixelBufferPoolOptions options_;
    std::size_t buffer_size_;
    std::shared_ptr<AllocationCounter> counter_;
    std::mutex mutex_;
    AVBufferPool* pool_ = nullptr;
};

}  // namespace

auto ck::CreatePixelBufferPool(const PixelBufferPoolOptions& options) -> SharedPtr<PixelBufferPool>
{
    auto desc = av_pix_fmt_desc_get(options.format);
    if (desc == nullptr || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL) || options.width == 0 ||
        options.height == 0) {
        CK_LOG_WARNING(Buffer, "cannot pool %ux%u pixel buffers of format %d\n", options.width,
                       options.height, static_cast<int>(options.format));
        return {};
    }
    auto size = av_image_get_buffer_size(options.format, static_cast<int>(options.width),
                                         static_cast<int>(options.height), kLinesizeAlign);
    if (size <= 0) {
        CK_LOG_WARNING(Buffer, "%ux%u %s pixel buffers have no size: %s\n", options.width,
                       options.height, desc->name, log::ErrorString(size).c_str());
        return {};
    }
    auto pool = MakeShared<PixelBufferPoolImpl>(options, static_cast<std::size_t>(size));
    if (!pool->Init()) {
        CK_LOG_ERROR(Buffer, "failed to create a pool of %ux%u %s pixel buffers\n", options.width,
                     options.height, desc->name);
        return {};
    }
    CK_LOG_DEBUG(Buffer, "pool of %ux%u %s pixel buffers, %d bytes each\n", options.width,
                 options.height, desc->name, size);
    return pool;
}
