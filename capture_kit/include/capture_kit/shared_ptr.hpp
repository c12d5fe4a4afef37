/*
 *    shared_ptr.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_SHARED_PTR_HPP
#define CAPTURE_KIT_SHARED_PTR_HPP

#include <type_traits>
#include <utility>

#include "include/capture_kit/ref_counted.hpp"

namespace ck {

    // Strong reference on a RefCounted object. Pass add_ref = false to adopt
    // a reference the caller already owns.
    template <typename T>
    class SharedPtr {
        static_assert(std::is_base_of_v<RefCounted, T>, "T must derive from RefCounted");

    public:
        SharedPtr() : ptr_(nullptr) {}

        SharedPtr(T* ptr, bool add_ref) : ptr_(ptr) {
            if (add_ref && ptr_) {
                ptr_->AddRef();
            }
        }

        SharedPtr(const SharedPtr<T>& other) : ptr_(other.ptr_) {
            if (ptr_) {
                ptr_->AddRef();
            }
        }

        SharedPtr(SharedPtr<T>&& other) noexcept : ptr_(other.ptr_) {
            other.ptr_ = nullptr;
        }

        template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
        SharedPtr(SharedPtr<U>&& other) noexcept : ptr_(other.Detach()) {}

        ~SharedPtr() {
            Reset();
        }

        SharedPtr<T>& operator=(const SharedPtr<T>& other) {
            if (this != &other) {
                if (other.ptr_) {
                    other.ptr_->AddRef();
                }
                Reset();
                ptr_ = other.ptr_;
            }
            return *this;
        }

        SharedPtr<T>& operator=(SharedPtr<T>&& other) noexcept {
            if (this != &other) {
                Reset();
                ptr_ = other.ptr_;
                other.ptr_ = nullptr;
            }
            return *this;
        }

        auto Reset() -> void {
            if (ptr_) {
                auto ptr = ptr_;
                ptr_ = nullptr;
                ptr->Release();
            }
        }

        // Gives up ownership without releasing.
        auto Detach() noexcept -> T* {
            auto ptr = ptr_;
            ptr_ = nullptr;
            return ptr;
        }

        T* get() const { return ptr_; }
        T& operator*() const { return *ptr_; }
        T* operator->() const { return ptr_; }

        explicit operator bool() const { return ptr_ != nullptr; }

    private:
        T* ptr_;
    };

    template <typename T, typename... Args>
    SharedPtr<T> MakeShared(Args&&... args) {
        return SharedPtr<T>(new RefCountedObject<T>(std::forward<Args>(args)...), false);
    }

} // namespace ck

#endif // CAPTURE_KIT_SHARED_PTR_HPP
