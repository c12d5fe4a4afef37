/*
 *    ref_counted.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_REF_COUNTED_HPP
#define CAPTURE_KIT_REF_COUNTED_HPP

#include <atomic>
#include <cstdint>

namespace ck {

class RefCounted {
 public:
  virtual ~RefCounted() noexcept {};
  virtual auto AddRef() -> std::int64_t = 0;
  virtual auto Release() -> void = 0;
};

// Intrusive counter for implementations that are created with `new` and
// destroyed by their last Release().
template <typename Base>
class RefCountedObject : public Base {
 public:
  using Base::Base;

  auto AddRef() -> std::int64_t override {
    return ref_count_.fetch_add(1, std::memory_order_relaxed) + 1;
  }

  auto Release() -> void override {
    if (ref_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete this;
    }
  }

 private:
  std::atomic<std::int64_t> ref_count_{1};
};

}  // namespace ck

#endif  // CAPTURE_KIT_REF_COUNTED_HPP
