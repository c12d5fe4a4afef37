/*
 *    dispatch_queue.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_DISPATCH_QUEUE_HPP
#define CAPTURE_KIT_DISPATCH_QUEUE_HPP

#include <string>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/executor.hpp"
#include "include/capture_kit/shared_ptr.hpp"

namespace ck {

// Serial queue backed by one dedicated thread. Work runs in submission
// order; queued work still runs when the last reference goes away.
CAPTURE_KIT_API auto CreateDispatchQueue(const std::string &name)
    -> SharedPtr<Executor>;

}  // namespace ck

#endif  // CAPTURE_KIT_DISPATCH_QUEUE_HPP
