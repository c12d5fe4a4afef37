/*
 *    dispatch_queue.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/capture_kit/dispatch_queue.hpp"

#include "src/threading/thread_pool.hpp"

namespace ck {

namespace {

class SerialQueueExecutor : public Executor {
 public:
  explicit SerialQueueExecutor(const std::string &name) : pool_(name, 1) {}

  auto Dispatch(const Work &work) -> void override { pool_.Schedule(work); }

 private:
  threading::ThreadPool pool_;
};

}  // namespace

auto CreateDispatchQueue(const std::string &name) -> SharedPtr<Executor> {
  return MakeShared<SerialQueueExecutor>(name);
}

}  // namespace ck
