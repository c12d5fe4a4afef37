/*
 *    thread_pool.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_THREAD_POOL_HPP
#define CAPTURE_KIT_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "include/capture_kit/work.hpp"

namespace ck::threading {

// With a single thread, work runs strictly in submission order. Pending work
// is drained before the destructor returns.
class ThreadPool {
 public:
  explicit ThreadPool(std::string name, std::size_t thread_count = 1);
  ~ThreadPool();

  ThreadPool(const ThreadPool &other) = delete;
  auto operator=(const ThreadPool &other) = delete;

  auto Schedule(Work task) -> void;
  auto Name() const noexcept -> const std::string & { return name_; }

 private:
  auto Run(std::stop_token stoken) -> void;

  std::string name_;
  std::vector<std::jthread> workers_;
  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::queue<Work> tasks_;
};

}  // namespace ck::threading

#endif  // CAPTURE_KIT_THREAD_POOL_HPP
