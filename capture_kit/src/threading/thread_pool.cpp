/*
 *    thread_pool.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "src/threading/thread_pool.hpp"

#include <pthread.h>

#include <exception>

#include "src/log.hpp"

using namespace ck::threading;

ThreadPool::ThreadPool(std::string name, std::size_t thread_count)
    : name_(std::move(name)) {
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this](std::stop_token stoken) { Run(stoken); });
  }
}

ThreadPool::~ThreadPool() {
  for (auto &worker : workers_) {
    worker.request_stop();
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    worker.join();
  }
}

auto ThreadPool::Run(std::stop_token stoken) -> void {
  // Linux limits thread names to 15 characters.
  auto thread_name = name_.substr(0, 15);
  pthread_setname_np(pthread_self(), thread_name.c_str());

  for (;;) {
    Work task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, stoken, [this] { return !tasks_.empty(); });
      if (tasks_.empty()) {
        // Stop requested and nothing left to drain.
        break;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    try {
      task();
    } catch (const std::exception &e) {
      CK_LOG_ERROR(Stream, "%s: queued work threw: %s\n", name_.c_str(),
                   e.what());
    }
  }
}

auto ThreadPool::Schedule(Work task) -> void {
  {
    std::lock_guard lg(mutex_);
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}
