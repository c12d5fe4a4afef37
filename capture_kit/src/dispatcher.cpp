/*
 *    dispatcher.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/capture_kit/dispatcher.hpp"

#include "src/log.hpp"

using namespace ck;

Dispatcher::Dispatcher(const HandlerRegistry &registry, std::string name)
    : registry_(registry), name_(std::move(name)) {}

Dispatcher::~Dispatcher() = default;

auto Dispatcher::Dispatch(SampleBuffer sample, OutputType type)
    -> std::size_t {
  auto outputs = registry_.Snapshot(type);
  if (outputs.empty()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    CK_LOG_TRACE(Dispatcher, "%s: no %s output, sample dropped\n",
                 name_.c_str(), ToString(type));
    return 0;
  }

  auto last = outputs.size() - 1;
  for (std::size_t i = 0; i < last; ++i) {
    outputs[i]->DidOutputSampleBuffer(sample.Clone(), type);
  }
  outputs[last]->DidOutputSampleBuffer(std::move(sample), type);

  dispatched_.fetch_add(1, std::memory_order_relaxed);
  return outputs.size();
}

auto Dispatcher::DispatchedCount() const noexcept -> std::uint64_t {
  return dispatched_.load(std::memory_order_relaxed);
}

auto Dispatcher::DroppedCount() const noexcept -> std::uint64_t {
  return dropped_.load(std::memory_order_relaxed);
}
