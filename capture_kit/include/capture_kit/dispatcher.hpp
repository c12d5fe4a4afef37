/*
 *    dispatcher.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_DISPATCHER_HPP
#define CAPTURE_KIT_DISPATCHER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/handler_registry.hpp"
#include "include/capture_kit/sample_buffer.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

// Fans one sample out to every output registered for its channel. All but
// the last output receive a clone; the last one receives `sample` itself.
// Outputs run one after another on the calling thread. An exception thrown
// by an output stops the fan-out and propagates; references already handed
// out stay with their outputs and nothing is cloned for the rest.
class CAPTURE_KIT_API Dispatcher {
 public:
  Dispatcher(const HandlerRegistry &registry, std::string name);
  ~Dispatcher();

  // Returns the number of outputs that were invoked.
  auto Dispatch(SampleBuffer sample, OutputType type) -> std::size_t;

  auto DispatchedCount() const noexcept -> std::uint64_t;
  auto DroppedCount() const noexcept -> std::uint64_t;

 private:
  const HandlerRegistry &registry_;
  std::string name_;
  std::atomic<std::uint64_t> dispatched_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace ck

#endif  // CAPTURE_KIT_DISPATCHER_HPP
