/*
 *    handler_registry.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_HANDLER_REGISTRY_HPP
#define CAPTURE_KIT_HANDLER_REGISTRY_HPP

#include <array>
#include <cstddef>
#include <shared_mutex>
#include <vector>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/stream_output.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

constexpr HandlerId kInvalidHandlerId = 0;

// Outputs registered on one stream, kept in registration order per channel.
// Snapshots and mutations are mutually exclusive; snapshots run in parallel.
class CAPTURE_KIT_API HandlerRegistry {
 public:
  HandlerRegistry();
  ~HandlerRegistry();

  HandlerRegistry(const HandlerRegistry &other) = delete;
  auto operator=(const HandlerRegistry &other) = delete;

  // kInvalidHandlerId for a null output.
  auto Register(OutputType type, StreamOutput *output) -> HandlerId;
  auto Register(OutputType type, SharedPtr<StreamOutput> output) -> HandlerId;
  auto Unregister(HandlerId id, OutputType type) -> bool;
  auto Clear() -> void;

  auto Snapshot(OutputType type) const -> std::vector<SharedPtr<StreamOutput>>;
  auto Count(OutputType type) const -> std::size_t;
  auto Contains(HandlerId id, OutputType type) const -> bool;

  // Ids are unique within the process and never reused.
  static auto NextHandlerId() noexcept -> HandlerId;

 private:
  struct Entry {
    HandlerId id;
    SharedPtr<StreamOutput> output;
  };

  static auto Slot(OutputType type) noexcept -> std::size_t;

  mutable std::shared_mutex mutex_;
  std::array<std::vector<Entry>, kOutputTypeCount> entries_;
};

}  // namespace ck

#endif  // CAPTURE_KIT_HANDLER_REGISTRY_HPP
