/*
 *    handler_registry.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/capture_kit/handler_registry.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

#include "src/log.hpp"

using namespace ck;

HandlerRegistry::HandlerRegistry() = default;

HandlerRegistry::~HandlerRegistry() = default;

auto HandlerRegistry::NextHandlerId() noexcept -> HandlerId {
  static std::atomic<HandlerId> next_id{kInvalidHandlerId + 1};
  return next_id.fetch_add(1, std::memory_order_relaxed);
}

auto HandlerRegistry::Slot(OutputType type) noexcept -> std::size_t {
  return static_cast<std::size_t>(type);
}

auto HandlerRegistry::Register(OutputType type, StreamOutput *output)
    -> HandlerId {
  return Register(type, SharedPtr<StreamOutput>(output, true));
}

auto HandlerRegistry::Register(OutputType type,
                               SharedPtr<StreamOutput> output) -> HandlerId {
  if (!output) {
    CK_LOG_WARNING(Registry, "refusing to register a null %s output\n",
                   ToString(type));
    return kInvalidHandlerId;
  }
  auto id = NextHandlerId();
  {
    std::unique_lock lock(mutex_);
    entries_[Slot(type)].push_back(Entry{id, std::move(output)});
  }
  CK_LOG_DEBUG(Registry, "registered %s output %llu\n", ToString(type),
               static_cast<unsigned long long>(id));
  return id;
}

auto HandlerRegistry::Unregister(HandlerId id, OutputType type) -> bool {
  if (id == kInvalidHandlerId) {
    return false;
  }
  // Released outside the lock: the last reference may run arbitrary code.
  SharedPtr<StreamOutput> removed;
  {
    std::unique_lock lock(mutex_);
    auto &entries = entries_[Slot(type)];
    auto it = std::find_if(entries.begin(), entries.end(),
                           [id](const Entry &entry) { return entry.id == id; });
    if (it == entries.end()) {
      return false;
    }
    removed = std::move(it->output);
    entries.erase(it);
  }
  CK_LOG_DEBUG(Registry, "unregistered %s output %llu\n", ToString(type),
               static_cast<unsigned long long>(id));
  return true;
}

auto HandlerRegistry::Clear() -> void {
  std::array<std::vector<Entry>, kOutputTypeCount> removed;
  {
    std::unique_lock lock(mutex_);
    removed.swap(entries_);
  }
}

auto HandlerRegistry::Snapshot(OutputType type) const
    -> std::vector<SharedPtr<StreamOutput>> {
  std::vector<SharedPtr<StreamOutput>> outputs;
  std::shared_lock lock(mutex_);
  const auto &entries = entries_[Slot(type)];
  outputs.reserve(entries.size());
  for (const auto &entry : entries) {
    outputs.push_back(entry.output);
  }
  return outputs;
}

auto HandlerRegistry::Count(OutputType type) const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_[Slot(type)].size();
}

auto HandlerRegistry::Contains(HandlerId id, OutputType type) const -> bool {
  std::shared_lock lock(mutex_);
  const auto &entries = entries_[Slot(type)];
  return std::any_of(entries.begin(), entries.end(),
                     [id](const Entry &entry) { return entry.id == id; });
}
