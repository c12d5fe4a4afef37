/*
 *    stream_output.cpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/capture_kit/stream_output.hpp"

namespace ck {

namespace {

class CallbackOutput : public StreamOutput {
 public:
  explicit CallbackOutput(OutputCallback callback)
      : callback_(std::move(callback)) {}

  auto DidOutputSampleBuffer(SampleBuffer sample, OutputType type)
      -> void override {
    callback_(std::move(sample), type);
  }

 private:
  OutputCallback callback_;
};

}  // namespace

auto MakeOutput(OutputCallback callback) -> SharedPtr<StreamOutput> {
  if (!callback) {
    return {};
  }
  return MakeShared<CallbackOutput>(std::move(callback));
}

}  // namespace ck
