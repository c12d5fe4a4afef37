/*
 *    stream_output.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_STREAM_OUTPUT_HPP
#define CAPTURE_KIT_STREAM_OUTPUT_HPP

#include <functional>

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/ref_counted.hpp"
#include "include/capture_kit/sample_buffer.hpp"
#include "include/capture_kit/shared_ptr.hpp"
#include "include/capture_kit/types.hpp"

namespace ck {

// Consumer of dispatched samples. Each call owns `sample`; keep it (move it
// somewhere) to use it after returning.
class CAPTURE_KIT_API StreamOutput : public RefCounted {
 public:
  virtual ~StreamOutput() noexcept {}
  virtual auto DidOutputSampleBuffer(SampleBuffer sample, OutputType type)
      -> void = 0;
};

using OutputCallback = std::function<void(SampleBuffer, OutputType)>;

CAPTURE_KIT_API auto MakeOutput(OutputCallback callback)
    -> SharedPtr<StreamOutput>;

}  // namespace ck

#endif  // CAPTURE_KIT_STREAM_OUTPUT_HPP
