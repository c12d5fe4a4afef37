/*
 *    executor.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_EXECUTOR_HPP
#define CAPTURE_KIT_EXECUTOR_HPP

#include "include/capture_kit/config.hpp"
#include "include/capture_kit/ref_counted.hpp"
#include "include/capture_kit/work.hpp"

namespace ck {

    // Queue on which a stream delivers its samples when the caller opts out
    // of the producer's own thread.
    class CAPTURE_KIT_API Executor
        : public RefCounted {
    public:
        virtual ~Executor() {};

        virtual auto Dispatch(const Work& work) -> void = 0;
    };

}// namespace ck

#endif // CAPTURE_KIT_EXECUTOR_HPP
