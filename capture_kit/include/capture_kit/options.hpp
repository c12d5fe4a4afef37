/*
 *    options.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_OPTIONS_HPP
#define CAPTURE_KIT_OPTIONS_HPP

#include <string>

#include "include/capture_kit/executor.hpp"

namespace ck {

    struct StreamOptions {
        // Shows up in log lines.
        std::string name = "stream";
        // Samples are dispatched on the producer's thread when null.
        Executor* delivery_queue = nullptr;
    };

    struct AllocatorOptions {
        // Turn memfd allocations into real dma-bufs through /dev/udmabuf.
        bool use_udmabuf = true;
        int row_alignment = 64;
    };

} // namespace ck

#endif // CAPTURE_KIT_OPTIONS_HPP
