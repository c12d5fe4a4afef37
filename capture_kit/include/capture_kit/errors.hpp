/*
 *    errors.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_ERRORS_HPP
#define CAPTURE_KIT_ERRORS_HPP

namespace ck {

    enum class LockErrors {
        Ok,
        Other,
        InvalidBuffer,
        AlreadyLocked,
        NotLocked,
        Busy,
        MapFailed,
        SyncFailed,
        OutOfMemory,
    };

    enum class StreamErrors {
        Ok,
        Other,
        NotRunning,
        AlreadyRunning,
        InvalidSample,
        HandlerFailed,
        StoppedBySource,
    };

    auto ToString(LockErrors err) noexcept -> const char*;
    auto ToString(StreamErrors err) noexcept -> const char*;

} // namespace ck

#endif // CAPTURE_KIT_ERRORS_HPP
