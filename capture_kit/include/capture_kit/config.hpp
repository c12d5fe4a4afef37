/*
 *    config.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_CONFIG_HPP
#define CAPTURE_KIT_CONFIG_HPP

#define CAPTURE_KIT_PLATFORM_UNKNOWN 0
#define CAPTURE_KIT_PLATFORM_LINUX   1

#if defined(__linux__)
#define CAPTURE_KIT_PLATFORM CAPTURE_KIT_PLATFORM_LINUX
#else
#error "Unsupported platform."
#endif

#if defined(CAPTURE_KIT_SHARED) && defined(CAPTURE_KIT_EXPORTS)
#define CAPTURE_KIT_API __attribute__((visibility("default")))
#else
#define CAPTURE_KIT_API
#endif

#endif  // CAPTURE_KIT_CONFIG_HPP
