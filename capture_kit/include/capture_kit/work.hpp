/*
 *    work.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_WORK_HPP
#define CAPTURE_KIT_WORK_HPP

#include <functional>

namespace ck {

using Work = std::function<void()>;

}  // namespace ck

#endif  // CAPTURE_KIT_WORK_HPP
