/*
 *    test_harness.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef CAPTURE_KIT_TEST_HARNESS_HPP
#define CAPTURE_KIT_TEST_HARNESS_HPP

#include <cstdio>
#include <exception>

extern "C" {
#include <libavutil/log.h>
}

namespace ck::test {

struct Failure {};

inline int tests_passed = 0;
inline int tests_failed = 0;

inline auto Summary() -> int {
  std::printf("\n%d passed, %d failed\n", tests_passed, tests_failed);
  return tests_failed == 0 ? 0 : 1;
}

inline auto Quiet() -> void { av_log_set_level(AV_LOG_QUIET); }

}  // namespace ck::test

#define TEST(name) static void test_##name()

#define RUN_TEST(name)                                              \
  do {                                                              \
    std::printf("Running %s...", #name);                            \
    try {                                                           \
      test_##name();                                                \
      std::printf(" passed\n");                                     \
      ++ck::test::tests_passed;                                     \
    } catch (const ck::test::Failure &) {                           \
      std::printf(" FAILED\n");                                     \
      ++ck::test::tests_failed;                                     \
    } catch (const std::exception &e) {                             \
      std::printf(" FAILED (exception: %s)\n", e.what());           \
      ++ck::test::tests_failed;                                     \
    }                                                               \
  } while (0)

#define ASSERT(cond)                                                       \
  do {                                                                     \
    if (!(cond)) {                                                         \
      std::printf("\n  ASSERTION FAILED: %s (line %d)\n", #cond, __LINE__); \
      throw ck::test::Failure{};                                           \
    }                                                                      \
  } while (0)

#define ASSERT_EQ(a, b)                                                   \
  do {                                                                    \
    if (!((a) == (b))) {                                                  \
      std::printf("\n  ASSERTION FAILED: %s != %s (line %d)\n", #a, #b,  \
                  __LINE__);                                              \
      throw ck::test::Failure{};                                          \
    }                                                                     \
  } while (0)

#endif  // CAPTURE_KIT_TEST_HARNESS_HPP
