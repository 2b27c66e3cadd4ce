#ifndef __AT_TEST_HEADERS__
#define __AT_TEST_HEADERS__

#include "Headers.hpp"
#include "SessionError.hpp"

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

namespace at {
/**
 * @brief Polls `condition` every few milliseconds until it holds or
 * `timeout` passes.  Returns the final value of the condition.
 */
inline bool waitFor(const function<bool()>& condition,
                    chrono::milliseconds timeout = chrono::seconds(5)) {
  auto deadline = chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (chrono::steady_clock::now() >= deadline) {
      return condition();
    }
    std::this_thread::sleep_for(chrono::milliseconds(5));
  }
  return true;
}

/**
 * @brief Runs `f` and returns the code of the SessionError it throws.
 * Fails the test if nothing (or something else) is thrown.
 */
inline ErrorCode errorCodeOf(const function<void()>& f) {
  try {
    f();
  } catch (const SessionError& se) {
    return se.getCode();
  }
  FAIL("Expected a SessionError");
  return ErrorCode::INTERNAL_ERROR;
}

/** @brief Creates a fresh directory under the system temp directory. */
inline string makeTempDirectory(const string& prefix) {
  string pattern = GetTempDirectory() + prefix + "_XXXXXXXX";
  FATAL_FAIL(mkdtemp(&pattern[0]) == NULL ? -1 : 0);
  return pattern;
}
}  // namespace at

#endif  // __AT_TEST_HEADERS__
