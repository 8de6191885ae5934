#ifndef __CPA_TEST_HEADERS__
#define __CPA_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch.hpp>
#include <functional>

namespace cpa {
/**
 * @brief Polls `condition` every 20ms until it holds or `timeoutMs` passes.
 * @return The last value of `condition`.
 */
inline bool waitUntil(const std::function<bool()>& condition,
                      int timeoutMs = 10000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return condition();
}

/** @brief Creates a fresh directory under the temp dir. */
inline string makeTempDirectory(const string& prefix) {
  string pattern = GetTempDirectory() + prefix + "_XXXXXXXX";
  char* created = mkdtemp(&pattern[0]);
  if (!created) {
    throw std::runtime_error("mkdtemp failed: " + string(strerror(errno)));
  }
  return string(created);
}
}  // namespace cpa

#endif  // __CPA_TEST_HEADERS__
