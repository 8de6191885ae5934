#ifndef __CPA_RAW_FD_UTILS__
#define __CPA_RAW_FD_UTILS__

#include "Headers.hpp"

namespace cpa {
/**
 * @brief Blocking helpers around POSIX read/write/select on raw descriptors.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN/EINTR.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true if data (or EOF/hangup) is ready to be read.
   */
  static bool waitForData(int fd, int timeoutMs);

  /** @brief Sets FD_CLOEXEC so the descriptor is not inherited on exec. */
  static void setCloseOnExec(int fd);
};
}  // namespace cpa
#endif  // __CPA_RAW_FD_UTILS__
