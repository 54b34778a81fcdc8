#ifndef __AGT_RAW_FD_UTILS__
#define __AGT_RAW_FD_UTILS__

#include "Headers.hpp"

namespace agt {
/**
 * @brief Small wrappers around POSIX descriptor calls used on pty masters.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to a (possibly non-blocking) descriptor.
   *
   * EAGAIN is retried with a short sleep, up to `maxWaitMs` in total.
   * Throws std::runtime_error when the descriptor is closed, fails, or stays
   * full for longer than `maxWaitMs`.
   */
  static void writeAll(int fd, const char* buf, size_t count,
                       int maxWaitMs = 2000);

  /** @brief Adds O_NONBLOCK to the descriptor flags. */
  static void setNonBlocking(int fd);

  /** @brief Sets FD_CLOEXEC so spawned children never inherit `fd`. */
  static void setCloseOnExec(int fd);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true when readable, false on timeout or EINTR.
   */
  static bool waitForReadable(int fd, int timeoutMs);

  /** @brief Number of descriptors currently open in this process. */
  static int countOpenFds();
};
}  // namespace agt
#endif  // __AGT_RAW_FD_UTILS__
