#ifndef __AGT_DAEMON_CREATOR_H__
#define __AGT_DAEMON_CREATOR_H__

#include "Headers.hpp"

namespace agt {
/**
 * @brief Detaches the server from its controlling terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Double-forks into a new session and points stdio at /dev/null.
   *
   * SIGCHLD keeps its default disposition so terminal children can still be
   * reaped. Relative paths must be made absolute before calling this, since
   * the daemon runs from `/`.
   *
   * @param terminateParent Whether the original process exits right away.
   * @param childPidFile Written with the daemon's pid when not empty.
   * @return PARENT inside the original process, CHILD inside the daemon.
   */
  static int create(bool terminateParent, const string& childPidFile);

  /** @brief Returned from `create()` inside the original process. */
  static const int PARENT = 1;
  /** @brief Returned from `create()` inside the daemon. */
  static const int CHILD = 2;

 protected:
  static void writePidFile(const string& childPidFile);
};
}  // namespace agt

#endif  // __AGT_DAEMON_CREATOR_H__
