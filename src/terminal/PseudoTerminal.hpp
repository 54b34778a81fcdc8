#ifndef __AGT_PSEUDO_TERMINAL_HPP__
#define __AGT_PSEUDO_TERMINAL_HPP__

#include "Headers.hpp"

namespace agt {
/**
 * @brief A child process attached to the slave side of a pseudo-terminal.
 *
 * Implementations own both the process and the master descriptor. Every
 * method is safe to call after the child has exited or the descriptor has
 * been closed.
 */
class PseudoTerminal {
 public:
  virtual ~PseudoTerminal() {}

  /**
   * @brief Starts the child described by `request` with the given geometry.
   * @returns The master descriptor, already in non-blocking mode.
   * Throws std::runtime_error when no terminal could be allocated.
   */
  virtual int spawn(const SpawnRequest& request, int cols, int rows) = 0;

  /** @brief Master descriptor, or -1 once closed. */
  virtual int getFd() = 0;

  /** @brief Process id of the child, or -1 before spawn. */
  virtual pid_t getPid() = 0;

  /**
   * @brief Writes bytes to the terminal input.
   * Throws std::runtime_error on a closed descriptor or a write failure.
   */
  virtual void write(const string& data) = 0;

  /**
   * @brief Applies a window geometry with TIOCSWINSZ.
   * Throws std::runtime_error when the ioctl fails.
   */
  virtual void setWindowSize(int cols, int rows) = 0;

  /**
   * @brief Sends a signal to the child.
   * @returns false when the child is already gone.
   */
  virtual bool sendSignal(int signo) = 0;

  /** @brief Non-blocking check (and reap) of the child's exit. */
  virtual bool hasExited() = 0;

  /**
   * @brief SIGTERM, wait `graceMs`, then SIGKILL if the child is still alive.
   */
  virtual void terminate(int graceMs) = 0;

  /** @brief Closes the master descriptor. Idempotent. */
  virtual void closeFd() = 0;

  /**
   * @brief Collects the child's exit status, polling for at most `boundMs`.
   * @returns true when the child has been reaped.
   */
  virtual bool reap(int boundMs) = 0;
};

/** @brief Creates the platform's PseudoTerminal implementation. */
typedef std::function<shared_ptr<PseudoTerminal>()> PseudoTerminalFactory;
}  // namespace agt

#endif  // __AGT_PSEUDO_TERMINAL_HPP__
