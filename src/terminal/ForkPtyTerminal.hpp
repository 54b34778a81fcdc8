#ifndef __AGT_FORK_PTY_TERMINAL_HPP__
#define __AGT_FORK_PTY_TERMINAL_HPP__

#include "PseudoTerminal.hpp"

namespace agt {
/**
 * @brief POSIX PseudoTerminal built on forkpty(3).
 */
class ForkPtyTerminal : public PseudoTerminal {
 public:
  ForkPtyTerminal();
  /** @brief Kills and reaps a child that was never torn down. */
  virtual ~ForkPtyTerminal();

  virtual int spawn(const SpawnRequest& request, int cols, int rows);
  virtual int getFd();
  virtual pid_t getPid();
  virtual void write(const string& data);
  virtual void setWindowSize(int cols, int rows);
  virtual bool sendSignal(int signo);
  virtual bool hasExited();
  virtual void terminate(int graceMs);
  virtual void closeFd();
  virtual bool reap(int boundMs);

 protected:
  /** @brief Runs in the forked child; never returns. */
  void execChild(char* const* argv, char* const* envp, const char* workingDir,
                 const string& chdirWarning, const string& execError,
                 int maxFd);

  /** @brief Guards `masterFd` against writes racing a close. */
  recursive_mutex fdMutex;
  /** @brief Guards `pid`, `reaped` and `exitStatus`. */
  recursive_mutex pidMutex;
  int masterFd;
  pid_t pid;
  bool reaped;
  int exitStatus;
};
}  // namespace agt

#endif  // __AGT_FORK_PTY_TERMINAL_HPP__
