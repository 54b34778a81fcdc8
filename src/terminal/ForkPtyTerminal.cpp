#include "ForkPtyTerminal.hpp"

#include "RawFdUtils.hpp"

namespace agt {
ForkPtyTerminal::ForkPtyTerminal()
    : masterFd(-1), pid(-1), reaped(false), exitStatus(0) {}

ForkPtyTerminal::~ForkPtyTerminal() {
  if (pid > 0 && !reaped) {
    LOG(WARNING) << "Terminal child " << pid
                 << " still alive at destruction, killing it";
    sendSignal(SIGKILL);
  }
  closeFd();
  if (pid > 0 && !reaped) {
    reap(TEARDOWN_REAP_BOUND_MS);
  }
}

int ForkPtyTerminal::spawn(const SpawnRequest& request, int cols, int rows) {
  if (request.argv_size() == 0) {
    throw std::runtime_error("Cannot spawn a terminal without a command");
  }

  // Only async-signal-safe calls are allowed between fork and exec in a
  // threaded process, so every string the child needs is built here.
  vector<string> argvStorage(request.argv().begin(), request.argv().end());
  vector<char*> argv;
  for (auto& arg : argvStorage) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(NULL);

  vector<string> envStorage;
  for (int a = 0; a < request.environment_names_size(); a++) {
    envStorage.push_back(request.environment_names(a) + "=" +
                         request.environment_values(a));
  }
  vector<char*> envp;
  for (auto& entry : envStorage) {
    envp.push_back(&entry[0]);
  }
  envp.push_back(NULL);

  const string workingDir = request.working_directory();
  const string chdirWarning = "Warning: Could not change to working directory " +
                              workingDir + ", staying in the server's\r\n";
  const string execError =
      "Cannot execute " + argvStorage[0] + ": " + "command failed to start\r\n";

  // Computed before forking: sysconf is not async-signal-safe.
  long maxFd = ::sysconf(_SC_OPEN_MAX);
  if (maxFd < 0) {
    maxFd = 1024;
  }

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)cols;
  win.ws_row = (unsigned short)rows;

  int fd = -1;
  pid_t childPid = forkpty(&fd, NULL, NULL, &win);
  switch (childPid) {
    case -1:
      throw std::runtime_error(string("forkpty failed: ") + strerror(errno));
    case 0:
      execChild(argv.data(), envp.data(),
                workingDir.empty() ? NULL : workingDir.c_str(), chdirWarning,
                execError, int(maxFd));
      // execChild never returns
      break;
    default:
      break;
  }

  {
    lock_guard<recursive_mutex> guard(pidMutex);
    pid = childPid;
    reaped = false;
  }
  {
    lock_guard<recursive_mutex> guard(fdMutex);
    masterFd = fd;
  }
  RawFdUtils::setNonBlocking(fd);
  RawFdUtils::setCloseOnExec(fd);
  VLOG(1) << "pty opened " << fd << " for pid " << childPid << " running "
          << argvStorage[0];
  return fd;
}

void ForkPtyTerminal::execChild(char* const* argv, char* const* envp,
                                const char* workingDir,
                                const string& chdirWarning,
                                const string& execError, int maxFd) {
  // Dispositions set by the server (SIGPIPE ignored, SIGINT handled) must not
  // leak into the agent.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  signal(SIGHUP, SIG_DFL);

  // Other sessions' masters, listening sockets and log files stay with the
  // server.
  bool closedAll = false;
#if defined(__linux__) && defined(SYS_close_range)
  closedAll = ::syscall(SYS_close_range, 3U, ~0U, 0U) == 0;
#endif
  for (int fd = STDERR_FILENO + 1; !closedAll && fd < maxFd; fd++) {
    ::close(fd);
  }

  if (workingDir != NULL && ::chdir(workingDir) != 0) {
    ssize_t ignored =
        ::write(STDERR_FILENO, chdirWarning.c_str(), chdirWarning.length());
    (void)ignored;
  }
  ::execve(argv[0], argv, envp);
  ssize_t ignored = ::write(STDERR_FILENO, execError.c_str(), execError.length());
  (void)ignored;
  _exit(127);
}

int ForkPtyTerminal::getFd() {
  lock_guard<recursive_mutex> guard(fdMutex);
  return masterFd;
}

pid_t ForkPtyTerminal::getPid() {
  lock_guard<recursive_mutex> guard(pidMutex);
  return pid;
}

void ForkPtyTerminal::write(const string& data) {
  lock_guard<recursive_mutex> guard(fdMutex);
  if (masterFd < 0) {
    throw std::runtime_error("Terminal is closed");
  }
  RawFdUtils::writeAll(masterFd, data.c_str(), data.length());
}

void ForkPtyTerminal::setWindowSize(int cols, int rows) {
  lock_guard<recursive_mutex> guard(fdMutex);
  if (masterFd < 0) {
    throw std::runtime_error("Terminal is closed");
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_col = (unsigned short)cols;
  tmpwin.ws_row = (unsigned short)rows;
  if (::ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw std::runtime_error(string("TIOCSWINSZ failed: ") + strerror(errno));
  }
}

bool ForkPtyTerminal::sendSignal(int signo) {
  lock_guard<recursive_mutex> guard(pidMutex);
  if (pid <= 0 || reaped) {
    return false;
  }
  if (::kill(pid, signo) == -1) {
    if (errno != ESRCH) {
      LOG(WARNING) << "kill(" << pid << ", " << signo
                   << ") failed: " << strerror(errno);
    }
    return false;
  }
  return true;
}

bool ForkPtyTerminal::hasExited() {
  lock_guard<recursive_mutex> guard(pidMutex);
  if (pid <= 0) {
    return false;
  }
  if (reaped) {
    return true;
  }
  int status = 0;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc == -1) {
    if (errno == ECHILD) {
      // Someone else collected it
      reaped = true;
      return true;
    }
    if (errno != EINTR) {
      LOG(WARNING) << "waitpid(" << pid << ") failed: " << strerror(errno);
    }
    return false;
  }
  reaped = true;
  exitStatus = status;
  if (WIFEXITED(status)) {
    LOG(INFO) << "Terminal child " << pid << " exited with status "
              << WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    LOG(INFO) << "Terminal child " << pid << " killed by signal "
              << WTERMSIG(status);
  }
  return true;
}

void ForkPtyTerminal::terminate(int graceMs) {
  if (!sendSignal(SIGTERM)) {
    return;
  }
  sleepMs(graceMs);
  if (hasExited()) {
    return;
  }
  sendSignal(SIGKILL);
}

void ForkPtyTerminal::closeFd() {
  lock_guard<recursive_mutex> guard(fdMutex);
  if (masterFd < 0) {
    return;
  }
  if (::close(masterFd) == -1 && errno != EBADF) {
    LOG(WARNING) << "Error closing pty " << masterFd << ": " << strerror(errno);
  }
  masterFd = -1;
}

bool ForkPtyTerminal::reap(int boundMs) {
  const int stepMs = 5;
  for (int waited = 0;; waited += stepMs) {
    if (hasExited()) {
      return true;
    }
    if (waited >= boundMs) {
      break;
    }
    sleepMs(stepMs);
  }
  LOG(ERROR) << "Terminal child " << getPid() << " was not reaped within "
             << boundMs << "ms";
  return false;
}
}  // namespace agt
