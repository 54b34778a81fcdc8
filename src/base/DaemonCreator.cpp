#include "DaemonCreator.hpp"

#include "RawFdUtils.hpp"

namespace agt {
int DaemonCreator::create(bool terminateParent, const string& childPidFile) {
  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid > 0) {
    if (terminateParent) {
      exit(EXIT_SUCCESS);
    }
    return PARENT;
  }

  FATAL_FAIL(setsid());
  signal(SIGHUP, SIG_IGN);

  // Second fork so the daemon can never reacquire a terminal
  pid = fork();
  FATAL_FAIL(pid);
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  if (!childPidFile.empty()) {
    writePidFile(childPidFile);
  }

  FATAL_FAIL(chdir("/"));

  int devNullOut = open("/dev/null", O_WRONLY);
  FATAL_FAIL(devNullOut);
  FATAL_FAIL(dup2(devNullOut, STDOUT_FILENO));
  FATAL_FAIL(dup2(devNullOut, STDERR_FILENO));
  int devNullIn = open("/dev/null", O_RDONLY);
  FATAL_FAIL(devNullIn);
  FATAL_FAIL(dup2(devNullIn, STDIN_FILENO));
  ::close(devNullOut);
  ::close(devNullIn);
  return CHILD;
}

void DaemonCreator::writePidFile(const string& childPidFile) {
  int fd = open(childPidFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd == -1) {
    STFATAL << "Error opening pidfile for writing: " << childPidFile << ": "
            << strerror(errno);
  }
  string pidText = to_string(getpid()) + "\n";
  RawFdUtils::writeAll(fd, pidText.c_str(), pidText.length());
  ::close(fd);
}
}  // namespace agt
