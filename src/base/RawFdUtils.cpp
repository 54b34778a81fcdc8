#include "RawFdUtils.hpp"

namespace agt {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count,
                          int maxWaitMs) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  const int retrySleepMs = 10;
  int waitedMs = 0;
  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The terminal input queue is full: the child is not reading.
        if (waitedMs >= maxWaitMs) {
          throw std::runtime_error("Terminal input stayed full for " +
                                   to_string(waitedMs) + "ms");
        }
        sleepMs(retrySleepMs);
        waitedMs += retrySleepMs;
        continue;
      }
      throw std::runtime_error(string("Cannot write to descriptor: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to descriptor: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void RawFdUtils::setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void RawFdUtils::setCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFD, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

bool RawFdUtils::waitForReadable(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0) {
    if (errno == EINTR) {
      return false;
    }
    throw std::runtime_error(string("poll() on terminal failed: ") +
                             strerror(errno));
  }
  // POLLHUP/POLLERR count as readable so the caller's read() sees EOF or EIO.
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

int RawFdUtils::countOpenFds() {
  int count = 0;
#ifdef __linux__
  for (const auto& entry : fs::directory_iterator("/proc/self/fd")) {
    (void)entry;
    count++;
  }
  // The iterator holds one descriptor of its own while listing.
  count--;
#else
  int maxFd = int(::getdtablesize());
  for (int fd = 0; fd < maxFd; fd++) {
    if (::fcntl(fd, F_GETFD) != -1) {
      count++;
    }
  }
#endif
  return count;
}
}  // namespace agt
