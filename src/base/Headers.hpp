#ifndef __AGT_HEADERS__
#define __AGT_HEADERS__

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#include <sys/syscall.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <paths.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "AgentTerm.pb.h"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Default terminal geometry for new sessions and bare resize requests
const int DEFAULT_TERMINAL_COLS = 80;
const int DEFAULT_TERMINAL_ROWS = 24;

// Output reader timings
const int READER_POLL_TIMEOUT_MS = 50;
const int READER_IDLE_SLEEP_MS = 10;
const int READER_CHUNK_SIZE = 4096;

// Time between SIGTERM and SIGKILL when tearing down a session
const int TEARDOWN_GRACE_MS = 100;
// Upper bound on waiting for a SIGKILLed child to be reaped
const int TEARDOWN_REAP_BOUND_MS = 2000;

// How long the handler waits for an inbound message before re-checking the
// session state
const int HANDLER_RECEIVE_TIMEOUT_MS = 100;

// Outbound bytes a WebSocket connection may hold before producers stall
const size_t WS_MAX_OUTBOUND_BYTES = 1024 * 1024;
// How long send() waits for a full queue to drain before giving up
const int WS_SEND_TIMEOUT_MS = 5000;

// Control byte a real terminal sends for ctrl+c
const char INTERRUPT_CONTROL_BYTE = '\x03';

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef AGT_VERSION
#define AGT_VERSION "unknown"
#endif

namespace agt {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void sleepMs(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
}  // namespace agt

#endif  // __AGT_HEADERS__
