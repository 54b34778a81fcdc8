#ifndef __AGT_OUTPUT_READER_HPP__
#define __AGT_OUTPUT_READER_HPP__

#include "Headers.hpp"
#include "TerminalSession.hpp"
#include "Utf8Decoder.hpp"

namespace agt {
/**
 * @brief Streams a session's terminal output to its client on a thread.
 *
 * The loop ends on EOF, a terminal I/O error, child exit, or `cancel()`. On
 * the way out it clears the session's running flag and announces the end. It
 * never removes the session from the registry.
 */
class OutputReader {
 public:
  explicit OutputReader(shared_ptr<TerminalSession> _session);
  /** @brief Cancels and joins. */
  ~OutputReader();

  /** @brief Starts the reader thread. */
  void start();
  /** @brief Stops the loop at its next wait boundary and joins the thread. */
  void cancel();
  /** @brief True once the loop has returned. */
  inline bool isFinished() const { return finished; }

 protected:
  void run();
  /** @brief Reads one chunk. @returns false when the stream has ended. */
  bool readChunk(int fd);

  shared_ptr<TerminalSession> session;
  Utf8Decoder decoder;
  atomic<bool> cancelled;
  atomic<bool> finished;
  mutex threadMutex;
  unique_ptr<thread> readerThread;
};
}  // namespace agt

#endif  // __AGT_OUTPUT_READER_HPP__
