#ifndef __AGT_DUPLEX_CONNECTION_HPP__
#define __AGT_DUPLEX_CONNECTION_HPP__

#include "Headers.hpp"

namespace agt {
enum class ReceiveStatus { MESSAGE, TIMEOUT, CLOSED };

/**
 * @brief One live message-oriented connection to a browser client.
 *
 * `send` may be called from any thread. `receive` is called by a single
 * handler thread.
 */
class DuplexConnection {
 public:
  virtual ~DuplexConnection() {}

  /**
   * @brief Queues one text message for the client.
   *
   * Blocks for a bounded time while the outbound queue is full.
   * @returns false when the client is gone or stopped draining; the message
   * is dropped.
   */
  virtual bool send(const string& text) = 0;

  /**
   * @brief Waits up to `timeoutMs` for room in the outbound queue.
   * @returns false only while the queue is still full. Producers that can
   * pause (the output reader) call this before producing more.
   */
  virtual bool waitForCapacity(int timeoutMs) = 0;

  /**
   * @brief Waits up to `timeoutMs` for the next inbound message.
   */
  virtual ReceiveStatus receive(string* message, int timeoutMs) = 0;

  /** @brief False once either side has closed the connection. */
  virtual bool isOpen() = 0;

  /** @brief Flushes queued messages, then closes. Idempotent. */
  virtual void close() = 0;

  /** @brief Unique id used in logs and thread names. */
  virtual const string& getId() = 0;
};
}  // namespace agt

#endif  // __AGT_DUPLEX_CONNECTION_HPP__
