#ifndef __AGT_WEB_SOCKET_SERVER_HPP__
#define __AGT_WEB_SOCKET_SERVER_HPP__

#include <libwebsockets.h>

#include "DuplexConnection.hpp"
#include "Headers.hpp"

namespace agt {
/**
 * @brief One browser connection accepted by the WebSocketServer.
 *
 * Handler threads talk to it through the DuplexConnection interface. The
 * service thread moves frames between the socket and the two queues.
 */
class WebSocketConnection : public DuplexConnection {
 public:
  WebSocketConnection(lws* _wsi, const string& _path,
                      std::function<void()> _wakeup,
                      size_t _maxOutboundBytes = WS_MAX_OUTBOUND_BYTES,
                      int _sendTimeoutMs = WS_SEND_TIMEOUT_MS);
  virtual ~WebSocketConnection() {}

  virtual bool send(const string& text);
  virtual bool waitForCapacity(int timeoutMs);
  virtual ReceiveStatus receive(string* message, int timeoutMs);
  virtual bool isOpen();
  virtual void close();
  virtual const string& getId() { return id; }

  inline lws* getWsi() { return wsi; }
  inline const string& getPath() const { return path; }
  size_t getOutboundBytes();

  // The methods below are only called from the service thread.

  /** @brief Appends a received fragment; queues the message when final. */
  void onFragment(const char* data, size_t len, bool final);
  /** @brief Next frame to write, false if none. */
  bool popOutbound(string* text);
  bool hasPendingOutput();
  /** @brief True when close() was called and the queue has drained. */
  bool readyToClose();
  /** @brief The socket is gone; wakes the handler. */
  void markClosed();

 protected:
  lws* wsi;
  const string path;
  const string id;
  std::function<void()> wakeup;
  const size_t maxOutboundBytes;
  const int sendTimeoutMs;
  string fragments;

  mutex queueMutex;
  condition_variable inboundReady;
  condition_variable outboundSpace;
  deque<string> inbound;
  deque<string> outbound;
  size_t outboundBytes;
  bool closed;
  bool closeRequested;
};

/**
 * @brief libwebsockets server for `/ws/terminal/{project_id}/{agent}`.
 *
 * Every accepted connection is handed to `ConnectionCallback` on a thread of
 * its own. The service loop runs on one more thread.
 */
class WebSocketServer {
 public:
  typedef std::function<void(shared_ptr<WebSocketConnection> connection,
                             const string& projectId, const string& agent)>
      ConnectionCallback;

  WebSocketServer(const string& _bindIp, int _port,
                  ConnectionCallback _onConnection);
  ~WebSocketServer();

  /**
   * @brief Binds the port and starts the service thread.
   * Throws std::runtime_error if the context cannot be created.
   */
  void start();

  /**
   * @brief Stops accepting, closes every connection and joins all threads.
   * Idempotent.
   */
  void stop();

  /** @brief Interrupts the service loop so queued frames get written. */
  void wake();

  inline int getPort() const { return port; }

  /**
   * @brief Splits `/ws/terminal/{project_id}/{agent}` into its two
   * components, percent-decoded.
   */
  static optional<pair<string, string>> parseTerminalPath(const string& path);

  /** @brief libwebsockets protocol callback. */
  static int serviceCallback(lws* wsi, enum lws_callback_reasons reason,
                             void* user, void* in, size_t len);

 protected:
  struct HandlerThread {
    shared_ptr<thread> worker;
    shared_ptr<atomic<bool>> done;
  };

  int handleCallback(lws* wsi, enum lws_callback_reasons reason, void* user,
                     void* in, size_t len);
  void serviceLoop();
  void onEstablished(lws* wsi);
  int onWriteable(lws* wsi);
  shared_ptr<WebSocketConnection> findConnection(lws* wsi);
  void spawnHandler(shared_ptr<WebSocketConnection> connection,
                    const string& projectId, const string& agent);
  /** @brief Joins handler threads that have returned. */
  void pruneHandlers();
  static string requestUri(lws* wsi);

  const string bindIp;
  int port;
  ConnectionCallback onConnection;
  lws_protocols protocols[2];

  mutex contextMutex;
  lws_context* context;
  atomic<bool> halt;
  shared_ptr<thread> serviceThread;

  mutex connectionMutex;
  map<lws*, shared_ptr<WebSocketConnection>> connections;

  mutex handlerMutex;
  vector<HandlerThread> handlers;
};
}  // namespace agt

#endif  // __AGT_WEB_SOCKET_SERVER_HPP__
