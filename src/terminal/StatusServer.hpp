#ifndef __AGT_STATUS_SERVER_HPP__
#define __AGT_STATUS_SERVER_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionRegistry.hpp"

namespace httplib {
class Server;
}

namespace agt {
/**
 * @brief Small HTTP server reporting health and the live session list.
 *
 * Routes: `GET /health` and `GET /api/terminals`.
 */
class StatusServer {
 public:
  StatusServer(shared_ptr<SessionRegistry> _registry, const string& _bindIp,
               int _port);
  ~StatusServer();

  /**
   * @brief Binds and starts serving on a background thread.
   * Throws std::runtime_error if the port cannot be bound.
   */
  void start();
  void stop();

  /** @brief Body of `GET /health`. */
  static json healthReport();
  /** @brief Body of `GET /api/terminals`. */
  json terminalsReport();

 protected:
  shared_ptr<SessionRegistry> registry;
  string bindIp;
  int port;
  unique_ptr<httplib::Server> server;
  shared_ptr<thread> serverThread;
};
}  // namespace agt

#endif  // __AGT_STATUS_SERVER_HPP__
