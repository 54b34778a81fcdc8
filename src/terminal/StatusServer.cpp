#include "StatusServer.hpp"

#include "LogHandler.hpp"
#include "httplib.h"

namespace agt {
namespace {
string utcTimestamp() {
  time_t now = time(NULL);
  tm utc;
  gmtime_r(&now, &utc);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return string(buf);
}
}  // namespace

StatusServer::StatusServer(shared_ptr<SessionRegistry> _registry,
                           const string& _bindIp, int _port)
    : registry(_registry),
      bindIp(_bindIp.empty() ? string("0.0.0.0") : _bindIp),
      port(_port) {}

StatusServer::~StatusServer() { stop(); }

json StatusServer::healthReport() {
  json health;
  health["status"] = "healthy";
  health["timestamp"] = utcTimestamp();
  health["version"] = AGT_VERSION;
  return health;
}

json StatusServer::terminalsReport() {
  json sessions = json::array();
  for (auto& summary : registry->list()) {
    json entry;
    entry["session_id"] = summary.id();
    entry["project_id"] = summary.project_id();
    entry["agent"] = summary.agent();
    entry["running"] = summary.running();
    entry["cols"] = summary.cols();
    entry["rows"] = summary.rows();
    sessions.push_back(entry);
  }
  json report;
  report["sessions"] = sessions;
  return report;
}

void StatusServer::start() {
  server.reset(new httplib::Server());
  server->Get("/health",
              [](const httplib::Request&, httplib::Response& res) {
                res.set_content(toWireString(healthReport()),
                                "application/json");
              });
  server->Get("/api/terminals",
              [this](const httplib::Request&, httplib::Response& res) {
                res.set_content(toWireString(terminalsReport()),
                                "application/json");
              });
  if (!server->bind_to_port(bindIp.c_str(), port)) {
    server.reset();
    throw std::runtime_error("Could not bind the status server to " + bindIp +
                             ":" + to_string(port));
  }
  serverThread.reset(new thread([this]() {
    LogHandler::setThreadName("status-http");
    if (!server->listen_after_bind()) {
      VLOG(1) << "Status server loop returned";
    }
  }));
  LOG(INFO) << "Status server listening on " << bindIp << ":" << port;
}

void StatusServer::stop() {
  if (!serverThread) {
    return;
  }
  server->stop();
  serverThread->join();
  serverThread.reset();
  server.reset();
}
}  // namespace agt
