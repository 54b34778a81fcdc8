#include "TerminalConnectionHandler.hpp"

#include "LogHandler.hpp"

namespace agt {
namespace {
const int KICKOFF_WAIT_SLICE_MS = 100;

/**
 * Applies one client message to the session. Returns false when the message
 * loop should stop.
 */
struct MessageDispatcher {
  shared_ptr<SessionRegistry> registry;
  shared_ptr<DuplexConnection> connection;
  shared_ptr<TerminalSession> session;

  bool operator()(const InputMessage& m) {
    session->writeInput(m.data);
    return true;
  }
  bool operator()(const CommandMessage& m) {
    session->sendCommand(m.command);
    return true;
  }
  bool operator()(const ResizeMessage& m) {
    session->resize(m.cols, m.rows);
    return true;
  }
  bool operator()(const StopMessage&) {
    session->interrupt();
    return true;
  }
  bool operator()(const SignalMessage& m) {
    session->signal(m.signo);
    return true;
  }
  bool operator()(const KillMessage&) {
    LOG(INFO) << "Client asked to kill " << session->getId();
    registry->destroySession(session);
    return false;
  }
  bool operator()(const PingMessage&) {
    connection->send(toWireString(ServerMessage::pong()));
    return true;
  }
};
}  // namespace

TerminalConnectionHandler::TerminalConnectionHandler(
    shared_ptr<SessionRegistry> _registry,
    shared_ptr<ModelSettings> _modelSettings, const HandlerOptions& _options)
    : registry(_registry), modelSettings(_modelSettings), options(_options) {}

bool TerminalConnectionHandler::isValidPathComponent(const string& name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == string::npos && name.find('\0') == string::npos;
}

void TerminalConnectionHandler::run(shared_ptr<DuplexConnection> connection,
                                    const string& projectId,
                                    const string& agent) {
  LogHandler::setThreadName("handler-" + connection->getId());
  shared_ptr<TerminalSession> session;
  try {
    startSession(connection, projectId, agent, &session);
    if (session) {
      kickoff(connection, session);
      messageLoop(connection, session);
    }
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error on connection " << connection->getId() << " for "
               << TerminalSession::makeId(projectId, agent) << ": "
               << ex.what();
    connection->send(toWireString(ServerMessage::error(ex.what())));
  }

  if (session) {
    registry->destroySession(session);
  }
  connection->close();
  VLOG(1) << "Connection " << connection->getId() << " finished";
}

void TerminalConnectionHandler::startSession(
    shared_ptr<DuplexConnection> connection, const string& projectId,
    const string& agent, shared_ptr<TerminalSession>* session) {
  if (!isValidPathComponent(projectId) || !isValidPathComponent(agent)) {
    LOG(WARNING) << "Rejecting connection " << connection->getId()
                 << " with invalid identity '" << projectId << "'/'" << agent
                 << "'";
    connection->send(toWireString(
        ServerMessage::error("Invalid project or agent name")));
    return;
  }

  const string id = TerminalSession::makeId(projectId, agent);
  fs::path workingDir = fs::path(options.projectsDir) / projectId;
  std::error_code ec;
  fs::create_directories(workingDir, ec);
  if (ec) {
    LOG(WARNING) << "Could not create working directory "
                 << workingDir.string() << ": " << ec.message();
  }

  json connecting = ServerMessage::status("connecting");
  connecting["session_id"] = id;
  connecting["agent"] = agent;
  connection->send(toWireString(connecting));

  ModelConfig modelConfig;
  if (modelSettings) {
    modelConfig = modelSettings->load();
  }
  map<string, string> extraEnv =
      registry->getCatalog()->buildModelEnvironment(agent, modelConfig);

  // Output waits until the client has seen `connected`
  *session =
      registry->create(projectId, agent, connection, workingDir.string(),
                       extraEnv, false);

  json connected = ServerMessage::status("connected");
  connected["running"] = true;
  connected["session_id"] = id;
  connected["agent"] = agent;
  connected["model_config"] = {
      {"model", modelConfig.has_default_model() ? modelConfig.default_model()
                                                : string("Not configured")},
      {"has_api_key", modelConfig.has_api_key()},
  };
  connection->send(toWireString(connected));
  registry->startReader(*session);
}

void TerminalConnectionHandler::kickoff(
    shared_ptr<DuplexConnection> connection,
    shared_ptr<TerminalSession> session) {
  if (!options.kickoffEnabled) {
    return;
  }
  // Agents without a prompt go straight to the message loop
  string prompt = registry->getCatalog()->kickoffPrompt(session->getAgent());
  if (prompt.empty()) {
    return;
  }
  // Give the agent time to draw its UI before typing into it
  if (!waitWhileAlive(connection, session, options.kickoffSettleMs)) {
    return;
  }
  if (!waitWhileAlive(connection, session, options.kickoffDelayMs)) {
    return;
  }
  LOG(INFO) << "Sending kickoff prompt to " << session->getId();
  session->sendCommand(prompt);
  json autonomous = ServerMessage::status("autonomous");
  autonomous["message"] = session->getAgent() + " started in autonomous mode";
  session->sendToClient(autonomous);
}

void TerminalConnectionHandler::messageLoop(
    shared_ptr<DuplexConnection> connection,
    shared_ptr<TerminalSession> session) {
  MessageDispatcher dispatcher = {registry, connection, session};
  while (session->isRunning()) {
    string text;
    ReceiveStatus status =
        connection->receive(&text, HANDLER_RECEIVE_TIMEOUT_MS);
    if (status == ReceiveStatus::CLOSED) {
      LOG(INFO) << "Client " << connection->getId() << " disconnected from "
                << session->getId();
      break;
    }
    if (status == ReceiveStatus::TIMEOUT) {
      continue;
    }
    optional<ClientMessage> message = parseClientMessage(text);
    if (!message) {
      continue;
    }
    if (!std::visit(dispatcher, *message)) {
      break;
    }
  }
}

bool TerminalConnectionHandler::waitWhileAlive(
    shared_ptr<DuplexConnection> connection,
    shared_ptr<TerminalSession> session, int ms) {
  for (int waited = 0; waited < ms; waited += KICKOFF_WAIT_SLICE_MS) {
    if (!session->isRunning() || !connection->isOpen()) {
      return false;
    }
    sleepMs(std::min(KICKOFF_WAIT_SLICE_MS, ms - waited));
  }
  return session->isRunning() && connection->isOpen();
}
}  // namespace agt
