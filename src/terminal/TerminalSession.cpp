#include "TerminalSession.hpp"

namespace agt {
TerminalSession::TerminalSession(const string& _id, const string& _projectId,
                                 const string& _agent,
                                 shared_ptr<PseudoTerminal> _terminal,
                                 shared_ptr<DuplexConnection> _connection,
                                 int _cols, int _rows)
    : id(_id),
      projectId(_projectId),
      agent(_agent),
      terminal(_terminal),
      connection(_connection),
      running(true),
      state(SessionState::STARTING),
      cols(_cols),
      rows(_rows) {}

string TerminalSession::makeId(const string& projectId, const string& agent) {
  return projectId + "_" + agent;
}

pair<int, int> TerminalSession::getGeometry() {
  lock_guard<mutex> guard(geometryMutex);
  return make_pair(cols, rows);
}

void TerminalSession::markRunning() {
  SessionState expected = SessionState::STARTING;
  state.compare_exchange_strong(expected, SessionState::RUNNING);
}

void TerminalSession::markEnding() {
  running = false;
  SessionState current = state;
  while (current == SessionState::STARTING ||
         current == SessionState::RUNNING) {
    if (state.compare_exchange_weak(current, SessionState::ENDING)) {
      break;
    }
  }
}

void TerminalSession::writeInput(const string& data) {
  if (!running) {
    VLOG(2) << id << ": dropping input, session is not running";
    return;
  }
  try {
    terminal->write(data);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << id << ": write to terminal failed: " << re.what();
  }
}

void TerminalSession::sendCommand(const string& text) {
  writeInput(text + "\n");
}

void TerminalSession::resize(int newCols, int newRows) {
  try {
    terminal->setWindowSize(newCols, newRows);
    lock_guard<mutex> guard(geometryMutex);
    cols = newCols;
    rows = newRows;
  } catch (const std::runtime_error& re) {
    VLOG(1) << id << ": failed to resize terminal to " << newCols << "x"
            << newRows << ": " << re.what();
  }
}

void TerminalSession::signal(int signo) {
  if (!terminal->sendSignal(signo)) {
    VLOG(1) << id << ": signal " << signo << " not delivered, child is gone";
  }
}

void TerminalSession::interrupt() {
  writeInput(string(1, INTERRUPT_CONTROL_BYTE));
}

void TerminalSession::teardown() {
  lock_guard<mutex> guard(teardownMutex);
  if (state == SessionState::TERMINATED) {
    return;
  }
  markEnding();
  LOG(INFO) << "Tearing down session " << id << " (pid "
            << terminal->getPid() << ")";
  terminal->terminate(TEARDOWN_GRACE_MS);
  terminal->closeFd();
  terminal->reap(TEARDOWN_REAP_BOUND_MS);
  state = SessionState::TERMINATED;
}

bool TerminalSession::sendToClient(const json& message) {
  if (!connection) {
    return false;
  }
  bool sent = connection->send(toWireString(message));
  if (!sent) {
    VLOG(2) << id << ": client is gone, dropped "
            << message.value("type", "message");
  }
  return sent;
}

SessionSummary TerminalSession::summary() {
  SessionSummary s;
  s.set_id(id);
  s.set_project_id(projectId);
  s.set_agent(agent);
  s.set_running(running);
  auto geometry = getGeometry();
  s.set_cols(geometry.first);
  s.set_rows(geometry.second);
  return s;
}
}  // namespace agt
