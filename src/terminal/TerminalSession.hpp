#ifndef __AGT_TERMINAL_SESSION_HPP__
#define __AGT_TERMINAL_SESSION_HPP__

#include "ClientMessage.hpp"
#include "DuplexConnection.hpp"
#include "Headers.hpp"
#include "PseudoTerminal.hpp"

namespace agt {
enum class SessionState { STARTING, RUNNING, ENDING, TERMINATED };

/**
 * @brief One pty-backed agent process bound to one client connection.
 *
 * The session owns the PseudoTerminal. The connection is shared with the
 * handler that accepted it. Every operation is safe after teardown and never
 * throws.
 */
class TerminalSession {
 public:
  TerminalSession(const string& _id, const string& _projectId,
                  const string& _agent, shared_ptr<PseudoTerminal> _terminal,
                  shared_ptr<DuplexConnection> _connection, int cols, int rows);

  /** @brief Deterministic key of a (project, agent) pair. */
  static string makeId(const string& projectId, const string& agent);

  inline const string& getId() const { return id; }
  inline const string& getProjectId() const { return projectId; }
  inline const string& getAgent() const { return agent; }
  inline shared_ptr<PseudoTerminal> getTerminal() { return terminal; }
  inline shared_ptr<DuplexConnection> getConnection() { return connection; }
  inline bool isRunning() const { return running; }
  inline SessionState getState() const { return state; }
  pair<int, int> getGeometry();

  /** @brief STARTING -> RUNNING, once the output reader is live. */
  void markRunning();
  /** @brief Clears `running`; input is rejected from now on. */
  void markEnding();

  /** @brief Writes raw bytes to the terminal; no-op unless running. */
  void writeInput(const string& data);
  /** @brief `writeInput(text + "\n")`. */
  void sendCommand(const string& text);
  /** @brief Applies a geometry; failures are logged only. */
  void resize(int cols, int rows);
  /** @brief Signals the child; ignored if it already exited. */
  void signal(int signo);
  /** @brief Types ctrl+c into the terminal. */
  void interrupt();

  /**
   * @brief Ends the process and releases the terminal.
   *
   * SIGTERM, grace period, SIGKILL, close the master, reap. The output reader
   * must already be stopped. Idempotent.
   */
  void teardown();

  /** @brief Best-effort send to the bound client. */
  bool sendToClient(const json& message);

  /** @brief Snapshot for listings. */
  SessionSummary summary();

 protected:
  const string id;
  const string projectId;
  const string agent;
  shared_ptr<PseudoTerminal> terminal;
  shared_ptr<DuplexConnection> connection;
  atomic<bool> running;
  atomic<SessionState> state;
  mutex geometryMutex;
  int cols;
  int rows;
  /** @brief Serializes teardown with itself. */
  mutex teardownMutex;
};
}  // namespace agt

#endif  // __AGT_TERMINAL_SESSION_HPP__
