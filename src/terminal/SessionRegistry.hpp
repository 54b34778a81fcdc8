#ifndef __AGT_SESSION_REGISTRY_HPP__
#define __AGT_SESSION_REGISTRY_HPP__

#include "AgentCatalog.hpp"
#include "Headers.hpp"
#include "OutputReader.hpp"
#include "PseudoTerminal.hpp"
#include "TerminalSession.hpp"

namespace agt {
/**
 * @brief Owns every live terminal session, keyed by (project, agent).
 *
 * At most one session and one output reader exist per identity. Creation and
 * destruction are serialized by `lifecycleMutex`; `get` and `list` only take
 * `mapMutex` for the time of a lookup or a copy.
 */
class SessionRegistry {
 public:
  SessionRegistry(shared_ptr<AgentCatalog> _catalog,
                  PseudoTerminalFactory _terminalFactory);
  /** @brief Tears down whatever is still running. */
  ~SessionRegistry();

  /**
   * @brief Spawns the agent for (projectId, agent) and binds it to
   * `connection`.
   *
   * A live session with the same identity is destroyed first, and its process
   * is reaped before the new one is spawned. Unless `startOutput` is set the
   * output reader waits for startReader(). Throws std::runtime_error when
   * no pseudo-terminal could be allocated.
   */
  shared_ptr<TerminalSession> create(const string& projectId,
                                     const string& agent,
                                     shared_ptr<DuplexConnection> connection,
                                     const string& workingDir,
                                     const map<string, string>& extraEnv,
                                     bool startOutput = true);

  /**
   * @brief Starts streaming output for a session created with
   * `startOutput = false`. No-op once the session was replaced or destroyed.
   */
  void startReader(shared_ptr<TerminalSession> session);

  /** @brief Session for `id`, or null. */
  shared_ptr<TerminalSession> get(const string& id);

  /** @brief Snapshot of all sessions. */
  vector<SessionSummary> list();

  /** @brief Tears down the session for `id`; no-op if absent. */
  void destroy(const string& id);

  /**
   * @brief Tears down `session`, and removes its registry entry only if the
   * entry still refers to it.
   */
  void destroySession(shared_ptr<TerminalSession> session);

  /** @brief Destroys every session. */
  void shutdown();

  /** @brief Builds the full child environment for `agent`. */
  map<string, string> buildEnvironment(const string& agent,
                                       const map<string, string>& extraEnv);

  inline shared_ptr<AgentCatalog> getCatalog() { return catalog; }

 protected:
  /** @brief Full teardown; the caller holds `lifecycleMutex`. */
  void teardownLocked(shared_ptr<TerminalSession> session);

  shared_ptr<AgentCatalog> catalog;
  PseudoTerminalFactory terminalFactory;
  unordered_map<string, shared_ptr<TerminalSession>> sessions;
  unordered_map<string, shared_ptr<OutputReader>> readers;
  recursive_mutex lifecycleMutex;
  mutex mapMutex;
};
}  // namespace agt

#endif  // __AGT_SESSION_REGISTRY_HPP__
