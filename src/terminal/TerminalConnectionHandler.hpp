#ifndef __AGT_TERMINAL_CONNECTION_HANDLER_HPP__
#define __AGT_TERMINAL_CONNECTION_HANDLER_HPP__

#include "DuplexConnection.hpp"
#include "Headers.hpp"
#include "ModelSettings.hpp"
#include "SessionRegistry.hpp"

namespace agt {
struct HandlerOptions {
  /** @brief Parent of every project working directory. */
  string projectsDir = "./projects";
  /** @brief Type the agent's kickoff prompt after startup. */
  bool kickoffEnabled = true;
  /** @brief Wait after `connected` before deciding on the kickoff. */
  int kickoffSettleMs = 2000;
  /** @brief Extra wait before typing the kickoff prompt. */
  int kickoffDelayMs = 1000;
};

/**
 * @brief Drives one client connection from accept to close.
 *
 * Creates the session for the (project, agent) pair named by the connection
 * path, optionally types the kickoff prompt, forwards control messages until
 * the session ends or the client leaves, then destroys the session.
 */
class TerminalConnectionHandler {
 public:
  TerminalConnectionHandler(shared_ptr<SessionRegistry> _registry,
                            shared_ptr<ModelSettings> _modelSettings,
                            const HandlerOptions& _options);

  /**
   * @brief Runs the whole protocol on the calling thread. Returns after the
   * session has been destroyed and the connection closed.
   */
  void run(shared_ptr<DuplexConnection> connection, const string& projectId,
           const string& agent);

  /** @brief True for names that are safe to use as one path component. */
  static bool isValidPathComponent(const string& name);

  inline const HandlerOptions& getOptions() const { return options; }

 protected:
  void startSession(shared_ptr<DuplexConnection> connection,
                    const string& projectId, const string& agent,
                    shared_ptr<TerminalSession>* session);
  void kickoff(shared_ptr<DuplexConnection> connection,
               shared_ptr<TerminalSession> session);
  void messageLoop(shared_ptr<DuplexConnection> connection,
                   shared_ptr<TerminalSession> session);
  /**
   * @brief Sleeps for `ms` in short slices.
   * @returns false as soon as the session stops or the client goes away.
   */
  bool waitWhileAlive(shared_ptr<DuplexConnection> connection,
                      shared_ptr<TerminalSession> session, int ms);

  shared_ptr<SessionRegistry> registry;
  shared_ptr<ModelSettings> modelSettings;
  HandlerOptions options;
};
}  // namespace agt

#endif  // __AGT_TERMINAL_CONNECTION_HANDLER_HPP__
