#ifndef __AGT_SUBPROCESS_UTILS__
#define __AGT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace agt {
/**
 * @brief Process-environment helpers shared by the spawner and its tests.
 */
class SubprocessUtils {
 public:
  /**
   * @brief Resolves a command name against $PATH the way execvp would.
   *
   * Names containing a slash are checked directly.
   * @return The absolute path of an executable file, or an empty string.
   */
  static string findInPath(const string& name);

  /** @brief Snapshot of this process's environment. */
  static map<string, string> inheritedEnvironment();

  /**
   * @brief Parses a signal given as a number ("15") or a name ("SIGTERM",
   * "term").
   * @return The signal number, or nullopt when the text names no signal.
   */
  static optional<int> parseSignal(const string& text);
};
}  // namespace agt

#endif  // __AGT_SUBPROCESS_UTILS__
