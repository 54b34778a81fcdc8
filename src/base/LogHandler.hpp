#ifndef __AGT_LOG_HANDLER__
#define __AGT_LOG_HANDLER__

#include "Headers.hpp"

namespace agt {
/**
 * @brief Where and how the server writes its logs.
 */
struct LogSettings {
  /** @brief Directory that receives the log files. */
  string directory;
  /** @brief Prefix of every log file name. */
  string filenamePrefix = "agentterm";
  /** @brief Mirror log lines to stdout. */
  bool toStdout = false;
  /** @brief Send stderr (including child diagnostics) to its own file. */
  bool redirectStderr = false;
  /** @brief Rollover size in bytes, as a decimal string. */
  string maxLogSize = "20971520";
};

/**
 * @brief Configures easylogging++ for the server and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration that callers
   * refine before calling `apply`.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file under
   * `settings.directory`.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const LogSettings &settings);

  /** @brief Reconfigures the default logger and installs log rotation. */
  static void apply(const el::Configurations &defaultConf);

  /** @brief Deletes a rolled-over log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Sets up the "stdout" logger used for plain console messages.
   */
  static void setupStdoutLogger();

  /** @brief Names the calling thread in log lines. */
  static void setThreadName(const string &name);

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace agt
#endif  // __AGT_LOG_HANDLER__
