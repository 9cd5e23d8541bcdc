#ifndef __IGV_LOG_HANDLER__
#define __IGV_LOG_HANDLER__

#include "Headers.hpp"

namespace igv {
/**
 * @brief Configures easylogging++ for the batch client, its CLI and tests.
 *
 * Two loggers are used: "default" for diagnostics (file and optionally
 * stdout) and "stdout" for plain user-facing text such as server output
 * echoed while a launched server starts up.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging in a fresh timestamped file.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool appendPid = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new, empty log file.
   * @throws std::runtime_error when the directory or file cannot be created.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace igv
#endif  // __IGV_LOG_HANDLER__
