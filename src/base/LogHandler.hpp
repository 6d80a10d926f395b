#ifndef __FSN_LOG_HANDLER__
#define __FSN_LOG_HANDLER__

#include "Headers.hpp"

namespace fsn {
/**
 * @brief Configures easylogging++ for the daemon, the test runner and the
 * test helper.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Routes every level to stderr only.
   *
   * Used by processes whose stdout carries protocol frames.
   */
  static void setupStderrOnly(el::Configurations *defaultConf);

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
   * @brief Redirects stderr to a file created in the specified directory.
   */
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace fsn
#endif  // __FSN_LOG_HANDLER__
