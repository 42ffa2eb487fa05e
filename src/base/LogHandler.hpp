#ifndef __TCODE_LOG_HANDLER__
#define __TCODE_LOG_HANDLER__

#include "Headers.hpp"

namespace tcode {
// easylogging++ logger ids handed to each component at construction
const string ROUTER_LOGGER = "router";
const string SESSION_LOGGER = "session";
const string TRACKER_LOGGER = "tracker";
const string TRANSPORT_LOGGER = "transport";

/**
 * @brief Configures easylogging++ so the bridge server can control log files.
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
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Registers the per-component loggers and applies `conf` to them.
   */
  static void setupComponentLoggers(const el::Configurations &conf);

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
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tcode
#endif  // __TCODE_LOG_HANDLER__
