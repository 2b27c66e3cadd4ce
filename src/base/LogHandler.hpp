#ifndef __AT_LOG_HANDLER__
#define __AT_LOG_HANDLER__

#include "Headers.hpp"
#include "ServerConfig.hpp"

namespace at {
/**
 * @brief Owns the easylogging++ setup for the server and the test runner.
 *
 * Logging starts on stdout only.  Once the configuration is known,
 * configureLogging() moves the default logger to a per-process file.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration shared by
   * every logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /** @brief Makes the "stdout" logger print bare messages. */
  static void setupStdoutLogger();

  /**
   * @brief Applies `config` on top of `defaultConf` and reconfigures the
   * default logger.
   *
   * The log file is `<logDirectory>/<filenamePrefix>-<time>_<pid>.log`.  When
   * stderr is redirected it goes to a matching `-stderr-` file so crashes in
   * libraries that bypass the logger are kept.
   */
  static void configureLogging(el::Configurations *defaultConf,
                               const LoggingConfig &config,
                               const string &filenamePrefix);

 private:
  static void removeRolledLog(const char *filename, std::size_t size);

  static string logFileName(const string &filenamePrefix, const string &kind);

  /** @brief Creates `filename` under `directory`, which must not exist yet. */
  static string createLogFile(const string &directory, const string &filename);

  static void redirectStderr(const string &directory, const string &filename);
};
}  // namespace at
#endif  // __AT_LOG_HANDLER__
