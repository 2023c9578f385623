#ifndef __HL_LOG_HANDLER__
#define __HL_LOG_HANDLER__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Configures easylogging++ for the hotline client and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends log output to a fresh timestamped file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Rollout callback: the full log file is deleted.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger used for user facing output.
   */
  static void setupStdoutLogger();

  /** @brief Per-user log directory, below the platform cache folder. */
  static string defaultLogDirectory();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace hl
#endif  // __HL_LOG_HANDLER__
