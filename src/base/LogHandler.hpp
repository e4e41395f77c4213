#ifndef __PE_LOG_HANDLER__
#define __PE_LOG_HANDLER__

#include "Headers.hpp"

namespace pe {
/**
 * @brief Where and how much a process logs.  Filled from command line flags
 * and the [Debug] section of a config file.
 */
struct LogSettings {
  string directory;
  string filenamePrefix = "ptyexpect";
  bool logToStdout = false;
  bool redirectStderrToFile = false;
  // 20MB
  string maxLogSize = "20971520";
  int verboseLevel = 0;
  bool silent = false;
};

/**
 * @brief Configures easylogging++ for the expect library and its tools.
 *
 * Three loggers are used: "default" for diagnostics, "stdout" for user facing
 * messages and "child" for a transcript of the bytes exchanged with spawned
 * programs.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging with the process arguments.
   * @return The base configuration, later completed by applySettings().
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Reads verbose, silent and logsize from the [Debug] section of
   * @p cfgfile.  The verbose level is only taken from the file when
   * @p keepVerboseLevel is false.
   */
  static void loadDebugSettings(const string &cfgfile, LogSettings *settings,
                                bool keepVerboseLevel);

  /**
   * @brief Points @p defaultConf at a fresh log file and reconfigures the
   * default and child loggers accordingly.
   * @return The full path of the log file.
   */
  static string applySettings(el::Configurations *defaultConf,
                              const LogSettings &settings);

  /** @brief Pre roll out callback, drops the full log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  static void setupStdoutLogger();

  /**
   * @brief Transcript logger for child traffic.  Only enabled at verbose
   * level 3 and above.
   */
  static void setupChildTrafficLogger(int verboseLevel);

 private:
  static string timestampedName(const string &prefix, const string &kind);

  static string createLogFile(const string &directory,
                              const string &filename);
};
}  // namespace pe
#endif  // __PE_LOG_HANDLER__
