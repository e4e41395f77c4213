#ifndef __PE_SESSION_CONFIG__
#define __PE_SESSION_CONFIG__

#include "Headers.hpp"

namespace pe {
/**
 * @brief Settings a session is created with.
 *
 * Defaults match the behaviour expected by interactive scripts: a 30 second
 * expect timeout, echo on, a 24x80 terminal and short pauses before sends
 * and after closes so that slow children keep up.
 */
struct SessionConfig {
  /** @brief Default expect timeout in seconds, nullopt waits forever. */
  optional<double> timeout = DEFAULT_EXPECT_TIMEOUT;
  /** @brief Bytes requested from the channel per read. */
  int maxRead = DEFAULT_MAX_READ;
  /** @brief Bytes at the end of the buffer searched per attempt, 0 = all. */
  size_t searchWindowSize = 0;

  /** @brief "utf-8" validates output, "" passes raw bytes through. */
  string encoding = "utf-8";
  /** @brief "strict" or "replace". */
  string codecErrors = "strict";
  string lineSeparator = "\n";

  bool echo = true;
  int rows = 24;
  int cols = 80;

  double delayBeforeSend = 0.05;
  optional<double> delayAfterRead = 0.0001;
  double delayAfterClose = 0.1;
  double delayAfterTerminate = 0.1;

  /** @brief Working directory of the child, empty inherits ours. */
  string cwd;
  /** @brief Complete child environment, nullopt inherits ours. */
  optional<map<string, string>> env;
  bool ignoreSighup = false;

  /**
   * @brief Reads the [Session] section of an INI file on top of the
   * defaults.
   * @throws std::runtime_error if the file cannot be loaded or a value does
   * not parse.
   */
  static SessionConfig loadFromFile(const string& path);

  /** @brief Expands \\n, \\r, \\t and \\\\ escapes used in config values. */
  static string unescape(const string& value);
};

/**
 * @brief Timeout argument of blocking calls: a number of seconds, no limit
 * at all, or whatever the session was configured with.
 */
class ExpectTimeout {
 public:
  static ExpectTimeout seconds(double s) { return ExpectTimeout(false, s); }
  static ExpectTimeout forever() { return ExpectTimeout(false, nullopt); }
  static ExpectTimeout sessionDefault() {
    return ExpectTimeout(true, nullopt);
  }

  /** @brief Seconds to wait, nullopt meaning forever. */
  optional<double> resolve(const SessionConfig& config) const {
    return useDefault ? config.timeout : value;
  }

 protected:
  ExpectTimeout(bool _useDefault, optional<double> _value)
      : useDefault(_useDefault), value(_value) {}

  bool useDefault;
  optional<double> value;
};
}  // namespace pe

#endif  // __PE_SESSION_CONFIG__
