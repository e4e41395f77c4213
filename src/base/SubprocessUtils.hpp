#ifndef __PE_SUBPROCESS_UTILS__
#define __PE_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace pe {
/**
 * @brief Helpers for turning a command description into something execv()
 * can run.
 */
class SubprocessUtils {
 public:
  /**
   * @brief Locates an executable the way a shell would.
   *
   * A name containing a slash is checked as-is; otherwise every entry of
   * PATH is tried in order.  PATH is taken from @p env when it has one, then
   * from the process environment, then from _PATH_DEFPATH.
   *
   * @return The full path, or nullopt when nothing executable was found.
   */
  static optional<string> which(const string& filename,
                                const map<string, string>* env = nullptr);

  /**
   * @brief Splits a command line into words.  Whitespace separates words,
   * backslash escapes the next character, and single or double quotes group
   * text verbatim.
   */
  static vector<string> splitCommandLine(const string& commandLine);

  /** @brief Returns true for a regular file the caller may execute. */
  static bool isExecutableFile(const string& path);
};
}  // namespace pe

#endif  // __PE_SUBPROCESS_UTILS__
