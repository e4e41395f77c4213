#ifndef __PE_PATTERN_MATCHER__
#define __PE_PATTERN_MATCHER__

#include <boost/regex.hpp>

#include "ExpectErrors.hpp"
#include "Headers.hpp"

namespace pe {
/**
 * @brief One entry of an expect list.  END_OF_FILE and TIMEOUT are
 * sentinels: they never match text, but turn the corresponding outcome into
 * a successful match at their index.
 */
struct MatchTarget {
  enum Type { LITERAL, REGEX, END_OF_FILE, TIMEOUT };

  Type type;
  string pattern;

  static MatchTarget literal(const string& text) { return {LITERAL, text}; }
  static MatchTarget regex(const string& re) { return {REGEX, re}; }
  static MatchTarget eof() { return {END_OF_FILE, ""}; }
  static MatchTarget timeout() { return {TIMEOUT, ""}; }
};

/** @brief Outcome of a successful search. */
struct MatchResult {
  int index = -1;
  /** @brief Span of the match within the searched buffer. */
  size_t start = 0;
  size_t end = 0;
  string before;
  string after;
  /** @brief Regex capture groups; empty for literals. */
  vector<string> groups;
};

/**
 * @brief An ordered list of compiled match targets.
 *
 * A search reports the target matching at the earliest position in the
 * buffer.  When several targets match at the same position the one listed
 * first wins.
 */
class PatternMatcher {
 public:
  PatternMatcher() {}

  /**
   * @brief Compiles the REGEX targets with Perl syntax.  '.' does not match a
   * newline and '^'/'$' anchor at the ends of the searched text only.
   * @throws PatternError if a regular expression does not compile.
   */
  static PatternMatcher compile(const vector<MatchTarget>& targets);

  /** @brief Regular expressions in order. */
  static PatternMatcher fromRegexes(const vector<string>& regexes);

  /** @brief Literal strings in order. */
  static PatternMatcher fromLiterals(const vector<string>& literals);

  /**
   * @brief Searches the last @p windowSize bytes of @p buffer (all of it
   * when 0).  A match that starts before the window is not found.
   * @throws PatternError if the regex engine gives up on the input.
   */
  optional<MatchResult> search(const string& buffer, size_t windowSize) const;

  /** @brief Index of the EOF sentinel, or -1. */
  int eofIndex() const { return eofIdx; }

  /** @brief Index of the TIMEOUT sentinel, or -1. */
  int timeoutIndex() const { return timeoutIdx; }

  size_t size() const { return targets.size(); }

  const MatchTarget& getTarget(int index) const { return targets[index]; }

 protected:
  vector<MatchTarget> targets;
  /** @brief Compiled form of each REGEX target, keyed by index. */
  map<int, boost::regex> regexes;
  int eofIdx = -1;
  int timeoutIdx = -1;
};
}  // namespace pe

#endif  // __PE_PATTERN_MATCHER__
