#ifndef __PE_EXPECT_ENGINE__
#define __PE_EXPECT_ENGINE__

#include "ChildSession.hpp"
#include "PatternMatcher.hpp"

namespace pe {
/**
 * @brief The read/match loop.
 *
 * The session's buffer is searched first, so output left over from an
 * earlier expect can satisfy the next one without any read.  After that
 * every iteration waits for output with whatever is left of the overall
 * timeout, appends it to the buffer and searches again.
 *
 * On a match, the session's before/after/groups describe it and the buffer
 * keeps only what followed the match.  End of file moves the whole buffer
 * to before; a timeout copies it to before and keeps it.  Either outcome is
 * returned as a match when the list holds the corresponding sentinel and
 * raised (EndOfFileError, TimeoutError) otherwise.
 */
class ExpectEngine {
 public:
  /** @brief Regular expressions, in priority order on ties. */
  static int expect(ChildSession& session, const vector<string>& regexes,
                    ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
                    optional<size_t> searchWindowSize = nullopt);

  /** @brief Literal strings, no regex interpretation. */
  static int expectExact(
      ChildSession& session, const vector<string>& literals,
      ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
      optional<size_t> searchWindowSize = nullopt);

  /** @brief Mixed targets, including EOF and TIMEOUT sentinels. */
  static int expectTargets(
      ChildSession& session, const vector<MatchTarget>& targets,
      ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
      optional<size_t> searchWindowSize = nullopt);

  /**
   * @brief Runs the loop with an already compiled matcher.
   * @return Index of the matching target.
   */
  static int expectList(ChildSession& session, const PatternMatcher& matcher,
                        ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
                        optional<size_t> searchWindowSize = nullopt);

  /**
   * @brief Takes @p size bytes from the buffer, reading more while it is
   * short.  At end of file whatever is left is returned (possibly fewer
   * bytes) and the buffer is emptied.  No search window applies.
   * @throws TimeoutError with the partial data left in the buffer.
   */
  static string readSize(
      ChildSession& session, size_t size,
      ExpectTimeout timeout = ExpectTimeout::sessionDefault());

 protected:
  static int onEndOfFile(ChildSession& session, const PatternMatcher& matcher,
                         const EndOfFileError& eofError);
  static int onTimeout(ChildSession& session, const PatternMatcher& matcher,
                       const TimeoutError& timeoutError);
  static optional<int> searchBuffer(ChildSession& session,
                                    const PatternMatcher& matcher,
                                    size_t windowSize);
};
}  // namespace pe

#endif  // __PE_EXPECT_ENGINE__
