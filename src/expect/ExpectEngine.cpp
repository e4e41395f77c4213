#include "ExpectEngine.hpp"

namespace pe {
namespace {
// Keeps error messages readable when the buffer is large
string tailOf(const string& s) {
  const size_t MAX_SHOWN = 100;
  if (s.length() <= MAX_SHOWN) {
    return s;
  }
  return "..." + s.substr(s.length() - MAX_SHOWN);
}
}  // namespace

int ExpectEngine::expect(ChildSession& session, const vector<string>& regexes,
                         ExpectTimeout timeout,
                         optional<size_t> searchWindowSize) {
  return expectList(session, PatternMatcher::fromRegexes(regexes), timeout,
                    searchWindowSize);
}

int ExpectEngine::expectExact(ChildSession& session,
                              const vector<string>& literals,
                              ExpectTimeout timeout,
                              optional<size_t> searchWindowSize) {
  return expectList(session, PatternMatcher::fromLiterals(literals), timeout,
                    searchWindowSize);
}

int ExpectEngine::expectTargets(ChildSession& session,
                                const vector<MatchTarget>& targets,
                                ExpectTimeout timeout,
                                optional<size_t> searchWindowSize) {
  return expectList(session, PatternMatcher::compile(targets), timeout,
                    searchWindowSize);
}

int ExpectEngine::expectList(ChildSession& session,
                             const PatternMatcher& matcher,
                             ExpectTimeout timeout,
                             optional<size_t> searchWindowSize) {
  session.checkOpen();
  const SessionConfig& config = session.getConfig();
  size_t windowSize = searchWindowSize.value_or(config.searchWindowSize);

  auto index = searchBuffer(session, matcher, windowSize);
  if (index) {
    return *index;
  }

  optional<double> remaining = timeout.resolve(config);
  double deadline = monotonicSeconds() + remaining.value_or(0.0);
  try {
    while (true) {
      if (remaining && *remaining < 0) {
        throw TimeoutError("Timeout exceeded in expect on " +
                           session.getName());
      }
      string incoming =
          session.readNonBlocking(session.getConfig().maxRead, remaining);
      if (config.delayAfterRead) {
        sleepSeconds(*config.delayAfterRead);
      }
      if (!incoming.empty()) {
        session.buffer.append(incoming);
        index = searchBuffer(session, matcher, windowSize);
        if (index) {
          return *index;
        }
      }
      if (remaining) {
        remaining = deadline - monotonicSeconds();
      }
    }
  } catch (const EndOfFileError& eofError) {
    return onEndOfFile(session, matcher, eofError);
  } catch (const TimeoutError& timeoutError) {
    return onTimeout(session, matcher, timeoutError);
  }
}

string ExpectEngine::readSize(ChildSession& session, size_t size,
                              ExpectTimeout timeout) {
  session.checkOpen();
  const SessionConfig& config = session.getConfig();
  optional<double> remaining = timeout.resolve(config);
  double deadline = monotonicSeconds() + remaining.value_or(0.0);
  try {
    while (session.buffer.length() < size) {
      if (remaining && *remaining < 0) {
        throw TimeoutError("Timeout exceeded reading from " +
                           session.getName());
      }
      session.buffer.append(
          session.readNonBlocking(config.maxRead, remaining));
      if (config.delayAfterRead) {
        sleepSeconds(*config.delayAfterRead);
      }
      if (remaining) {
        remaining = deadline - monotonicSeconds();
      }
    }
  } catch (const EndOfFileError& eofError) {
    PatternMatcher untilEof = PatternMatcher::compile({MatchTarget::eof()});
    onEndOfFile(session, untilEof, eofError);
    return session.before;
  } catch (const TimeoutError& timeoutError) {
    onTimeout(session, PatternMatcher(), timeoutError);
  }

  session.before.clear();
  session.after = session.buffer.substr(0, size);
  session.matchGroups.clear();
  session.matchIndex = 0;
  session.buffer.erase(0, size);
  return session.after;
}

optional<int> ExpectEngine::searchBuffer(ChildSession& session,
                                         const PatternMatcher& matcher,
                                         size_t windowSize) {
  auto result = matcher.search(session.buffer, windowSize);
  if (!result) {
    return nullopt;
  }
  VLOG(1) << "Matched target " << result->index << " at offset "
          << result->start;
  session.before = result->before;
  session.after = result->after;
  session.matchGroups = result->groups;
  session.matchIndex = result->index;
  session.buffer.erase(0, result->end);
  return result->index;
}

int ExpectEngine::onEndOfFile(ChildSession& session,
                              const PatternMatcher& matcher,
                              const EndOfFileError& eofError) {
  session.before = session.buffer;
  session.buffer.clear();
  session.after.clear();
  session.matchGroups.clear();
  if (matcher.eofIndex() >= 0) {
    session.matchIndex = matcher.eofIndex();
    return matcher.eofIndex();
  }
  session.matchIndex = -1;
  throw EndOfFileError(string(eofError.what()) + "; before: '" +
                       tailOf(session.before) + "'");
}

int ExpectEngine::onTimeout(ChildSession& session,
                            const PatternMatcher& matcher,
                            const TimeoutError& timeoutError) {
  session.before = session.buffer;
  session.after.clear();
  session.matchGroups.clear();
  if (matcher.timeoutIndex() >= 0) {
    session.matchIndex = matcher.timeoutIndex();
    return matcher.timeoutIndex();
  }
  session.matchIndex = -1;
  throw TimeoutError(string(timeoutError.what()) + "; before: '" +
                     tailOf(session.before) + "'");
}
}  // namespace pe
