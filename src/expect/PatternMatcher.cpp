#include "PatternMatcher.hpp"

namespace pe {
PatternMatcher PatternMatcher::compile(const vector<MatchTarget>& targets) {
  PatternMatcher pm;
  pm.targets = targets;
  for (int i = 0; i < (int)targets.size(); i++) {
    const MatchTarget& target = targets[i];
    switch (target.type) {
      case MatchTarget::LITERAL:
        if (target.pattern.empty()) {
          throw PatternError("Empty literal at index " + to_string(i));
        }
        break;
      case MatchTarget::REGEX:
        try {
          pm.regexes.emplace(
              i, boost::regex(target.pattern, boost::regex::perl |
                                                  boost::regex::no_mod_s |
                                                  boost::regex::no_mod_m));
        } catch (const boost::regex_error& re) {
          throw PatternError("Invalid regular expression '" + target.pattern +
                             "': " + re.what());
        }
        break;
      case MatchTarget::END_OF_FILE:
        // Only the first sentinel of each kind counts
        if (pm.eofIdx < 0) pm.eofIdx = i;
        break;
      case MatchTarget::TIMEOUT:
        if (pm.timeoutIdx < 0) pm.timeoutIdx = i;
        break;
    }
  }
  return pm;
}

PatternMatcher PatternMatcher::fromRegexes(const vector<string>& regexes) {
  vector<MatchTarget> targets;
  for (const auto& re : regexes) {
    targets.push_back(MatchTarget::regex(re));
  }
  return compile(targets);
}

PatternMatcher PatternMatcher::fromLiterals(const vector<string>& literals) {
  vector<MatchTarget> targets;
  for (const auto& literal : literals) {
    targets.push_back(MatchTarget::literal(literal));
  }
  return compile(targets);
}

optional<MatchResult> PatternMatcher::search(const string& buffer,
                                             size_t windowSize) const {
  size_t windowStart = 0;
  if (windowSize > 0 && buffer.size() > windowSize) {
    windowStart = buffer.size() - windowSize;
  }

  optional<MatchResult> best;
  for (int i = 0; i < (int)targets.size(); i++) {
    const MatchTarget& target = targets[i];
    size_t start, end;
    vector<string> groups;
    if (target.type == MatchTarget::LITERAL) {
      size_t pos = buffer.find(target.pattern, windowStart);
      if (pos == string::npos) {
        continue;
      }
      start = pos;
      end = pos + target.pattern.size();
    } else if (target.type == MatchTarget::REGEX) {
      auto it = regexes.find(i);
      if (it == regexes.end()) {
        STFATAL << "Regex target " << i << " was never compiled";
      }
      // Lookbehind, \b and ^ see the byte before the window
      boost::match_flag_type flags = boost::match_default;
      if (windowStart > 0) {
        flags = flags | boost::match_prev_avail;
      }
      boost::smatch m;
      try {
        if (!boost::regex_search(buffer.begin() + windowStart, buffer.end(),
                                 m, it->second, flags)) {
          continue;
        }
      } catch (const std::runtime_error& re) {
        // Thrown when matching exceeds the engine's complexity limits
        throw PatternError("Cannot search for '" + target.pattern +
                           "': " + re.what());
      }
      start = windowStart + m.position(0);
      end = start + m.length(0);
      for (size_t g = 1; g < m.size(); g++) {
        groups.push_back(m[g].str());
      }
    } else {
      continue;
    }

    // Strictly earlier wins, so equal positions keep the lower index
    if (!best || start < best->start) {
      MatchResult result;
      result.index = i;
      result.start = start;
      result.end = end;
      result.groups = groups;
      best = result;
    }
  }

  if (best) {
    best->before = buffer.substr(0, best->start);
    best->after = buffer.substr(best->start, best->end - best->start);
  }
  return best;
}
}  // namespace pe
