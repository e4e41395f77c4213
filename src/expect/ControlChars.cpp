#include "ControlChars.hpp"

namespace pe {
optional<char> controlCode(char key) {
  char lower = (char)::tolower((unsigned char)key);
  if (lower >= 'a' && lower <= 'z') {
    return (char)(lower - 'a' + 1);
  }
  switch (key) {
    case '@':
    case '`':
      return (char)0;
    case '[':
    case '{':
      return (char)27;
    case '\\':
    case '|':
      return (char)28;
    case ']':
    case '}':
      return (char)29;
    case '^':
    case '~':
      return (char)30;
    case '_':
      return (char)31;
    case '?':
      return (char)127;
    default:
      return nullopt;
  }
}
}  // namespace pe
