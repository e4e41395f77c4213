#ifndef __PE_EXPECT_ERRORS__
#define __PE_EXPECT_ERRORS__

#include "Headers.hpp"

namespace pe {
/**
 * @brief Base class of every error raised by the expect library.
 */
class ExpectError : public std::runtime_error {
 public:
  explicit ExpectError(const string& what) : std::runtime_error(what) {}
};

/** @brief The executable could not be resolved or the OS refused to spawn. */
class SpawnError : public ExpectError {
 public:
  explicit SpawnError(const string& what) : ExpectError(what) {}
};

/** @brief An I/O operation was attempted on a closed session. */
class SessionClosedError : public ExpectError {
 public:
  explicit SessionClosedError(const string& what) : ExpectError(what) {}
};

/** @brief No output arrived (or no pattern matched) before the deadline. */
class TimeoutError : public ExpectError {
 public:
  explicit TimeoutError(const string& what) : ExpectError(what) {}
};

/** @brief The child exited and all of its output has been consumed. */
class EndOfFileError : public ExpectError {
 public:
  explicit EndOfFileError(const string& what) : ExpectError(what) {}
};

/** @brief A match target could not be compiled. */
class PatternError : public ExpectError {
 public:
  explicit PatternError(const string& what) : ExpectError(what) {}
};

/** @brief The channel does not provide the requested capability. */
class UnsupportedError : public ExpectError {
 public:
  explicit UnsupportedError(const string& what) : ExpectError(what) {}
};

/** @brief An operation needed an active session but none is installed. */
class SessionNotInitializedError : public ExpectError {
 public:
  explicit SessionNotInitializedError(const string& what)
      : ExpectError(what) {}
};

/** @brief Child output is not valid in the configured encoding. */
class DecodeError : public ExpectError {
 public:
  explicit DecodeError(const string& what) : ExpectError(what) {}
};
}  // namespace pe

#endif  // __PE_EXPECT_ERRORS__
