#ifndef __PE_RAW_FD_UTILS__
#define __PE_RAW_FD_UTILS__

#include "Headers.hpp"

namespace pe {
/**
 * @brief Blocking helpers around POSIX descriptors (ptys, pipes, ttys).
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   * @throws std::runtime_error when the descriptor is invalid or the write
   * fails.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits until @p fd is readable.
   * @param timeout Seconds to wait; nullopt blocks indefinitely and 0 polls
   * once.
   * @return true if the descriptor became readable (or hung up).
   */
  static bool waitForReadable(int fd, optional<double> timeout);

  /** @brief Returns true if @p fd refers to an open descriptor. */
  static bool isValidFd(int fd);

  /** @brief Sets or clears FD_CLOEXEC. */
  static void setCloseOnExec(int fd, bool enabled);
};
}  // namespace pe
#endif  // __PE_RAW_FD_UTILS__
