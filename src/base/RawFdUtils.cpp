#include "RawFdUtils.hpp"

namespace pe {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to child: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to child: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::waitForReadable(int fd, optional<double> timeout) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for waitForReadable");
  }
  double deadline = timeout ? monotonicSeconds() + *timeout : 0.0;
  while (true) {
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(fd, &fdset);
    timeval tv;
    timeval* tvp = NULL;
    if (timeout) {
      tv = secondsToTimeval(deadline - monotonicSeconds());
      tvp = &tv;
    }
    VLOG(4) << "Before selecting fd " << fd;
    int rc = select(fd + 1, &fdset, NULL, NULL, tvp);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        // Interrupted by a signal (e.g. SIGCHLD), wait out the remainder
        continue;
      }
      throw std::runtime_error(string("select() failed: ") +
                               strerror(GetErrno()));
    }
    return rc > 0 && FD_ISSET(fd, &fdset);
  }
}

bool RawFdUtils::isValidFd(int fd) {
  if (fd < 0) {
    return false;
  }
  return ::fcntl(fd, F_GETFD) != -1 || GetErrno() != EBADF;
}

void RawFdUtils::setCloseOnExec(int fd, bool enabled) {
  int flags = ::fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  if (enabled) {
    flags |= FD_CLOEXEC;
  } else {
    flags &= ~FD_CLOEXEC;
  }
  FATAL_FAIL(::fcntl(fd, F_SETFD, flags));
}
}  // namespace pe
