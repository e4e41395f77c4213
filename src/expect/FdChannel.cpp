#include "FdChannel.hpp"

#include "RawFdUtils.hpp"

namespace pe {
FdChannel::FdChannel(int _fd) : fd(_fd), originalFd(_fd) {
  if (!RawFdUtils::isValidFd(fd)) {
    throw SpawnError("Not an open file descriptor: " + to_string(fd));
  }
}

FdChannel::~FdChannel() { closeChannel(); }

string FdChannel::getName() { return "fd " + to_string(originalFd); }

ssize_t FdChannel::read(char* buf, size_t count) {
  if (fd < 0) {
    throw SessionClosedError(getName() + " is closed");
  }
  while (true) {
    ssize_t rc = ::read(fd, buf, count);
    if (rc >= 0) {
      return rc;
    }
    if (GetErrno() == EINTR) {
      continue;
    }
    if (GetErrno() == EIO) {
      return 0;
    }
    if (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK) {
      return -1;
    }
    throw std::runtime_error(string("Read error on ") + getName() + ": " +
                             strerror(GetErrno()));
  }
}

void FdChannel::write(const char* buf, size_t count) {
  if (fd < 0) {
    throw SessionClosedError(getName() + " is closed");
  }
  RawFdUtils::writeAll(fd, buf, count);
}

optional<ChildExit> FdChannel::pollExit() {
  if (fd >= 0 && RawFdUtils::isValidFd(fd)) {
    return nullopt;
  }
  return ChildExit();
}

ChildExit FdChannel::waitExit() {
  throw UnsupportedError("Cannot wait on " + getName() +
                         ", it has no process");
}

void FdChannel::closeChannel() {
  if (fd >= 0) {
    VLOG(1) << "Closing " << getName();
    ::close(fd);
    fd = -1;
  }
}
}  // namespace pe
