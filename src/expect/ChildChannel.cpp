#include "ChildChannel.hpp"

#include "RawFdUtils.hpp"

namespace pe {
bool ChildChannel::waitForData(optional<double> timeout) {
  int fd = getFd();
  if (fd < 0) {
    throw SessionClosedError(getName() + " is closed");
  }
  return RawFdUtils::waitForReadable(fd, timeout);
}

void ChildChannel::sendEof() {
  char c = getEofChar();
  write(&c, 1);
}
}  // namespace pe
