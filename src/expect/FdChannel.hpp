#ifndef __PE_FD_CHANNEL__
#define __PE_FD_CHANNEL__

#include "ChildChannel.hpp"

namespace pe {
/**
 * @brief Drives an already open descriptor (a socket, a fifo, a tty opened
 * elsewhere).  The channel takes ownership and closes it.  There is no
 * process, so the channel is "alive" while the descriptor is valid.
 */
class FdChannel : public ChildChannel {
 public:
  /** @throws SpawnError if @p fd is not an open descriptor. */
  explicit FdChannel(int _fd);
  virtual ~FdChannel();

  virtual int getFd() { return fd; }
  virtual string getName();

  virtual ssize_t read(char* buf, size_t count);
  virtual void write(const char* buf, size_t count);

  virtual optional<ChildExit> pollExit();
  virtual ChildExit waitExit();

  virtual void closeChannel();
  virtual void teardown() { closeChannel(); }

 protected:
  int fd;
  int originalFd;
};
}  // namespace pe

#endif  // __PE_FD_CHANNEL__
