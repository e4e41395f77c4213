#ifndef __PE_CHILD_CHANNEL__
#define __PE_CHILD_CHANNEL__

#include "ExpectErrors.hpp"
#include "Headers.hpp"

namespace pe {
/**
 * @brief How a child ended.  Channels without a process (plain descriptors,
 * serial ports) report an empty ChildExit once they are closed.
 */
struct ChildExit {
  /** @brief Raw status from waitpid(), 0 when there is no process. */
  int status = 0;
  optional<int> exitStatus;
  optional<int> signalStatus;

  static ChildExit fromWaitStatus(int status) {
    ChildExit ce;
    ce.status = status;
    if (WIFEXITED(status)) {
      ce.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      ce.signalStatus = WTERMSIG(status);
    }
    return ce;
  }
};

/**
 * @brief Capability interface for whatever a session talks to: a process on
 * a pseudo-terminal, a process on pipes, a raw descriptor, or a serial port.
 *
 * ChildSession only ever goes through this interface.  Optional capabilities
 * (signals, echo, window size) have defaults that report them unsupported.
 */
class ChildChannel {
 public:
  virtual ~ChildChannel() {}

  /** @brief Descriptor that output is read from, -1 once closed. */
  virtual int getFd() = 0;

  /** @brief Process id of the child, -1 when there is no process. */
  virtual pid_t getPid() { return -1; }

  /** @brief Human readable description used in logs and errors. */
  virtual string getName() = 0;

  /**
   * @brief Waits until output (or end of stream) is ready to read.
   * @param timeout Seconds; nullopt blocks forever, 0 polls once.
   */
  virtual bool waitForData(optional<double> timeout);

  /**
   * @brief Reads whatever is immediately available, up to @p count bytes.
   * @return Bytes read, 0 at end of stream.
   */
  virtual ssize_t read(char* buf, size_t count) = 0;

  /** @brief Writes all of @p count bytes or throws. */
  virtual void write(const char* buf, size_t count) = 0;

  /** @brief Non-blocking exit check; nullopt while the child runs. */
  virtual optional<ChildExit> pollExit() = 0;

  /** @brief Blocks until the child exits. */
  virtual ChildExit waitExit() = 0;

  /** @brief Releases the descriptor.  Must be safe to call twice. */
  virtual void closeChannel() = 0;

  /**
   * @brief Forcefully disposes of the child before a new session replaces
   * this one.  Only acts if the child is still alive.
   */
  virtual void teardown() = 0;

  /** @brief True if signals can be delivered to the child. */
  virtual bool supportsSignals() { return false; }

  virtual void sendSignal(int signum) {
    throw UnsupportedError("Signals are not supported by " + getName());
  }

  /** @brief Signals end of input to the child (^D by default). */
  virtual void sendEof();

  /** @brief Character that interrupts the child (^C by default). */
  virtual char getIntrChar() { return 3; }

  /** @brief Character that signals end of input (^D by default). */
  virtual char getEofChar() { return 4; }

  /** @brief Terminal echo state, nullopt when the channel has no echo. */
  virtual optional<bool> getEcho() { return nullopt; }

  /** @brief Returns false when the channel has no echo to set. */
  virtual bool setEcho(bool enabled) { return false; }

  virtual pair<int, int> getWindowSize() {
    throw UnsupportedError("Window size is not supported by " + getName());
  }

  virtual void setWindowSize(int rows, int cols) {
    throw UnsupportedError("Window size is not supported by " + getName());
  }

  /** @brief Pushes any buffered output to the device. */
  virtual void flush() {}
};
}  // namespace pe

#endif  // __PE_CHILD_CHANNEL__
