#ifndef __PE_PIPE_CHANNEL__
#define __PE_PIPE_CHANNEL__

#include "ChildChannel.hpp"
#include "SessionConfig.hpp"

namespace pe {
/**
 * @brief A child process connected through plain pipes.  stdout and stderr
 * share one pipe.  There is no terminal, so no echo, no window size and no
 * line discipline: end of input is signalled by closing stdin.
 */
class PipeChannel : public ChildChannel {
 public:
  /**
   * @brief Runs @p commandLine (split into words like a shell would, without
   * expansion) with its standard streams redirected to pipes.
   * @throws SpawnError if the executable cannot be found or exec fails.
   */
  static unique_ptr<PipeChannel> spawn(const string& commandLine,
                                       const SessionConfig& config);

  virtual ~PipeChannel();

  virtual int getFd() { return outputFd; }
  virtual pid_t getPid() { return pid; }
  virtual string getName();

  virtual ssize_t read(char* buf, size_t count);
  virtual void write(const char* buf, size_t count);

  virtual optional<ChildExit> pollExit();
  virtual ChildExit waitExit();

  virtual void closeChannel();
  virtual void teardown();

  virtual bool supportsSignals() { return true; }
  virtual void sendSignal(int signum);

  /** @brief Closes the child's stdin. */
  virtual void sendEof();

 protected:
  PipeChannel(pid_t _pid, int _inputFd, int _outputFd, const string& _path);

  pid_t pid;
  int inputFd;
  int outputFd;
  string path;
  optional<ChildExit> reaped;
};
}  // namespace pe

#endif  // __PE_PIPE_CHANNEL__
