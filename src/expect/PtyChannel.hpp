#ifndef __PE_PTY_CHANNEL__
#define __PE_PTY_CHANNEL__

#include "ChildChannel.hpp"
#include "SessionConfig.hpp"

namespace pe {
/**
 * @brief A child process running on the slave side of a pseudo-terminal.
 * We hold the master side.
 */
class PtyChannel : public ChildChannel {
 public:
  /**
   * @brief Resolves @p command on PATH, forks a pty and execs it.
   * @throws SpawnError if the executable cannot be found, the pty cannot be
   * allocated, or exec fails in the child.
   */
  static unique_ptr<PtyChannel> spawn(const string& command,
                                      const vector<string>& args,
                                      const SessionConfig& config);

  virtual ~PtyChannel();

  virtual int getFd() { return masterFd; }
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

  virtual char getIntrChar();
  virtual char getEofChar();

  virtual optional<bool> getEcho();
  virtual bool setEcho(bool enabled);

  virtual pair<int, int> getWindowSize();
  virtual void setWindowSize(int rows, int cols);

 protected:
  PtyChannel(pid_t _pid, int _masterFd, const string& _path);

  /** @brief Runs in the forked child; never returns. */
  static void runChild(const char* path, char* const* argv, char* const* envp,
                       const SessionConfig& config, int errorPipeFd);

  pid_t pid;
  int masterFd;
  string path;
  /** @brief Set once the child has been reaped. */
  optional<ChildExit> reaped;
};
}  // namespace pe

#endif  // __PE_PTY_CHANNEL__
