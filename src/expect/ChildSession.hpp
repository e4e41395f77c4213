#ifndef __PE_CHILD_SESSION__
#define __PE_CHILD_SESSION__

#include "ChildChannel.hpp"
#include "SerialChannel.hpp"
#include "SessionConfig.hpp"
#include "Utf8Decoder.hpp"

namespace pe {
class ExpectEngine;

/**
 * @brief One child (process, descriptor or serial line) and everything we
 * know about it: the unconsumed output buffer, the results of the last
 * match, and how it exited.
 *
 * A session is driven by a single caller at a time.  Once closed, every
 * send and read fails with SessionClosedError.
 */
class ChildSession {
 public:
  ChildSession(unique_ptr<ChildChannel> _channel, const SessionConfig& _config);
  virtual ~ChildSession();

  /**
   * @brief Starts @p command on a new pseudo-terminal.  With no @p args the
   * command string is split into words.
   * @throws SpawnError
   */
  static shared_ptr<ChildSession> spawn(const string& command,
                                        const vector<string>& args,
                                        const SessionConfig& config);

  /** @brief Starts @p commandLine with plain pipes instead of a terminal. */
  static shared_ptr<ChildSession> popenSpawn(const string& commandLine,
                                             const SessionConfig& config);

  /** @brief Takes over an open descriptor. */
  static shared_ptr<ChildSession> fdSpawn(int fd, const SessionConfig& config);

  /** @brief Opens a serial device. */
  static shared_ptr<ChildSession> serialSpawn(const string& device,
                                              const SerialOptions& options,
                                              const SessionConfig& config);

  /**
   * @brief Writes @p s to the child after the configured send delay.
   * @return Number of bytes written.
   */
  size_t send(const string& s);

  /** @brief send() followed by the line separator. */
  size_t sendLine(const string& s = "");

  void write(const string& s) { send(s); }

  /** @brief Sends each string in turn, without adding separators. */
  void writeLines(const vector<string>& lines);

  /**
   * @brief Sends the control character for @p key, e.g. 'c' for ^C.
   * @return 1, or 0 (and nothing sent) when @p key has no control code.
   */
  size_t sendControl(char key);

  /** @brief Signals end of input: the VEOF character, or closing stdin. */
  void sendEof();

  /** @brief Sends the terminal's interrupt character. */
  void sendIntr();

  /**
   * @brief Waits up to @p timeout seconds for output and returns up to
   * @p maxBytes of whatever is available.
   *
   * @param timeout nullopt blocks indefinitely, 0 polls once.
   * @throws TimeoutError when nothing arrives in time.
   * @throws EndOfFileError when the child is gone and its output drained.
   */
  string readNonBlocking(int maxBytes, optional<double> timeout);

  /**
   * @brief Reads @p size bytes, or until end of file when @p size is
   * negative.  Returns fewer bytes if the child exits first.
   */
  string read(int size = -1);

  /** @brief Reads through the next "\r\n", or the rest at end of file. */
  string readLine(int size = -1);

  /** @brief Non-blocking liveness check, recording the exit status. */
  bool isAlive();

  /** @brief Blocks until the child exits.  Later calls return the cache. */
  ChildExit wait();

  /**
   * @brief Closes the channel and, if the child is still around, walks the
   * terminate ladder.  Calling it again does nothing.
   */
  void close(bool force = false);

  /**
   * @brief Sends SIGHUP, SIGCONT and SIGINT (and SIGKILL when @p force is
   * set), pausing after each, until the child is gone.
   * @return true if the child is no longer alive.
   */
  bool terminate(bool force = false);

  /** @brief Delivers @p signum if the child is alive. */
  void kill(int signum);

  /**
   * @brief Disposes of the child without ceremony before another session
   * takes its place.  Leaves the session closed.
   */
  void teardown();

  /** @brief Echo state of the terminal, nullopt when there is none. */
  optional<bool> getEcho();

  /** @brief Returns false when the channel has no echo to change. */
  bool setEcho(bool enabled);

  /**
   * @brief Polls until echo is off.
   * @return false if echo is still on (or unknown) when @p timeout expires.
   */
  bool waitNoEcho(ExpectTimeout timeout = ExpectTimeout::sessionDefault());

  pair<int, int> getWindowSize();
  void setWindowSize(int rows, int cols);

  bool eof() const { return eofFlag; }
  bool isClosed() const { return closed; }
  pid_t getPid() { return pid; }
  int getChildFd() { return closed ? -1 : channel->getFd(); }
  string getName() { return channel->getName(); }

  int getStatus() const { return status; }
  optional<int> getExitStatus() const { return exitStatus; }
  optional<int> getSignalStatus() const { return signalStatus; }

  const string& getBuffer() const { return buffer; }
  const string& getBefore() const { return before; }
  const string& getAfter() const { return after; }
  const vector<string>& getMatchGroups() const { return matchGroups; }
  int getMatchIndex() const { return matchIndex; }

  const SessionConfig& getConfig() const { return config; }
  void setTimeout(optional<double> timeout) { config.timeout = timeout; }
  void setMaxRead(int maxRead) { config.maxRead = maxRead; }

  /** @brief Streams receiving a copy of the traffic.  Not owned. */
  void setLogfile(ostream* s) { logfile = s; }
  void setLogfileRead(ostream* s) { logfileRead = s; }
  void setLogfileSend(ostream* s) { logfileSend = s; }

 protected:
  friend class ExpectEngine;

  void checkOpen();
  void recordExit(const ChildExit& ce);
  string decode(const string& raw);
  void logTraffic(const string& s, bool outgoing);

  unique_ptr<ChildChannel> channel;
  SessionConfig config;
  unique_ptr<Utf8Decoder> decoder;
  pid_t pid;

  string buffer;
  string before;
  string after;
  vector<string> matchGroups;
  int matchIndex;

  // Read by calls still in flight when another caller tears us down
  std::atomic<bool> closed;
  bool eofFlag;
  bool terminated;
  int status;
  optional<int> exitStatus;
  optional<int> signalStatus;

  ostream* logfile;
  ostream* logfileRead;
  ostream* logfileSend;
};
}  // namespace pe

#endif  // __PE_CHILD_SESSION__
