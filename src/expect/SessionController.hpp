#ifndef __PE_SESSION_CONTROLLER__
#define __PE_SESSION_CONTROLLER__

#include "ActiveSessionRegistry.hpp"
#include "ExpectEngine.hpp"

namespace pe {
/**
 * @brief Called when the session being replaced could not be torn down.
 * The spawn goes ahead regardless.
 */
typedef std::function<void(shared_ptr<ChildSession> session,
                           const string& error)>
    TeardownListener;

/**
 * @brief Entry point for callers that work with "the current session".
 *
 * Each spawn disposes of the active session first (kill for processes,
 * close for descriptors and serial ports) and then installs the new one.
 * Every other call applies to the active session and fails with
 * SessionNotInitializedError when there is none.
 */
class SessionController {
 public:
  explicit SessionController(
      const SessionConfig& _defaultConfig = SessionConfig());

  void setTeardownListener(TeardownListener listener) {
    teardownListener = listener;
  }

  shared_ptr<ChildSession> spawn(const string& command,
                                 const vector<string>& args = {},
                                 optional<SessionConfig> config = nullopt);
  shared_ptr<ChildSession> popenSpawn(const string& commandLine,
                                      optional<SessionConfig> config = nullopt);
  shared_ptr<ChildSession> fdSpawn(int fd,
                                   optional<SessionConfig> config = nullopt);
  shared_ptr<ChildSession> serialSpawn(
      const string& device, const SerialOptions& options = SerialOptions(),
      optional<SessionConfig> config = nullopt);

  /** @brief The active session, or null. */
  shared_ptr<ChildSession> currentActiveProcess() {
    return registry.current();
  }

  /**
   * @brief Switches to another session (or detaches with null) without
   * tearing the old one down.
   * @return The previously active session.
   */
  shared_ptr<ChildSession> setActiveProcess(shared_ptr<ChildSession> session) {
    return registry.setActive(session);
  }

  /**
   * @brief The active session.  Forwarded calls hold the returned pointer
   * until they return, so swapping the registry meanwhile cannot destroy
   * the session under them.
   * @throws SessionNotInitializedError
   */
  shared_ptr<ChildSession> active();

  size_t send(const string& s) { return active()->send(s); }
  size_t sendLine(const string& s = "") { return active()->sendLine(s); }
  void write(const string& s) { active()->write(s); }
  void writeLines(const vector<string>& lines) {
    active()->writeLines(lines);
  }
  size_t sendControl(char key) { return active()->sendControl(key); }
  void sendEof() { active()->sendEof(); }
  void sendIntr() { active()->sendIntr(); }

  string readNonBlocking(int maxBytes, optional<double> timeout) {
    return active()->readNonBlocking(maxBytes, timeout);
  }
  string read(int size = -1) { return active()->read(size); }
  string readLine(int size = -1) { return active()->readLine(size); }

  int expect(const vector<string>& regexes,
             ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
             optional<size_t> searchWindowSize = nullopt) {
    return ExpectEngine::expect(*active(), regexes, timeout,
                                searchWindowSize);
  }
  int expectExact(const vector<string>& literals,
                  ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
                  optional<size_t> searchWindowSize = nullopt) {
    return ExpectEngine::expectExact(*active(), literals, timeout,
                                     searchWindowSize);
  }
  int expectTargets(const vector<MatchTarget>& targets,
                    ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
                    optional<size_t> searchWindowSize = nullopt) {
    return ExpectEngine::expectTargets(*active(), targets, timeout,
                                       searchWindowSize);
  }
  int expectList(const PatternMatcher& matcher,
                 ExpectTimeout timeout = ExpectTimeout::sessionDefault(),
                 optional<size_t> searchWindowSize = nullopt) {
    return ExpectEngine::expectList(*active(), matcher, timeout,
                                    searchWindowSize);
  }

  bool isAlive() { return active()->isAlive(); }
  ChildExit wait() { return active()->wait(); }
  void close(bool force = false) { active()->close(force); }
  bool terminate(bool force = false) { return active()->terminate(force); }
  void kill(int signum) { active()->kill(signum); }

  optional<bool> getEcho() { return active()->getEcho(); }
  bool setEcho(bool enabled) { return active()->setEcho(enabled); }
  bool waitNoEcho(ExpectTimeout timeout = ExpectTimeout::sessionDefault()) {
    return active()->waitNoEcho(timeout);
  }
  pair<int, int> getWindowSize() { return active()->getWindowSize(); }
  void setWindowSize(int rows, int cols) {
    active()->setWindowSize(rows, cols);
  }

  string getBefore() { return active()->getBefore(); }
  string getAfter() { return active()->getAfter(); }
  vector<string> getMatchGroups() { return active()->getMatchGroups(); }
  bool eof() { return active()->eof(); }
  pid_t getPid() { return active()->getPid(); }
  optional<int> getExitStatus() { return active()->getExitStatus(); }
  optional<int> getSignalStatus() { return active()->getSignalStatus(); }
  int getMatchIndex() { return active()->getMatchIndex(); }
  string getBuffer() { return active()->getBuffer(); }
  int getStatus() { return active()->getStatus(); }
  int getChildFd() { return active()->getChildFd(); }

  optional<double> getTimeout() { return active()->getConfig().timeout; }
  void setTimeout(optional<double> timeout) { active()->setTimeout(timeout); }
  int getMaxRead() { return active()->getConfig().maxRead; }
  void setMaxRead(int maxRead) { active()->setMaxRead(maxRead); }

  void setLogfile(ostream* s) { active()->setLogfile(s); }
  void setLogfileRead(ostream* s) { active()->setLogfileRead(s); }
  void setLogfileSend(ostream* s) { active()->setLogfileSend(s); }

  /** @brief Resolves an executable on PATH (from @p env if given). */
  static optional<string> which(const string& filename,
                                const map<string, string>* env = nullptr);

 protected:
  /**
   * @brief Tears down the active session, builds a new one with @p factory
   * and installs it.  A failing factory leaves the registry as it was.
   */
  shared_ptr<ChildSession> replaceActive(
      std::function<shared_ptr<ChildSession>()> factory);

  void teardownQuietly(shared_ptr<ChildSession> session);

  SessionConfig defaultConfig;
  ActiveSessionRegistry registry;
  TeardownListener teardownListener;
};
}  // namespace pe

#endif  // __PE_SESSION_CONTROLLER__
