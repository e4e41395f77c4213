#include "PtyChannel.hpp"

#include "RawFdUtils.hpp"
#include "SubprocessUtils.hpp"

namespace pe {
namespace {
// Writes errno to the exec error pipe and leaves.  Only async-signal-safe
// calls are allowed after fork.
[[noreturn]] void failChild(int errorPipeFd, const char* stage) {
  int err = errno;
  char code = stage[0];
  ssize_t ignored = ::write(errorPipeFd, &code, 1);
  ignored = ::write(errorPipeFd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}
}  // namespace

unique_ptr<PtyChannel> PtyChannel::spawn(const string& command,
                                         const vector<string>& args,
                                         const SessionConfig& config) {
  vector<string> argv;
  if (args.empty()) {
    // A bare command line such as "ls -l /tmp"
    argv = SubprocessUtils::splitCommandLine(command);
  } else {
    argv.push_back(command);
    argv.insert(argv.end(), args.begin(), args.end());
  }
  if (argv.empty()) {
    throw SpawnError("Empty command");
  }

  const map<string, string>* env = config.env ? &(*config.env) : nullptr;
  auto resolved = SubprocessUtils::which(argv[0], env);
  if (!resolved) {
    throw SpawnError("The command was not found or was not executable: " +
                     argv[0]);
  }

  int errorPipe[2];
  if (::pipe(errorPipe) == -1) {
    throw SpawnError(string("Cannot create exec pipe: ") +
                     strerror(GetErrno()));
  }
  RawFdUtils::setCloseOnExec(errorPipe[0], true);
  RawFdUtils::setCloseOnExec(errorPipe[1], true);

  winsize ws;
  memset(&ws, 0, sizeof(winsize));
  ws.ws_row = config.rows;
  ws.ws_col = config.cols;

  // Everything the child needs is built before forking
  vector<char*> argArray;
  for (const auto& arg : argv) {
    argArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argArray.push_back(NULL);
  vector<string> envStrings;
  vector<char*> envArray;
  if (config.env) {
    for (const auto& it : *config.env) {
      envStrings.push_back(it.first + "=" + it.second);
    }
    for (auto& s : envStrings) {
      envArray.push_back(&s[0]);
    }
    envArray.push_back(NULL);
  }

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &ws);
  switch (pid) {
    case -1: {
      int err = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw SpawnError(string("forkpty failed: ") + strerror(err));
    }
    case 0: {
      ::close(errorPipe[0]);
      runChild(resolved->c_str(), argArray.data(),
               config.env ? envArray.data() : NULL, config, errorPipe[1]);
      _exit(127);
    }
    default: {
      // parent
    }
  }

  ::close(errorPipe[1]);
  RawFdUtils::setCloseOnExec(masterFd, true);
  unique_ptr<PtyChannel> channel(new PtyChannel(pid, masterFd, *resolved));

  // A successful exec closes the pipe without writing to it
  char stage = 0;
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &stage, 1);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc == 1) {
    ssize_t got = 0;
    while (got < (ssize_t)sizeof(childErrno)) {
      ssize_t n = ::read(errorPipe[0], ((char*)&childErrno) + got,
                         sizeof(childErrno) - got);
      if (n <= 0) {
        break;
      }
      got += n;
    }
  }
  ::close(errorPipe[0]);
  if (rc == 1) {
    channel->waitExit();
    string what =
        stage == 'c' ? "chdir to " + config.cwd : "exec of " + *resolved;
    throw SpawnError(what + " failed: " + strerror(childErrno));
  }

  LOG(INFO) << "Spawned " << *resolved << " with pid " << pid << " on pty fd "
            << masterFd;
  return channel;
}

void PtyChannel::runChild(const char* path, char* const* argv,
                          char* const* envp, const SessionConfig& config,
                          int errorPipeFd) {
  // Children should not inherit our dispositions for these two
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  if (config.ignoreSighup) {
    signal(SIGHUP, SIG_IGN);
  } else {
    signal(SIGHUP, SIG_DFL);
  }

  if (!config.echo) {
    termios attr;
    if (tcgetattr(STDIN_FILENO, &attr) == 0) {
      attr.c_lflag &= ~ECHO;
      tcsetattr(STDIN_FILENO, TCSANOW, &attr);
    }
  }

  if (!config.cwd.empty() && ::chdir(config.cwd.c_str()) == -1) {
    failChild(errorPipeFd, "chdir");
  }

  if (envp) {
    execve(path, argv, envp);
  } else {
    execv(path, argv);
  }
  failChild(errorPipeFd, "exec");
}

PtyChannel::PtyChannel(pid_t _pid, int _masterFd, const string& _path)
    : pid(_pid), masterFd(_masterFd), path(_path) {}

PtyChannel::~PtyChannel() {
  closeChannel();
  if (!reaped && pid > 0) {
    // Nobody closed the session, make sure the child does not outlive it
    ::kill(pid, SIGKILL);
    int status;
    while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
  }
}

string PtyChannel::getName() {
  return "pty child " + path + " (pid " + to_string(pid) + ")";
}

ssize_t PtyChannel::read(char* buf, size_t count) {
  if (masterFd < 0) {
    throw SessionClosedError(getName() + " is closed");
  }
  while (true) {
    ssize_t rc = ::read(masterFd, buf, count);
    if (rc >= 0) {
      return rc;
    }
    int readErrno = GetErrno();
    if (readErrno == EINTR) {
      continue;
    }
    if (readErrno == EIO) {
      // Linux reports a hung-up slave as EIO instead of a zero-byte read
      VLOG(2) << "EIO on pty master, treating as end of file";
      return 0;
    }
    if (readErrno == EAGAIN || readErrno == EWOULDBLOCK) {
      return -1;
    }
    throw std::runtime_error(string("Terminal read error: ") +
                             strerror(readErrno));
  }
}

void PtyChannel::write(const char* buf, size_t count) {
  if (masterFd < 0) {
    throw SessionClosedError(getName() + " is closed");
  }
  RawFdUtils::writeAll(masterFd, buf, count);
}

optional<ChildExit> PtyChannel::pollExit() {
  if (reaped) {
    return reaped;
  }
  int status;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return nullopt;
  }
  if (rc == -1) {
    if (GetErrno() == ECHILD) {
      // Reaped elsewhere; the status is lost
      LOG(WARNING) << "Child " << pid << " was reaped by someone else";
      reaped = ChildExit();
      return reaped;
    }
    throw std::runtime_error(string("waitpid failed: ") +
                             strerror(GetErrno()));
  }
  reaped = ChildExit::fromWaitStatus(status);
  VLOG(1) << "Child " << pid << " exited with status " << status;
  return reaped;
}

ChildExit PtyChannel::waitExit() {
  if (reaped) {
    return *reaped;
  }
  int status;
  while (true) {
    pid_t rc = ::waitpid(pid, &status, 0);
    if (rc == pid) {
      break;
    }
    if (rc == -1 && GetErrno() == EINTR) {
      continue;
    }
    if (rc == -1 && GetErrno() == ECHILD) {
      reaped = ChildExit();
      return *reaped;
    }
    throw std::runtime_error(string("waitpid failed: ") +
                             strerror(GetErrno()));
  }
  reaped = ChildExit::fromWaitStatus(status);
  VLOG(1) << "Child " << pid << " exited with status " << status;
  return *reaped;
}

void PtyChannel::closeChannel() {
  if (masterFd >= 0) {
    VLOG(1) << "Closing pty master " << masterFd;
    ::close(masterFd);
    masterFd = -1;
  }
}

void PtyChannel::teardown() {
  if (pollExit()) {
    return;
  }
  LOG(INFO) << "Killing " << getName();
  sendSignal(SIGKILL);
  waitExit();
}

void PtyChannel::sendSignal(int signum) {
  if (::kill(pid, signum) == -1) {
    if (GetErrno() == ESRCH) {
      // Already gone, the next waitpid will tell
      return;
    }
    throw std::runtime_error(string("Cannot signal child: ") +
                             strerror(GetErrno()));
  }
}

char PtyChannel::getIntrChar() {
  termios attr;
  if (masterFd >= 0 && tcgetattr(masterFd, &attr) == 0) {
    return attr.c_cc[VINTR];
  }
  return ChildChannel::getIntrChar();
}

char PtyChannel::getEofChar() {
  termios attr;
  if (masterFd >= 0 && tcgetattr(masterFd, &attr) == 0) {
    return attr.c_cc[VEOF];
  }
  return ChildChannel::getEofChar();
}

optional<bool> PtyChannel::getEcho() {
  termios attr;
  if (masterFd < 0 || tcgetattr(masterFd, &attr) != 0) {
    return nullopt;
  }
  return (attr.c_lflag & ECHO) != 0;
}

bool PtyChannel::setEcho(bool enabled) {
  termios attr;
  if (masterFd < 0 || tcgetattr(masterFd, &attr) != 0) {
    return false;
  }
  if (enabled) {
    attr.c_lflag |= ECHO;
  } else {
    attr.c_lflag &= ~ECHO;
  }
  // TCSANOW so the change is visible to the child immediately
  if (tcsetattr(masterFd, TCSANOW, &attr) != 0) {
    LOG(WARNING) << "tcsetattr failed on " << getName() << ": "
                 << strerror(GetErrno());
    return false;
  }
  return true;
}

pair<int, int> PtyChannel::getWindowSize() {
  winsize ws;
  if (masterFd < 0 || ioctl(masterFd, TIOCGWINSZ, &ws) == -1) {
    throw UnsupportedError("Cannot read window size of " + getName());
  }
  return make_pair((int)ws.ws_row, (int)ws.ws_col);
}

void PtyChannel::setWindowSize(int rows, int cols) {
  winsize ws;
  memset(&ws, 0, sizeof(winsize));
  ws.ws_row = rows;
  ws.ws_col = cols;
  if (masterFd < 0 || ioctl(masterFd, TIOCSWINSZ, &ws) == -1) {
    throw UnsupportedError("Cannot set window size of " + getName());
  }
}
}  // namespace pe
