#include "PipeChannel.hpp"

#include "RawFdUtils.hpp"
#include "SubprocessUtils.hpp"

namespace pe {
namespace {
void closePair(int* fds) {
  if (fds[0] >= 0) ::close(fds[0]);
  if (fds[1] >= 0) ::close(fds[1]);
}
}  // namespace

unique_ptr<PipeChannel> PipeChannel::spawn(const string& commandLine,
                                           const SessionConfig& config) {
  vector<string> argv = SubprocessUtils::splitCommandLine(commandLine);
  if (argv.empty()) {
    throw SpawnError("Empty command");
  }
  const map<string, string>* env = config.env ? &(*config.env) : nullptr;
  auto resolved = SubprocessUtils::which(argv[0], env);
  if (!resolved) {
    throw SpawnError("The command was not found or was not executable: " +
                     argv[0]);
  }

  int inPipe[2] = {-1, -1};
  int outPipe[2] = {-1, -1};
  int errorPipe[2] = {-1, -1};
  if (::pipe(inPipe) == -1 || ::pipe(outPipe) == -1 ||
      ::pipe(errorPipe) == -1) {
    int err = GetErrno();
    closePair(inPipe);
    closePair(outPipe);
    closePair(errorPipe);
    throw SpawnError(string("Cannot create pipes: ") + strerror(err));
  }
  RawFdUtils::setCloseOnExec(errorPipe[0], true);
  RawFdUtils::setCloseOnExec(errorPipe[1], true);

  // Build everything the child needs before forking
  vector<char*> argArray;
  for (const auto& arg : argv) {
    argArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argArray.push_back(NULL);
  vector<string> envStrings;
  vector<char*> envArray;
  if (env) {
    for (const auto& it : *env) {
      envStrings.push_back(it.first + "=" + it.second);
    }
    for (auto& s : envStrings) {
      envArray.push_back(&s[0]);
    }
    envArray.push_back(NULL);
  }

  pid_t pid = fork();
  if (pid == -1) {
    int err = GetErrno();
    closePair(inPipe);
    closePair(outPipe);
    closePair(errorPipe);
    throw SpawnError(string("fork failed: ") + strerror(err));
  }
  if (pid == 0) {
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    if (config.ignoreSighup) {
      signal(SIGHUP, SIG_IGN);
    }
    ::dup2(inPipe[0], STDIN_FILENO);
    ::dup2(outPipe[1], STDOUT_FILENO);
    ::dup2(outPipe[1], STDERR_FILENO);
    ::close(inPipe[0]);
    ::close(inPipe[1]);
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    ::close(errorPipe[0]);
    if (config.cwd.empty() || ::chdir(config.cwd.c_str()) == 0) {
      if (env) {
        execve(resolved->c_str(), argArray.data(), envArray.data());
      } else {
        execv(resolved->c_str(), argArray.data());
      }
    }
    int err = errno;
    ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  ::close(inPipe[0]);
  ::close(outPipe[1]);
  ::close(errorPipe[1]);
  RawFdUtils::setCloseOnExec(inPipe[1], true);
  RawFdUtils::setCloseOnExec(outPipe[0], true);
  unique_ptr<PipeChannel> channel(
      new PipeChannel(pid, inPipe[1], outPipe[0], *resolved));

  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(errorPipe[0]);
  if (rc > 0) {
    channel->waitExit();
    throw SpawnError("Cannot run " + *resolved + ": " + strerror(childErrno));
  }

  LOG(INFO) << "Spawned " << *resolved << " with pid " << pid << " on pipes";
  return channel;
}

PipeChannel::PipeChannel(pid_t _pid, int _inputFd, int _outputFd,
                         const string& _path)
    : pid(_pid), inputFd(_inputFd), outputFd(_outputFd), path(_path) {}

PipeChannel::~PipeChannel() {
  closeChannel();
  if (!reaped && pid > 0) {
    ::kill(pid, SIGKILL);
    int status;
    while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
  }
}

string PipeChannel::getName() {
  return "piped child " + path + " (pid " + to_string(pid) + ")";
}

ssize_t PipeChannel::read(char* buf, size_t count) {
  if (outputFd < 0) {
    throw SessionClosedError(getName() + " is closed");
  }
  while (true) {
    ssize_t rc = ::read(outputFd, buf, count);
    if (rc >= 0) {
      return rc;
    }
    if (GetErrno() == EINTR) {
      continue;
    }
    if (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK) {
      return -1;
    }
    throw std::runtime_error(string("Pipe read error: ") +
                             strerror(GetErrno()));
  }
}

void PipeChannel::write(const char* buf, size_t count) {
  if (inputFd < 0) {
    throw SessionClosedError("stdin of " + getName() + " is closed");
  }
  RawFdUtils::writeAll(inputFd, buf, count);
}

optional<ChildExit> PipeChannel::pollExit() {
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
      LOG(WARNING) << "Child " << pid << " was reaped by someone else";
      reaped = ChildExit();
      return reaped;
    }
    throw std::runtime_error(string("waitpid failed: ") +
                             strerror(GetErrno()));
  }
  reaped = ChildExit::fromWaitStatus(status);
  return reaped;
}

ChildExit PipeChannel::waitExit() {
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

void PipeChannel::closeChannel() {
  if (inputFd >= 0) {
    ::close(inputFd);
    inputFd = -1;
  }
  if (outputFd >= 0) {
    ::close(outputFd);
    outputFd = -1;
  }
}

void PipeChannel::teardown() {
  if (pollExit()) {
    return;
  }
  LOG(INFO) << "Terminating " << getName();
  sendSignal(SIGTERM);
  waitExit();
}

void PipeChannel::sendSignal(int signum) {
  if (::kill(pid, signum) == -1 && GetErrno() != ESRCH) {
    throw std::runtime_error(string("Cannot signal child: ") +
                             strerror(GetErrno()));
  }
}

void PipeChannel::sendEof() {
  if (inputFd >= 0) {
    VLOG(1) << "Closing stdin of " << getName();
    ::close(inputFd);
    inputFd = -1;
  }
}
}  // namespace pe
