#include "ChildSession.hpp"

#include "ControlChars.hpp"
#include "ExpectEngine.hpp"
#include "FdChannel.hpp"
#include "PipeChannel.hpp"
#include "PtyChannel.hpp"

namespace pe {
namespace {
// Runs before any child is started or descriptor taken over
void checkEncoding(const SessionConfig& config) {
  if (!config.encoding.empty() && config.encoding != "utf-8" &&
      config.encoding != "utf8") {
    throw SpawnError("Unsupported encoding: " + config.encoding);
  }
}
}  // namespace

ChildSession::ChildSession(unique_ptr<ChildChannel> _channel,
                           const SessionConfig& _config)
    : channel(std::move(_channel)),
      config(_config),
      matchIndex(-1),
      closed(false),
      eofFlag(false),
      terminated(false),
      status(0),
      logfile(NULL),
      logfileRead(NULL),
      logfileSend(NULL) {
  pid = channel->getPid();
  checkEncoding(config);
  if (!config.encoding.empty()) {
    decoder.reset(new Utf8Decoder(config.codecErrors));
  }
}

ChildSession::~ChildSession() {
  if (!closed) {
    try {
      close(true);
    } catch (const std::exception& e) {
      LOG(WARNING) << "Error closing " << channel->getName() << ": "
                   << e.what();
    }
  }
}

shared_ptr<ChildSession> ChildSession::spawn(const string& command,
                                             const vector<string>& args,
                                             const SessionConfig& config) {
  checkEncoding(config);
  return shared_ptr<ChildSession>(
      new ChildSession(PtyChannel::spawn(command, args, config), config));
}

shared_ptr<ChildSession> ChildSession::popenSpawn(const string& commandLine,
                                                  const SessionConfig& config) {
  checkEncoding(config);
  return shared_ptr<ChildSession>(
      new ChildSession(PipeChannel::spawn(commandLine, config), config));
}

shared_ptr<ChildSession> ChildSession::fdSpawn(int fd,
                                               const SessionConfig& config) {
  checkEncoding(config);
  return shared_ptr<ChildSession>(
      new ChildSession(unique_ptr<ChildChannel>(new FdChannel(fd)), config));
}

shared_ptr<ChildSession> ChildSession::serialSpawn(
    const string& device, const SerialOptions& options,
    const SessionConfig& config) {
  checkEncoding(config);
  return shared_ptr<ChildSession>(new ChildSession(
      unique_ptr<ChildChannel>(new SerialChannel(device, options)), config));
}

void ChildSession::checkOpen() {
  if (closed) {
    throw SessionClosedError("I/O operation on closed session " +
                             channel->getName());
  }
}

size_t ChildSession::send(const string& s) {
  checkOpen();
  sleepSeconds(config.delayBeforeSend);
  logTraffic(s, true);
  channel->write(s.c_str(), s.length());
  return s.length();
}

size_t ChildSession::sendLine(const string& s) {
  return send(s + config.lineSeparator);
}

void ChildSession::writeLines(const vector<string>& lines) {
  for (const auto& line : lines) {
    send(line);
  }
}

size_t ChildSession::sendControl(char key) {
  auto code = controlCode(key);
  if (!code) {
    VLOG(1) << "No control code for '" << key << "', nothing sent";
    return 0;
  }
  return send(string(1, *code));
}

void ChildSession::sendEof() {
  checkOpen();
  logTraffic(string(1, channel->getEofChar()), true);
  channel->sendEof();
}

void ChildSession::sendIntr() {
  checkOpen();
  string intr(1, channel->getIntrChar());
  logTraffic(intr, true);
  channel->write(intr.c_str(), 1);
}

string ChildSession::readNonBlocking(int maxBytes, optional<double> timeout) {
  checkOpen();
  if (maxBytes <= 0) {
    return "";
  }

  if (!isAlive()) {
    // Dead, but the channel may still hold output
    if (!channel->waitForData(0.0)) {
      eofFlag = true;
      throw EndOfFileError("End of file: " + channel->getName() +
                           " has exited");
    }
  } else if (!channel->waitForData(timeout)) {
    if (!isAlive()) {
      eofFlag = true;
      throw EndOfFileError("End of file: " + channel->getName() +
                           " has exited");
    }
    throw TimeoutError("Timeout exceeded waiting for " + channel->getName());
  }

  string raw(maxBytes, '\0');
  ssize_t bytesRead = channel->read(&raw[0], maxBytes);
  if (bytesRead < 0) {
    // Readiness went away before we got to it
    return "";
  }
  if (bytesRead == 0) {
    eofFlag = true;
    string tail;
    if (decoder) {
      tail = decoder->flush();
    }
    if (!tail.empty()) {
      logTraffic(tail, false);
      return tail;
    }
    throw EndOfFileError("End of file reading from " + channel->getName());
  }
  raw.resize(bytesRead);
  VLOG(2) << "Read " << bytesRead << " bytes from " << channel->getName();
  string s = decode(raw);
  logTraffic(s, false);
  return s;
}

string ChildSession::read(int size) {
  if (size == 0) {
    return "";
  }
  if (size < 0) {
    vector<MatchTarget> targets = {MatchTarget::eof()};
    ExpectEngine::expectTargets(*this, targets);
    return before;
  }
  return ExpectEngine::readSize(*this, size);
}

string ChildSession::readLine(int size) {
  if (size == 0) {
    return "";
  }
  vector<MatchTarget> targets = {MatchTarget::literal("\r\n"),
                                 MatchTarget::eof()};
  int index = ExpectEngine::expectTargets(*this, targets);
  if (index == 0) {
    return before + "\r\n";
  }
  return before;
}

bool ChildSession::isAlive() {
  if (terminated) {
    return false;
  }
  auto ce = channel->pollExit();
  if (!ce) {
    return true;
  }
  recordExit(*ce);
  return false;
}

ChildExit ChildSession::wait() {
  if (terminated) {
    ChildExit ce;
    ce.status = status;
    ce.exitStatus = exitStatus;
    ce.signalStatus = signalStatus;
    return ce;
  }
  ChildExit ce = channel->waitExit();
  recordExit(ce);
  return ce;
}

void ChildSession::recordExit(const ChildExit& ce) {
  terminated = true;
  status = ce.status;
  exitStatus = ce.exitStatus;
  signalStatus = ce.signalStatus;
  LOG(INFO) << channel->getName() << " is gone (exit "
            << (exitStatus ? to_string(*exitStatus) : "none") << ", signal "
            << (signalStatus ? to_string(*signalStatus) : "none") << ")";
}

void ChildSession::close(bool force) {
  if (closed) {
    return;
  }
  closed = true;
  channel->flush();
  channel->closeChannel();
  sleepSeconds(config.delayAfterClose);
  if (isAlive() && !terminate(force)) {
    throw ExpectError("Could not terminate " + channel->getName());
  }
}

bool ChildSession::terminate(bool force) {
  if (!isAlive()) {
    return true;
  }
  if (!channel->supportsSignals()) {
    channel->closeChannel();
    return !isAlive();
  }

  vector<int> ladder = {SIGHUP, SIGCONT, SIGINT};
  if (force) {
    ladder.push_back(SIGKILL);
  }
  try {
    for (int signum : ladder) {
      VLOG(1) << "Sending signal " << signum << " to " << channel->getName();
      channel->sendSignal(signum);
      sleepSeconds(config.delayAfterTerminate);
      if (!isAlive()) {
        return true;
      }
    }
  } catch (const std::runtime_error& re) {
    // The child may have vanished between the check and the signal
    LOG(WARNING) << "Signal delivery failed: " << re.what();
    sleepSeconds(config.delayAfterTerminate);
    return !isAlive();
  }
  return false;
}

void ChildSession::kill(int signum) {
  if (isAlive()) {
    channel->sendSignal(signum);
  }
}

void ChildSession::teardown() {
  closed = true;
  channel->teardown();
  channel->closeChannel();
  isAlive();
}

optional<bool> ChildSession::getEcho() {
  checkOpen();
  return channel->getEcho();
}

bool ChildSession::setEcho(bool enabled) {
  checkOpen();
  return channel->setEcho(enabled);
}

bool ChildSession::waitNoEcho(ExpectTimeout timeout) {
  optional<double> seconds = timeout.resolve(config);
  double end = monotonicSeconds() + seconds.value_or(0.0);
  while (true) {
    auto echo = getEcho();
    if (!echo) {
      LOG(WARNING) << channel->getName() << " has no echo to wait for";
      return false;
    }
    if (!*echo) {
      return true;
    }
    if (seconds && monotonicSeconds() > end) {
      return false;
    }
    sleepSeconds(0.1);
  }
}

pair<int, int> ChildSession::getWindowSize() {
  checkOpen();
  return channel->getWindowSize();
}

void ChildSession::setWindowSize(int rows, int cols) {
  checkOpen();
  channel->setWindowSize(rows, cols);
}

string ChildSession::decode(const string& raw) {
  if (!decoder) {
    return raw;
  }
  return decoder->decode(raw);
}

void ChildSession::logTraffic(const string& s, bool outgoing) {
  if (s.empty()) {
    return;
  }
  ostream* directional = outgoing ? logfileSend : logfileRead;
  if (logfile) {
    (*logfile) << s << flush;
  }
  if (directional && directional != logfile) {
    (*directional) << s << flush;
  }
  if (el::Loggers::hasLogger("child")) {
    CLOG(INFO, "child") << (outgoing ? "> " : "< ") << s;
  }
}
}  // namespace pe
