#include "SessionController.hpp"

#include "SubprocessUtils.hpp"

namespace pe {
SessionController::SessionController(const SessionConfig& _defaultConfig)
    : defaultConfig(_defaultConfig) {}

shared_ptr<ChildSession> SessionController::spawn(
    const string& command, const vector<string>& args,
    optional<SessionConfig> config) {
  SessionConfig c = config.value_or(defaultConfig);
  return replaceActive(
      [&]() { return ChildSession::spawn(command, args, c); });
}

shared_ptr<ChildSession> SessionController::popenSpawn(
    const string& commandLine, optional<SessionConfig> config) {
  SessionConfig c = config.value_or(defaultConfig);
  return replaceActive(
      [&]() { return ChildSession::popenSpawn(commandLine, c); });
}

shared_ptr<ChildSession> SessionController::fdSpawn(
    int fd, optional<SessionConfig> config) {
  SessionConfig c = config.value_or(defaultConfig);
  return replaceActive([&]() { return ChildSession::fdSpawn(fd, c); });
}

shared_ptr<ChildSession> SessionController::serialSpawn(
    const string& device, const SerialOptions& options,
    optional<SessionConfig> config) {
  SessionConfig c = config.value_or(defaultConfig);
  return replaceActive(
      [&]() { return ChildSession::serialSpawn(device, options, c); });
}

shared_ptr<ChildSession> SessionController::active() {
  auto session = registry.current();
  if (!session) {
    throw SessionNotInitializedError(
        "No active session, spawn a process first");
  }
  return session;
}

optional<string> SessionController::which(const string& filename,
                                          const map<string, string>* env) {
  return SubprocessUtils::which(filename, env);
}

shared_ptr<ChildSession> SessionController::replaceActive(
    std::function<shared_ptr<ChildSession>()> factory) {
  auto previous = registry.current();
  if (previous) {
    teardownQuietly(previous);
  }
  shared_ptr<ChildSession> session = factory();
  registry.setActive(session);
  return session;
}

void SessionController::teardownQuietly(shared_ptr<ChildSession> session) {
  try {
    VLOG(1) << "Tearing down " << session->getName();
    session->teardown();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Could not tear down " << session->getName() << ": "
                 << e.what();
    if (teardownListener) {
      teardownListener(session, e.what());
    }
  }
}
}  // namespace pe
