#include "ExpectEngine.hpp"
#include "TestHeaders.hpp"

using namespace pe;

namespace {
SessionConfig testConfig() {
  SessionConfig config;
  config.timeout = 10;
  config.delayBeforeSend = 0;
  config.delayAfterClose = 0;
  config.delayAfterTerminate = 0.05;
  return config;
}
}  // namespace

TEST_CASE("Pipes carry data without a terminal", "[PipeSession]") {
  auto session = ChildSession::popenSpawn("cat", testConfig());
  REQUIRE(session->getPid() > 0);
  session->sendLine("ping");
  // No echo on a pipe: the only copy comes from cat, with a bare newline
  REQUIRE(ExpectEngine::expectExact(*session, {"ping\n"}) == 0);
  REQUIRE(session->getBuffer() == "");

  session->sendEof();
  REQUIRE(ExpectEngine::expectTargets(*session, {MatchTarget::eof()}) == 0);
  REQUIRE(session->wait().exitStatus == 0);
}

TEST_CASE("stderr shares the output pipe", "[PipeSession]") {
  auto session = ChildSession::popenSpawn(
      "sh -c 'echo to-stderr 1>&2; echo to-stdout'", testConfig());
  REQUIRE(ExpectEngine::expectExact(*session, {"to-stderr"}) == 0);
  REQUIRE(ExpectEngine::expectExact(*session, {"to-stdout"}) == 0);
}

TEST_CASE("Pipe sessions have no echo or window size", "[PipeSession]") {
  auto session = ChildSession::popenSpawn("cat", testConfig());
  REQUIRE_FALSE(session->getEcho());
  REQUIRE_FALSE(session->setEcho(true));
  REQUIRE_THROWS_AS(session->getWindowSize(), UnsupportedError);
  session->close(true);
  REQUIRE_FALSE(session->isAlive());
}

TEST_CASE("Pipe child exit status and signals", "[PipeSession]") {
  auto exiting = ChildSession::popenSpawn("sh -c 'exit 7'", testConfig());
  REQUIRE(exiting->wait().exitStatus == 7);
  REQUIRE(exiting->wait().exitStatus == 7);

  auto sleeping = ChildSession::popenSpawn("sleep 30", testConfig());
  REQUIRE(sleeping->isAlive());
  sleeping->kill(SIGTERM);
  REQUIRE(sleeping->wait().signalStatus == SIGTERM);
}

TEST_CASE("Pipe spawn failures", "[PipeSession]") {
  REQUIRE_THROWS_AS(
      ChildSession::popenSpawn("pe-no-such-program-here", testConfig()),
      SpawnError);
  REQUIRE_THROWS_AS(ChildSession::popenSpawn("  ", testConfig()), SpawnError);
}
