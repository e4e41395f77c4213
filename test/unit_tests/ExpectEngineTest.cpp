#include "ExpectEngine.hpp"
#include "FakeChannel.hpp"
#include "TestHeaders.hpp"

using namespace pe;

namespace {
struct FakeSession {
  FakeSession(SessionConfig config = fastConfig())
      : fake(new FakeChannel()),
        session(unique_ptr<ChildChannel>(fake), config) {}

  FakeChannel* fake;
  ChildSession session;
};
}  // namespace

TEST_CASE("First position wins, list order breaks ties", "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("foobar");
  int index = ExpectEngine::expectExact(fs.session, {"bar", "foo", "foobar"});
  REQUIRE(index == 1);
  REQUIRE(fs.session.getBefore() == "");
  REQUIRE(fs.session.getAfter() == "foo");
  REQUIRE(fs.session.getBuffer() == "bar");
  REQUIRE(fs.session.getMatchIndex() == 1);
}

TEST_CASE("A match on the first chunk does not wait for more",
          "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("foo");
  std::thread late([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    fs.fake->feed("bar");
  });
  int index = ExpectEngine::expectExact(fs.session, {"bar", "foo", "foobar"});
  REQUIRE(index == 1);
  REQUIRE(fs.session.getBuffer() == "");
  late.join();

  // The late chunk is there for the next expect
  REQUIRE(ExpectEngine::expectExact(fs.session, {"bar"}) == 0);
}

TEST_CASE("Leftover output is searched before reading", "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("prompt> prompt> ");
  REQUIRE(ExpectEngine::expectExact(fs.session, {"> "}) == 0);
  REQUIRE(fs.session.getBefore() == "prompt");
  // Nothing new arrives, so only the buffer can satisfy this one
  REQUIRE(ExpectEngine::expectExact(fs.session, {"> "},
                                    ExpectTimeout::seconds(0)) == 0);
  REQUIRE(fs.session.getBefore() == "prompt");
  REQUIRE(fs.session.getBuffer() == "");
}

TEST_CASE("Timeout covers the whole call, not each read", "[ExpectEngine]") {
  FakeSession fs;
  std::atomic<bool> done(false);
  // A steady trickle that never matches forces many short reads
  std::thread trickle([&]() {
    while (!done) {
      fs.fake->feed(".");
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  double start = monotonicSeconds();
  REQUIRE_THROWS_AS(ExpectEngine::expectExact(fs.session, {"X"},
                                              ExpectTimeout::seconds(1.0)),
                    TimeoutError);
  double elapsed = monotonicSeconds() - start;
  done = true;
  trickle.join();

  REQUIRE(elapsed >= 0.95);
  REQUIRE(elapsed < 1.5);
  // Timed out output stays in the buffer and is reported as before
  REQUIRE_FALSE(fs.session.getBefore().empty());
  REQUIRE(fs.session.getBuffer() == fs.session.getBefore());
}

TEST_CASE("Timeout with no output at all", "[ExpectEngine]") {
  FakeSession fs;
  double start = monotonicSeconds();
  REQUIRE_THROWS_AS(ExpectEngine::expect(fs.session, {"never"},
                                         ExpectTimeout::seconds(0.5)),
                    TimeoutError);
  double elapsed = monotonicSeconds() - start;
  REQUIRE(elapsed >= 0.45);
  REQUIRE(elapsed < 1.0);
  REQUIRE(fs.session.getMatchIndex() == -1);
}

TEST_CASE("Session default timeout is used when none is given",
          "[ExpectEngine]") {
  SessionConfig config = fastConfig();
  config.timeout = 0.3;
  FakeSession fs(config);
  double start = monotonicSeconds();
  REQUIRE_THROWS_AS(ExpectEngine::expectExact(fs.session, {"never"}),
                    TimeoutError);
  REQUIRE(monotonicSeconds() - start < 1.0);
}

TEST_CASE("TIMEOUT sentinel turns a timeout into a match", "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("partial");
  int index = ExpectEngine::expectTargets(
      fs.session, {MatchTarget::literal("done"), MatchTarget::timeout()},
      ExpectTimeout::seconds(0.2));
  REQUIRE(index == 1);
  REQUIRE(fs.session.getBefore() == "partial");
  REQUIRE(fs.session.getBuffer() == "partial");
}

TEST_CASE("EOF sentinel turns end of file into a match", "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("hello");
  fs.fake->hangUp();
  fs.fake->exitWith(0);
  int index = ExpectEngine::expectTargets(
      fs.session, {MatchTarget::literal("X"), MatchTarget::eof()});
  REQUIRE(index == 1);
  REQUIRE(fs.session.getBefore() == "hello");
  REQUIRE(fs.session.getBuffer() == "");
  REQUIRE(fs.session.eof());
}

TEST_CASE("End of file without a sentinel raises", "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("bye");
  fs.fake->hangUp();
  REQUIRE_THROWS_AS(ExpectEngine::expectExact(fs.session, {"X"}),
                    EndOfFileError);
  REQUIRE(fs.session.getBefore() == "bye");
  REQUIRE(fs.session.getBuffer() == "");
}

TEST_CASE("Small search window misses a match spanning older bytes",
          "[ExpectEngine]") {
  SessionConfig config = fastConfig();
  config.searchWindowSize = 3;
  FakeSession fs(config);
  std::thread writer([&]() {
    fs.fake->feed("fo");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    fs.fake->feed("o");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    fs.fake->feed("bar");
  });
  REQUIRE_THROWS_AS(ExpectEngine::expectExact(fs.session, {"foobar"},
                                              ExpectTimeout::seconds(0.6)),
                    TimeoutError);
  writer.join();
  REQUIRE(fs.session.getBuffer() == "foobar");

  // The same buffer matches once the whole of it is searched
  REQUIRE(ExpectEngine::expectExact(fs.session, {"foobar"},
                                    ExpectTimeout::seconds(0), 0) == 0);
}

TEST_CASE("Regex groups are kept on the session", "[ExpectEngine]") {
  FakeSession fs;
  fs.fake->feed("uptime 12 days, load 0.5\r\n");
  int index =
      ExpectEngine::expect(fs.session, {"error", "uptime (\\d+) days"});
  REQUIRE(index == 1);
  REQUIRE(fs.session.getMatchGroups() == vector<string>({"12"}));
  REQUIRE(fs.session.getBuffer() == ", load 0.5\r\n");
}

TEST_CASE("Bad patterns fail before any read", "[ExpectEngine]") {
  FakeSession fs;
  REQUIRE_THROWS_AS(ExpectEngine::expect(fs.session, {"[oops"}),
                    PatternError);
}

TEST_CASE("Expect on a closed session", "[ExpectEngine]") {
  FakeSession fs;
  fs.session.close();
  REQUIRE_THROWS_AS(ExpectEngine::expectExact(fs.session, {"x"}),
                    SessionClosedError);
}
