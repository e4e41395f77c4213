#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace pe;

TEST_CASE("RawFdUtils writeAll writes all data", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  const string payload = "test data for writeAll";
  RawFdUtils::writeAll(fds[1], payload.data(), payload.size());
  ::close(fds[1]);

  string buffer(payload.size(), '\0');
  REQUIRE(::read(fds[0], &buffer[0], buffer.size()) == (ssize_t)payload.size());
  REQUIRE(buffer == payload);
  ::close(fds[0]);
}

TEST_CASE("RawFdUtils writeAll with large data", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Bigger than a pipe buffer, so the writer blocks until we drain it
  const size_t size = 1024 * 1024;
  string payload(size, 'X');

  std::thread writer([&]() {
    RawFdUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string received;
  char buffer[4096];
  while (true) {
    ssize_t rc = ::read(fds[0], buffer, sizeof(buffer));
    REQUIRE(rc >= 0);
    if (rc == 0) {
      break;
    }
    received.append(buffer, rc);
  }
  REQUIRE(received == payload);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawFdUtils writeAll throws on a pipe without readers",
          "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);
  signal(SIGPIPE, SIG_IGN);

  const string payload = "test data";
  REQUIRE_THROWS(RawFdUtils::writeAll(fds[1], payload.data(), payload.size()));
  ::close(fds[1]);
}

TEST_CASE("RawFdUtils writeAll with invalid fd", "[RawFdUtils]") {
  const string payload = "test";
  REQUIRE_THROWS(RawFdUtils::writeAll(-1, payload.data(), payload.size()));
}

TEST_CASE("RawFdUtils waitForReadable", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Polling an empty pipe returns immediately
  REQUIRE_FALSE(RawFdUtils::waitForReadable(fds[0], 0.0));

  double start = monotonicSeconds();
  REQUIRE_FALSE(RawFdUtils::waitForReadable(fds[0], 0.3));
  double elapsed = monotonicSeconds() - start;
  REQUIRE(elapsed >= 0.25);
  REQUIRE(elapsed < 1.0);

  std::thread writer([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    RawFdUtils::writeAll(fds[1], "x", 1);
  });
  REQUIRE(RawFdUtils::waitForReadable(fds[0], nullopt));
  writer.join();

  char c;
  REQUIRE(::read(fds[0], &c, 1) == 1);
  // Hang-up counts as readable
  ::close(fds[1]);
  REQUIRE(RawFdUtils::waitForReadable(fds[0], 0.0));
  ::close(fds[0]);

  REQUIRE_THROWS(RawFdUtils::waitForReadable(-1, 0.0));
}

TEST_CASE("RawFdUtils descriptor flags", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(RawFdUtils::isValidFd(fds[0]));

  RawFdUtils::setCloseOnExec(fds[0], true);
  REQUIRE((::fcntl(fds[0], F_GETFD) & FD_CLOEXEC) != 0);
  RawFdUtils::setCloseOnExec(fds[0], false);
  REQUIRE((::fcntl(fds[0], F_GETFD) & FD_CLOEXEC) == 0);

  ::close(fds[0]);
  ::close(fds[1]);
  REQUIRE_FALSE(RawFdUtils::isValidFd(fds[0]));
  REQUIRE_FALSE(RawFdUtils::isValidFd(-1));
}
