#include "ExpectEngine.hpp"
#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace pe;

namespace {
SessionConfig testConfig() {
  SessionConfig config;
  config.timeout = 10;
  config.delayBeforeSend = 0;
  config.delayAfterClose = 0;
  return config;
}

/** A pseudo-terminal pair stands in for a serial cable. */
struct FakeSerialLine {
  FakeSerialLine() {
    char name[256];
    FATAL_FAIL(openpty(&master, &slave, name, NULL, NULL));
    device = name;
  }

  ~FakeSerialLine() {
    ::close(master);
    ::close(slave);
  }

  string readFromDevice(size_t length) {
    string received;
    while (received.length() < length) {
      REQUIRE(RawFdUtils::waitForReadable(master, 5.0));
      char buf[256];
      ssize_t rc = ::read(master, buf, sizeof(buf));
      REQUIRE(rc > 0);
      received.append(buf, rc);
    }
    return received;
  }

  int master;
  int slave;
  string device;
};
}  // namespace

TEST_CASE("Serial line round trip", "[SerialSession]") {
  FakeSerialLine line;
  SerialOptions options;
  options.baudRate = 115200;
  auto session = ChildSession::serialSpawn(line.device, options, testConfig());
  REQUIRE(session->isAlive());
  REQUIRE(session->getPid() == -1);

  session->send("AT\r");
  REQUIRE(line.readFromDevice(3) == "AT\r");

  RawFdUtils::writeAll(line.master, "\r\nOK\r\n", 6);
  REQUIRE(ExpectEngine::expect(*session, {"ERROR", "OK"}) == 1);

  session->close();
  REQUIRE_FALSE(session->isAlive());
  REQUIRE_NOTHROW(session->close());
}

TEST_CASE("Serial lines have no process or terminal controls",
          "[SerialSession]") {
  FakeSerialLine line;
  auto session =
      ChildSession::serialSpawn(line.device, SerialOptions(), testConfig());
  REQUIRE_FALSE(session->getEcho());
  REQUIRE_FALSE(session->setEcho(false));
  REQUIRE_THROWS_AS(session->getWindowSize(), UnsupportedError);
  REQUIRE_THROWS_AS(session->wait(), UnsupportedError);
  REQUIRE_THROWS_AS(session->kill(SIGINT), UnsupportedError);
  // terminate falls back to closing the port
  REQUIRE(session->terminate());
}

TEST_CASE("Serial option parsing", "[SerialSession]") {
  using boost::asio::serial_port_base;
  REQUIRE(SerialOptions::parseParity("even") ==
          serial_port_base::parity::even);
  REQUIRE(SerialOptions::parseStopBits("2") ==
          serial_port_base::stop_bits::two);
  REQUIRE(SerialOptions::parseFlowControl("hardware") ==
          serial_port_base::flow_control::hardware);
  REQUIRE_THROWS(SerialOptions::parseParity("mark"));
  REQUIRE_THROWS(SerialOptions::parseStopBits("3"));
  REQUIRE_THROWS(SerialOptions::parseFlowControl("xon"));
}

TEST_CASE("Opening a missing serial device fails", "[SerialSession]") {
  REQUIRE_THROWS_AS(ChildSession::serialSpawn("/dev/pe-no-such-tty",
                                              SerialOptions(), testConfig()),
                    SpawnError);
}
