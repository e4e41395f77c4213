#include "SessionConfig.hpp"
#include "TestHeaders.hpp"

using namespace pe;

namespace {
string writeTempConfig(const string& contents) {
  string pattern = GetTempDirectory() + string("pe_config_XXXXXXXX");
  int fd = mkstemp(&pattern[0]);
  FATAL_FAIL(fd);
  FATAL_FAIL(::write(fd, contents.c_str(), contents.length()));
  ::close(fd);
  return pattern;
}
}  // namespace

TEST_CASE("Defaults", "[SessionConfig]") {
  SessionConfig config;
  REQUIRE(*config.timeout == Catch::Approx(30.0));
  REQUIRE(config.maxRead == 2000);
  REQUIRE(config.searchWindowSize == 0);
  REQUIRE(config.encoding == "utf-8");
  REQUIRE(config.codecErrors == "strict");
  REQUIRE(config.lineSeparator == "\n");
  REQUIRE(config.echo);
  REQUIRE(config.rows == 24);
  REQUIRE(config.cols == 80);
  REQUIRE(config.delayBeforeSend == Catch::Approx(0.05));
  REQUIRE(*config.delayAfterRead == Catch::Approx(0.0001));
  REQUIRE(config.delayAfterClose == Catch::Approx(0.1));
  REQUIRE(config.delayAfterTerminate == Catch::Approx(0.1));
  REQUIRE(config.cwd.empty());
  REQUIRE_FALSE(config.env);
  REQUIRE_FALSE(config.ignoreSighup);
}

TEST_CASE("Load from an INI file", "[SessionConfig]") {
  string path = writeTempConfig(
      "[Session]\n"
      "timeout = 2.5\n"
      "maxread = 512\n"
      "searchwindowsize = 64\n"
      "encoding = UTF8\n"
      "codec_errors = replace\n"
      "linesep = \\r\\n\n"
      "echo = false\n"
      "rows = 50\n"
      "cols = 132\n"
      "delay_before_send = 0\n"
      "delay_after_read = none\n"
      "delay_after_close = 0.2\n"
      "delay_after_terminate = 0.3\n"
      "cwd = /tmp\n"
      "ignore_sighup = yes\n"
      "[Debug]\n"
      "verbose = 3\n");
  SessionConfig config = SessionConfig::loadFromFile(path);
  REQUIRE(*config.timeout == Catch::Approx(2.5));
  REQUIRE(config.maxRead == 512);
  REQUIRE(config.searchWindowSize == 64);
  REQUIRE(config.encoding == "utf-8");
  REQUIRE(config.codecErrors == "replace");
  REQUIRE(config.lineSeparator == "\r\n");
  REQUIRE_FALSE(config.echo);
  REQUIRE(config.rows == 50);
  REQUIRE(config.cols == 132);
  REQUIRE(config.delayBeforeSend == Catch::Approx(0.0));
  REQUIRE_FALSE(config.delayAfterRead);
  REQUIRE(config.delayAfterClose == Catch::Approx(0.2));
  REQUIRE(config.delayAfterTerminate == Catch::Approx(0.3));
  REQUIRE(config.cwd == "/tmp");
  REQUIRE(config.ignoreSighup);
  FATAL_FAIL(::remove(path.c_str()));
}

TEST_CASE("Missing keys keep their defaults", "[SessionConfig]") {
  string path = writeTempConfig("[Session]\ntimeout = none\n");
  SessionConfig config = SessionConfig::loadFromFile(path);
  REQUIRE_FALSE(config.timeout);
  REQUIRE(config.maxRead == 2000);
  REQUIRE(config.lineSeparator == "\n");
  FATAL_FAIL(::remove(path.c_str()));
}

TEST_CASE("Bad values are rejected", "[SessionConfig]") {
  vector<string> bad = {
      "[Session]\ntimeout = soon\n", "[Session]\nmaxread = 0\n",
      "[Session]\nrows = 24x\n",     "[Session]\necho = maybe\n",
      "[Session]\nencoding = latin-1\n",
      "[Session]\ncodec_errors = ignore\n"};
  for (const auto& contents : bad) {
    string path = writeTempConfig(contents);
    REQUIRE_THROWS_AS(SessionConfig::loadFromFile(path), std::runtime_error);
    FATAL_FAIL(::remove(path.c_str()));
  }
  REQUIRE_THROWS_AS(SessionConfig::loadFromFile("/nonexistent/pe.cfg"),
                    std::runtime_error);
}

TEST_CASE("unescape", "[SessionConfig]") {
  REQUIRE(SessionConfig::unescape("a\\nb") == "a\nb");
  REQUIRE(SessionConfig::unescape("\\r\\n\\t") == "\r\n\t");
  REQUIRE(SessionConfig::unescape("back\\\\slash") == "back\\slash");
  REQUIRE(SessionConfig::unescape("trailing\\") == "trailing\\");
  REQUIRE(SessionConfig::unescape("plain") == "plain");
}

TEST_CASE("ExpectTimeout resolves against the session", "[SessionConfig]") {
  SessionConfig config;
  config.timeout = 7;
  REQUIRE(*ExpectTimeout::sessionDefault().resolve(config) == Catch::Approx(7));
  REQUIRE(*ExpectTimeout::seconds(1.5).resolve(config) == Catch::Approx(1.5));
  REQUIRE_FALSE(ExpectTimeout::forever().resolve(config));
  config.timeout = nullopt;
  REQUIRE_FALSE(ExpectTimeout::sessionDefault().resolve(config));
}
