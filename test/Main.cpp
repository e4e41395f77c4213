#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace pe;

namespace {
bool onlyListing(int argc, char **argv) {
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0 ||
        strcmp(argv[i], "--list-tags") == 0) {
      return true;
    }
  }
  return false;
}
}  // namespace

int main(int argc, char **argv) {
  srand(1);
  bool listing = onlyListing(argc, argv);

  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  HandleTerminate();

  // Children that die mid-write must not take the test runner with them
  ::signal(SIGPIPE, SIG_IGN);

  string pattern = GetTempDirectory() + string("pe_test_XXXXXXXX");
  if (mkdtemp(&pattern[0]) == NULL) {
    STFATAL << "Cannot create test log directory: " << strerror(GetErrno());
  }

  LogSettings settings;
  settings.directory = pattern;
  settings.filenamePrefix = "pe_test";
  settings.redirectStderrToFile = true;
  // Keeps whatever -v/--v the runner was started with
  settings.verboseLevel = el::Loggers::verboseLevel();
  string logFile = LogHandler::applySettings(&defaultConf, settings);
  if (!listing) {
    CLOG(INFO, "stdout") << "Writing log to " << logFile << endl;
  }

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(settings.directory, ec);
  if (ec) {
    LOG(WARNING) << "Cannot remove " << settings.directory << ": "
                 << ec.message();
  }
  return result;
}
