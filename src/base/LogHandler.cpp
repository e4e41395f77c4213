#include "LogHandler.hpp"

#include "SimpleIni.h"

INITIALIZE_EASYLOGGINGPP

namespace pe {
namespace {
const int CHILD_TRAFFIC_VERBOSE_LEVEL = 3;
}

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread is the thread name once el::Helpers::setThreadName is called
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  el::Loggers::reconfigureLogger("default", conf);
  return conf;
}

void LogHandler::loadDebugSettings(const string &cfgfile,
                                   LogSettings *settings,
                                   bool keepVerboseLevel) {
  CSimpleIniA ini(true, false, false);
  if (ini.LoadFile(cfgfile.c_str()) < 0) {
    throw std::runtime_error("Invalid config file: " + cfgfile);
  }
  const char *verbose = ini.GetValue("Debug", "verbose", NULL);
  if (verbose && !keepVerboseLevel) {
    settings->verboseLevel = atoi(verbose);
  }
  const char *silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    settings->silent = atoi(silent) != 0;
  }
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) > 0) {
    settings->maxLogSize = std::to_string(atoi(logsize));
  }
}

string LogHandler::applySettings(el::Configurations *defaultConf,
                                 const LogSettings &settings) {
  string logFile = createLogFile(
      settings.directory, timestampedName(settings.filenamePrefix, ""));

  el::Loggers::setVerboseLevel(settings.verboseLevel);
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFile);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           settings.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           settings.logToStdout ? "true" : "false");
  if (settings.silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  el::Loggers::reconfigureLogger("default", *defaultConf);
  setupChildTrafficLogger(settings.silent ? 0 : settings.verboseLevel);

  if (settings.redirectStderrToFile) {
    string stderrFile =
        createLogFile(settings.directory,
                      timestampedName(settings.filenamePrefix, "stderr"));
    FILE *stream = freopen(stderrFile.c_str(), "w", stderr);
    if (!stream) {
      STFATAL << "Cannot redirect stderr to " << stderrFile;
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }
  return logFile;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, logging here would recurse
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

void LogHandler::setupChildTrafficLogger(int verboseLevel) {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "[%datetime child] %msg");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(
      el::ConfigurationType::Enabled,
      verboseLevel >= CHILD_TRAFFIC_VERBOSE_LEVEL ? "true" : "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("child"), conf);
}

string LogHandler::timestampedName(const string &prefix, const string &kind) {
  // Several files may be created within one millisecond
  static std::atomic<int> sequence(0);
  auto now = std::chrono::system_clock::now();
  time_t seconds = std::chrono::system_clock::to_time_t(now);
  int millis = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count() %
                     1000);
  char stamp[80];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", localtime(&seconds));
  char fraction[8];
  snprintf(fraction, sizeof(fraction), ".%03d", millis);

  string name = prefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  return name + "-" + stamp + fraction + "_" + std::to_string(getpid()) +
         "_" + std::to_string(sequence++) + ".log";
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    throw std::runtime_error(string("Cannot create log directory: ") +
                             fse.what());
  }
  string path = directory + "/" + filename;
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + path + ": " +
                             strerror(GetErrno()));
  }
  ::close(fd);
  return path;
}
}  // namespace pe
