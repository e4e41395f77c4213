#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "SessionController.hpp"

using namespace pe;

namespace {
struct Step {
  string kind;
  string argument;
};

Step parseStep(const string& text) {
  Step step;
  size_t colon = text.find(':');
  step.kind = text.substr(0, colon);
  if (colon != string::npos) {
    step.argument = text.substr(colon + 1);
  }
  static const set<string> kinds = {"expect",  "exact",   "send", "sendline",
                                    "control", "eof",     "wait"};
  if (kinds.find(step.kind) == kinds.end()) {
    throw std::runtime_error("Unknown step: " + text);
  }
  return step;
}

vector<Step> loadScript(const string& path) {
  ifstream in(path);
  if (!in.good()) {
    throw std::runtime_error("Cannot open script " + path);
  }
  vector<Step> steps;
  string line;
  while (getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    steps.push_back(parseStep(line));
  }
  return steps;
}

void runStep(SessionController* controller, const Step& step) {
  VLOG(1) << "Running step " << step.kind << ":" << step.argument;
  if (step.kind == "expect") {
    controller->expect({step.argument});
  } else if (step.kind == "exact") {
    controller->expectExact({SessionConfig::unescape(step.argument)});
  } else if (step.kind == "send") {
    controller->send(SessionConfig::unescape(step.argument));
  } else if (step.kind == "sendline") {
    controller->sendLine(SessionConfig::unescape(step.argument));
  } else if (step.kind == "control") {
    if (step.argument.length() != 1 ||
        controller->sendControl(step.argument[0]) == 0) {
      throw std::runtime_error("Not a control key: " + step.argument);
    }
  } else if (step.kind == "eof") {
    controller->sendEof();
  } else if (step.kind == "wait") {
    ChildExit ce = controller->wait();
    if (ce.exitStatus) {
      CLOG(INFO, "stdout") << "exit status " << *ce.exitStatus << endl;
    } else if (ce.signalStatus) {
      CLOG(INFO, "stdout") << "killed by signal " << *ce.signalStatus << endl;
    }
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pe::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, pe::InterruptSignalHandler);
  // A child that goes away mid-write is reported through write errors
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("ptyexpect",
                           "Drive an interactive program through a "
                           "pseudo-terminal");
  int exitCode = 0;
  try {
    options.positional_help("-- command [args...]");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("step",
         "Step to run, in order (expect:RE, exact:TEXT, send:TEXT, "
         "sendline:TEXT, control:KEY, eof, wait)",
         cxxopts::value<vector<string>>())  //
        ("script", "File with one step per line",
         cxxopts::value<string>()->default_value(""))  //
        ("timeout", "Seconds to wait in each expect step, or none",
         cxxopts::value<string>())  //
        ("popen", "Connect through pipes instead of a pseudo-terminal")  //
        ("transcript", "Copy the child's output to stdout")              //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "ptyexpect"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("command", "Command and arguments to run",
         cxxopts::value<vector<string>>())  //
        ;
    options.parse_positional({"command"});

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ptyexpect version " << PE_VERSION << endl;
      exit(0);
    }
    if (!result.count("command")) {
      CLOG(INFO, "stdout") << "Missing command" << endl
                           << options.help({}) << endl;
      exit(1);
    }

    LogSettings logSettings;
    logSettings.directory = result["logdir"].as<string>();
    logSettings.logToStdout = result.count("logtostdout") > 0;
    logSettings.verboseLevel = result["verbose"].as<int>();

    SessionConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      config = SessionConfig::loadFromFile(cfgfilename);
      // The command line verbose level wins over the config file
      LogHandler::loadDebugSettings(cfgfilename, &logSettings,
                                    result.count("verbose") > 0);
    }

    if (result.count("timeout")) {
      string t = result["timeout"].as<string>();
      if (t == "none") {
        config.timeout = nullopt;
      } else {
        try {
          config.timeout = stod(t);
        } catch (const std::logic_error&) {
          throw std::runtime_error("Invalid timeout: " + t);
        }
      }
    }

    string logFile = LogHandler::applySettings(&defaultConf, logSettings);
    VLOG(1) << "Logging to " << logFile;
    // set thread name
    el::Helpers::setThreadName("ptyexpect-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    vector<Step> steps;
    string script = result["script"].as<string>();
    if (!script.empty()) {
      steps = loadScript(script);
    }
    if (result.count("step")) {
      for (const auto& s : result["step"].as<vector<string>>()) {
        steps.push_back(parseStep(s));
      }
    }

    vector<string> command = result["command"].as<vector<string>>();
    SessionController controller(config);
    shared_ptr<ChildSession> session;
    if (result.count("popen")) {
      string commandLine;
      for (const auto& word : command) {
        if (!commandLine.empty()) commandLine += " ";
        for (char c : word) {
          if (!isalnum((unsigned char)c)) commandLine += '\\';
          commandLine += c;
        }
      }
      session = controller.popenSpawn(commandLine);
    } else {
      vector<string> args(command.begin() + 1, command.end());
      session = controller.spawn(command[0], args);
    }
    if (result.count("transcript")) {
      session->setLogfileRead(&cout);
    }

    for (int a = 0; a < (int)steps.size(); a++) {
      try {
        runStep(&controller, steps[a]);
      } catch (const ExpectError& ee) {
        CLOG(INFO, "stdout") << "Step " << (a + 1) << " (" << steps[a].kind
                             << ":" << steps[a].argument
                             << ") failed: " << ee.what() << endl;
        exitCode = 1;
        break;
      }
    }
    session->setLogfileRead(NULL);
    controller.close(true);
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
