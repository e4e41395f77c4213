#include "SessionConfig.hpp"

#include "SimpleIni.h"

namespace pe {
namespace {
const char* SESSION_SECTION = "Session";

double parseDouble(const string& key, const char* value) {
  try {
    size_t consumed;
    double d = stod(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return d;
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
}

int parseInt(const string& key, const char* value) {
  try {
    size_t consumed;
    int i = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return i;
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
}

bool parseBool(const string& key, const char* value) {
  string v(value);
  std::transform(v.begin(), v.end(), v.begin(), ::tolower);
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}
}  // namespace

string SessionConfig::unescape(const string& value) {
  string out;
  for (size_t a = 0; a < value.size(); a++) {
    if (value[a] != '\\' || a + 1 == value.size()) {
      out += value[a];
      continue;
    }
    char next = value[++a];
    switch (next) {
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      default:
        out += next;
        break;
    }
  }
  return out;
}

SessionConfig SessionConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  SessionConfig config;
  const char* value;
  if ((value = ini.GetValue(SESSION_SECTION, "timeout", NULL))) {
    string v(value);
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "none") {
      config.timeout = nullopt;
    } else {
      config.timeout = parseDouble("timeout", value);
    }
  }
  if ((value = ini.GetValue(SESSION_SECTION, "maxread", NULL))) {
    config.maxRead = parseInt("maxread", value);
    if (config.maxRead <= 0) {
      throw std::runtime_error("maxread must be positive");
    }
  }
  if ((value = ini.GetValue(SESSION_SECTION, "searchwindowsize", NULL))) {
    int windowSize = parseInt("searchwindowsize", value);
    config.searchWindowSize = windowSize > 0 ? windowSize : 0;
  }
  if ((value = ini.GetValue(SESSION_SECTION, "encoding", NULL))) {
    config.encoding = value;
    std::transform(config.encoding.begin(), config.encoding.end(),
                   config.encoding.begin(), ::tolower);
    if (config.encoding == "utf8") {
      config.encoding = "utf-8";
    }
    if (config.encoding != "utf-8" && config.encoding != "") {
      throw std::runtime_error("Unsupported encoding: " + string(value));
    }
  }
  if ((value = ini.GetValue(SESSION_SECTION, "codec_errors", NULL))) {
    config.codecErrors = value;
    if (config.codecErrors != "strict" && config.codecErrors != "replace") {
      throw std::runtime_error("Unsupported codec_errors: " + string(value));
    }
  }
  if ((value = ini.GetValue(SESSION_SECTION, "linesep", NULL))) {
    config.lineSeparator = unescape(value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "echo", NULL))) {
    config.echo = parseBool("echo", value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "rows", NULL))) {
    config.rows = parseInt("rows", value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "cols", NULL))) {
    config.cols = parseInt("cols", value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "delay_before_send", NULL))) {
    config.delayBeforeSend = parseDouble("delay_before_send", value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "delay_after_read", NULL))) {
    if (string(value) == "none") {
      config.delayAfterRead = nullopt;
    } else {
      config.delayAfterRead = parseDouble("delay_after_read", value);
    }
  }
  if ((value = ini.GetValue(SESSION_SECTION, "delay_after_close", NULL))) {
    config.delayAfterClose = parseDouble("delay_after_close", value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "delay_after_terminate", NULL))) {
    config.delayAfterTerminate = parseDouble("delay_after_terminate", value);
  }
  if ((value = ini.GetValue(SESSION_SECTION, "cwd", NULL))) {
    config.cwd = value;
  }
  if ((value = ini.GetValue(SESSION_SECTION, "ignore_sighup", NULL))) {
    config.ignoreSighup = parseBool("ignore_sighup", value);
  }
  VLOG(1) << "Loaded session config from " << path;
  return config;
}
}  // namespace pe
