#include "SubprocessUtils.hpp"

namespace pe {
bool SubprocessUtils::isExecutableFile(const string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
}

optional<string> SubprocessUtils::which(const string& filename,
                                        const map<string, string>* env) {
  if (filename.empty()) {
    return nullopt;
  }
  if (filename.find('/') != string::npos) {
    if (isExecutableFile(filename)) {
      return filename;
    }
    return nullopt;
  }

  string path;
  if (env != nullptr && env->count("PATH")) {
    path = env->at("PATH");
  } else {
    const char* envPath = ::getenv("PATH");
    path = envPath ? string(envPath) : string(_PATH_DEFPATH);
  }

  for (const auto& dir : split(path, ':')) {
    // An empty PATH entry means the current directory
    string candidate = (dir.empty() ? string(".") : dir) + "/" + filename;
    if (isExecutableFile(candidate)) {
      VLOG(2) << "Resolved " << filename << " to " << candidate;
      return candidate;
    }
  }
  return nullopt;
}

vector<string> SubprocessUtils::splitCommandLine(const string& commandLine) {
  enum State { BASIC, ESCAPE, SINGLE_QUOTE, DOUBLE_QUOTE, WHITESPACE };

  vector<string> args;
  string arg;
  bool inWord = false;
  State state = WHITESPACE;
  for (char c : commandLine) {
    switch (state) {
      case BASIC:
      case WHITESPACE:
        if (c == '\\') {
          state = ESCAPE;
          inWord = true;
        } else if (c == '\'') {
          state = SINGLE_QUOTE;
          inWord = true;
        } else if (c == '"') {
          state = DOUBLE_QUOTE;
          inWord = true;
        } else if (isspace((unsigned char)c)) {
          if (inWord) {
            args.push_back(arg);
            arg.clear();
            inWord = false;
          }
          state = WHITESPACE;
        } else {
          arg += c;
          inWord = true;
          state = BASIC;
        }
        break;
      case ESCAPE:
        arg += c;
        state = BASIC;
        break;
      case SINGLE_QUOTE:
        if (c == '\'') {
          state = BASIC;
        } else {
          arg += c;
        }
        break;
      case DOUBLE_QUOTE:
        if (c == '"') {
          state = BASIC;
        } else {
          arg += c;
        }
        break;
    }
  }
  if (inWord) {
    args.push_back(arg);
  }
  return args;
}
}  // namespace pe
