#include "SubprocessUtils.hpp"

extern char** environ;

namespace agt {
namespace {
bool isExecutableFile(const string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

const map<string, int> SIGNALS_BY_NAME = {
    {"HUP", SIGHUP},   {"INT", SIGINT},   {"QUIT", SIGQUIT},
    {"KILL", SIGKILL}, {"USR1", SIGUSR1}, {"USR2", SIGUSR2},
    {"TERM", SIGTERM}, {"CONT", SIGCONT}, {"STOP", SIGSTOP},
    {"TSTP", SIGTSTP}, {"WINCH", SIGWINCH},
};
}  // namespace

string SubprocessUtils::findInPath(const string& name) {
  if (name.empty()) {
    return "";
  }
  if (name.find('/') != string::npos) {
    return isExecutableFile(name) ? name : "";
  }
  const char* pathEnv = ::getenv("PATH");
  string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
  for (const string& dir : split(searchPath, ':')) {
    // An empty PATH entry means the current directory
    string candidate = (dir.empty() ? string(".") : dir) + "/" + name;
    if (isExecutableFile(candidate)) {
      return candidate;
    }
  }
  return "";
}

map<string, string> SubprocessUtils::inheritedEnvironment() {
  map<string, string> env;
  for (char** it = environ; it && *it; it++) {
    string entry(*it);
    auto eq = entry.find('=');
    if (eq == string::npos) {
      continue;
    }
    env[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  return env;
}

optional<int> SubprocessUtils::parseSignal(const string& text) {
  if (text.empty()) {
    return nullopt;
  }
  if (std::all_of(text.begin(), text.end(),
                  [](unsigned char c) { return std::isdigit(c); })) {
    int signo = 0;
    try {
      signo = std::stoi(text);
    } catch (const std::out_of_range&) {
      return nullopt;
    }
    if (signo <= 0 || signo >= NSIG) {
      return nullopt;
    }
    return signo;
  }
  string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper.rfind("SIG", 0) == 0) {
    upper = upper.substr(3);
  }
  auto it = SIGNALS_BY_NAME.find(upper);
  if (it == SIGNALS_BY_NAME.end()) {
    return nullopt;
  }
  return it->second;
}
}  // namespace agt
