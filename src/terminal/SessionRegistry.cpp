#include "SessionRegistry.hpp"

#include "SubprocessUtils.hpp"

namespace agt {
SessionRegistry::SessionRegistry(shared_ptr<AgentCatalog> _catalog,
                                 PseudoTerminalFactory _terminalFactory)
    : catalog(_catalog), terminalFactory(_terminalFactory) {}

SessionRegistry::~SessionRegistry() { shutdown(); }

map<string, string> SessionRegistry::buildEnvironment(
    const string& agent, const map<string, string>& extraEnv) {
  map<string, string> env = SubprocessUtils::inheritedEnvironment();
  env["TERM"] = "xterm-256color";
  env["COLORTERM"] = "truecolor";
  env["FORCE_COLOR"] = "1";
  auto profile = catalog->find(agent);
  if (profile) {
    for (auto& it : profile->staticEnvironment) {
      env[it.first] = it.second;
    }
  }
  for (auto& it : extraEnv) {
    env[it.first] = it.second;
  }
  return env;
}

shared_ptr<TerminalSession> SessionRegistry::create(
    const string& projectId, const string& agent,
    shared_ptr<DuplexConnection> connection, const string& workingDir,
    const map<string, string>& extraEnv, bool startOutput) {
  lock_guard<recursive_mutex> lifecycleGuard(lifecycleMutex);
  const string id = TerminalSession::makeId(projectId, agent);

  shared_ptr<TerminalSession> existing = get(id);
  if (existing) {
    LOG(INFO) << "Replacing live session " << id;
    teardownLocked(existing);
  }

  std::error_code ec;
  if (!fs::is_directory(workingDir, ec)) {
    LOG(WARNING) << "Working directory " << workingDir << " for " << id
                 << " does not exist, the child will stay in "
                 << fs::current_path(ec).string();
  }

  SpawnRequest request;
  request.set_working_directory(workingDir);
  for (auto& arg : catalog->resolveCommand(agent)) {
    request.add_argv(arg);
  }
  for (auto& it : buildEnvironment(agent, extraEnv)) {
    request.add_environment_names(it.first);
    request.add_environment_values(it.second);
  }

  shared_ptr<PseudoTerminal> terminal = terminalFactory();
  int fd = terminal->spawn(request, DEFAULT_TERMINAL_COLS,
                           DEFAULT_TERMINAL_ROWS);
  LOG(INFO) << "Spawned " << request.argv(0) << " for " << id << " (pid "
            << terminal->getPid() << ", fd " << fd << ")";

  shared_ptr<TerminalSession> session(
      new TerminalSession(id, projectId, agent, terminal, connection,
                          DEFAULT_TERMINAL_COLS, DEFAULT_TERMINAL_ROWS));
  shared_ptr<OutputReader> reader(new OutputReader(session));
  {
    lock_guard<mutex> mapGuard(mapMutex);
    sessions[id] = session;
    readers[id] = reader;
  }
  if (startOutput) {
    reader->start();
  }
  return session;
}

void SessionRegistry::startReader(shared_ptr<TerminalSession> session) {
  lock_guard<recursive_mutex> lifecycleGuard(lifecycleMutex);
  shared_ptr<OutputReader> reader;
  {
    lock_guard<mutex> guard(mapMutex);
    auto it = sessions.find(session->getId());
    if (it != sessions.end() && it->second == session) {
      reader = readers[session->getId()];
    }
  }
  if (!reader) {
    VLOG(1) << "Session " << session->getId()
            << " is gone, not starting its output";
    return;
  }
  reader->start();
}

shared_ptr<TerminalSession> SessionRegistry::get(const string& id) {
  lock_guard<mutex> guard(mapMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<TerminalSession>();
  }
  return it->second;
}

vector<SessionSummary> SessionRegistry::list() {
  vector<shared_ptr<TerminalSession>> snapshot;
  {
    lock_guard<mutex> guard(mapMutex);
    for (auto& it : sessions) {
      snapshot.push_back(it.second);
    }
  }
  vector<SessionSummary> summaries;
  for (auto& session : snapshot) {
    summaries.push_back(session->summary());
  }
  return summaries;
}

void SessionRegistry::destroy(const string& id) {
  lock_guard<recursive_mutex> lifecycleGuard(lifecycleMutex);
  shared_ptr<TerminalSession> session = get(id);
  if (!session) {
    VLOG(1) << "No session " << id << " to destroy";
    return;
  }
  teardownLocked(session);
}

void SessionRegistry::destroySession(shared_ptr<TerminalSession> session) {
  if (!session) {
    return;
  }
  lock_guard<recursive_mutex> lifecycleGuard(lifecycleMutex);
  teardownLocked(session);
}

void SessionRegistry::shutdown() {
  lock_guard<recursive_mutex> lifecycleGuard(lifecycleMutex);
  vector<shared_ptr<TerminalSession>> all;
  {
    lock_guard<mutex> guard(mapMutex);
    for (auto& it : sessions) {
      all.push_back(it.second);
    }
  }
  if (!all.empty()) {
    LOG(INFO) << "Shutting down " << all.size() << " terminal session(s)";
  }
  for (auto& session : all) {
    teardownLocked(session);
  }
}

void SessionRegistry::teardownLocked(shared_ptr<TerminalSession> session) {
  const string& id = session->getId();
  bool registered = false;
  shared_ptr<OutputReader> reader;
  {
    lock_guard<mutex> guard(mapMutex);
    auto it = sessions.find(id);
    registered = (it != sessions.end() && it->second == session);
    if (registered) {
      auto readerIt = readers.find(id);
      if (readerIt != readers.end()) {
        reader = readerIt->second;
      }
    }
  }

  session->markEnding();
  if (reader) {
    reader->cancel();
  }
  session->teardown();

  if (registered) {
    lock_guard<mutex> guard(mapMutex);
    auto it = sessions.find(id);
    if (it != sessions.end() && it->second == session) {
      sessions.erase(it);
      readers.erase(id);
    }
    LOG(INFO) << "Session " << id << " destroyed";
  } else {
    VLOG(1) << "Session " << id
            << " was already replaced or removed, leaving the registry alone";
  }
}
}  // namespace agt
