#include "FakeConnection.hpp"
#include "ForkPtyTerminal.hpp"
#include "RawFdUtils.hpp"
#include "SessionRegistry.hpp"
#include "TestHeaders.hpp"

using namespace agt;

namespace {
shared_ptr<SessionRegistry> makeRegistry() {
  return shared_ptr<SessionRegistry>(
      new SessionRegistry(shared_ptr<AgentCatalog>(new AgentCatalog()), []() {
        return shared_ptr<PseudoTerminal>(new ForkPtyTerminal());
      }));
}

string makeProjectDir() {
  string pattern = GetTempDirectory() + string("agentterm_it_XXXXXX");
  return string(mkdtemp(&pattern[0]));
}

bool processGone(pid_t pid) { return ::kill(pid, 0) == -1 && errno == ESRCH; }
}  // namespace

TEST_CASE("SessionRegistry runs a shell on a pseudo-terminal",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> connection(new FakeConnection());

  auto session = registry->create("proj", "bash", connection, dir, {});
  REQUIRE(session->getId() == "proj_bash");
  REQUIRE(registry->get("proj_bash") == session);

  session->sendCommand("echo agentterm_$((6*7))");
  REQUIRE(connection->waitForOutput("agentterm_42"));

  session->sendCommand("pwd");
  REQUIRE(connection->waitForOutput(fs::path(dir).filename().string()));

  session->sendCommand("echo $TERM");
  REQUIRE(connection->waitForOutput("xterm-256color"));

  registry->destroy("proj_bash");
  REQUIRE_FALSE(registry->get("proj_bash"));
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry applies the terminal geometry",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> connection(new FakeConnection());
  auto session = registry->create("proj", "bash", connection, dir, {});

  session->resize(101, 33);
  session->sendCommand("stty size");
  REQUIRE(connection->waitForOutput("33 101"));

  registry->shutdown();
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry keeps one process per identity",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> first(new FakeConnection("first"));
  shared_ptr<FakeConnection> second(new FakeConnection("second"));

  auto firstSession = registry->create("proj", "bash", first, dir, {});
  pid_t firstPid = firstSession->getTerminal()->getPid();
  REQUIRE(firstPid > 0);

  auto secondSession = registry->create("proj", "bash", second, dir, {});
  pid_t secondPid = secondSession->getTerminal()->getPid();

  REQUIRE(firstPid != secondPid);
  REQUIRE(processGone(firstPid));
  REQUIRE(firstSession->getState() == SessionState::TERMINATED);
  REQUIRE(registry->list().size() == 1);
  REQUIRE(registry->get("proj_bash") == secondSession);
  REQUIRE(first->waitFor(FakeConnection::hasStatus("ended")));

  // The replaced handler's cleanup must leave the new session alone
  registry->destroySession(firstSession);
  REQUIRE(registry->get("proj_bash") == secondSession);
  REQUIRE(secondSession->isRunning());

  registry->destroySession(secondSession);
  REQUIRE(processGone(secondPid));
  REQUIRE(registry->list().empty());
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry releases every descriptor it opens",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  int before = RawFdUtils::countOpenFds();

  for (int a = 0; a < 5; a++) {
    shared_ptr<FakeConnection> connection(new FakeConnection());
    auto session = registry->create("proj", "bash", connection, dir, {});
    pid_t pid = session->getTerminal()->getPid();
    registry->destroy("proj_bash");
    REQUIRE(processGone(pid));
  }

  REQUIRE(RawFdUtils::countOpenFds() == before);
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry destroy is idempotent",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> connection(new FakeConnection());
  auto session = registry->create("proj", "bash", connection, dir, {});

  registry->destroy("proj_bash");
  registry->destroy("proj_bash");
  registry->destroy("never_created");
  registry->destroySession(session);
  REQUIRE(registry->list().empty());
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry shows a banner for agents that are not installed",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> connection(new FakeConnection());

  auto session = registry->create("proj", "ghost", connection, dir, {});
  REQUIRE(connection->waitForOutput("not installed"));
  REQUIRE(connection->waitForOutput("Install the ghost CLI"));

  // The fallback is an interactive shell
  session->sendCommand("echo fallback_$((2+3))");
  REQUIRE(connection->waitForOutput("fallback_5"));

  registry->shutdown();
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry reports the session end to the client",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> connection(new FakeConnection());
  auto session = registry->create("proj", "bash", connection, dir, {});

  session->sendCommand("exit");
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("ended")));
  REQUIRE_FALSE(session->isRunning());
  // The reader never removes the entry on its own
  REQUIRE(registry->get("proj_bash") == session);

  registry->destroy("proj_bash");
  REQUIRE(registry->list().empty());
  fs::remove_all(dir);
}

TEST_CASE("SessionRegistry falls back to the server directory",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  shared_ptr<FakeConnection> connection(new FakeConnection());
  auto session = registry->create("proj", "bash", connection,
                                  "/nonexistent/agentterm/project", {});
  REQUIRE(connection->waitForOutput("Could not change to working directory"));
  session->sendCommand("echo still_$((1+1))");
  REQUIRE(connection->waitForOutput("still_2"));
  registry->shutdown();
}

TEST_CASE("SessionRegistry passes extra environment to the child",
          "[SessionRegistry][integration]") {
  auto registry = makeRegistry();
  string dir = makeProjectDir();
  shared_ptr<FakeConnection> connection(new FakeConnection());
  auto session = registry->create("proj", "bash", connection, dir,
                                  {{"AGENTTERM_PROBE", "probe_value_17"}});
  session->sendCommand("echo \"<$AGENTTERM_PROBE>\"");
  REQUIRE(connection->waitForOutput("<probe_value_17>"));
  registry->shutdown();
  fs::remove_all(dir);
}

TEST_CASE("ForkPtyTerminal reports commands that cannot start",
          "[ForkPtyTerminal][integration]") {
  ForkPtyTerminal terminal;
  SpawnRequest request;
  request.add_argv("/nonexistent/agentterm-binary");
  int fd = terminal.spawn(request, 80, 24);
  REQUIRE(fd >= 0);

  string output;
  char buf[1024];
  for (int a = 0; a < 200 && output.find("Cannot execute") == string::npos;
       a++) {
    if (RawFdUtils::waitForReadable(fd, 20)) {
      ssize_t rc = ::read(fd, buf, sizeof(buf));
      if (rc > 0) {
        output.append(buf, rc);
      }
    }
  }
  REQUIRE(output.find("Cannot execute /nonexistent/agentterm-binary") !=
          string::npos);
  REQUIRE(terminal.reap(2000));
  REQUIRE(terminal.hasExited());
  terminal.closeFd();
  terminal.closeFd();
  REQUIRE(terminal.getFd() == -1);
  REQUIRE_FALSE(terminal.sendSignal(SIGTERM));
}

TEST_CASE("ForkPtyTerminal escalates to SIGKILL", "[ForkPtyTerminal][integration]") {
  ForkPtyTerminal terminal;
  SpawnRequest request;
  request.add_argv("/bin/sh");
  request.add_argv("-c");
  request.add_argv("trap '' TERM; while true; do sleep 1; done");
  terminal.spawn(request, 80, 24);
  pid_t pid = terminal.getPid();
  sleepMs(200);

  terminal.terminate(100);
  terminal.closeFd();
  REQUIRE(terminal.reap(2000));
  REQUIRE(processGone(pid));
}

namespace {
string readCommandLine(pid_t pid) {
  std::ifstream in("/proc/" + to_string(pid) + "/cmdline");
  return string(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
}

vector<string> childDescriptors(pid_t pid) {
  vector<string> targets;
  std::error_code ec;
  for (const auto& entry :
       fs::directory_iterator("/proc/" + to_string(pid) + "/fd", ec)) {
    std::error_code linkEc;
    fs::path target = fs::read_symlink(entry.path(), linkEc);
    targets.push_back(entry.path().filename().string() + " -> " +
                      (linkEc ? string("?") : target.string()));
  }
  return targets;
}
}  // namespace

TEST_CASE("ForkPtyTerminal children only inherit the terminal",
          "[ForkPtyTerminal][integration]") {
  if (!fs::is_directory("/proc/self/fd")) {
    WARN("No /proc, cannot inspect child descriptors");
    return;
  }
  int serverFile = ::open("/etc/hostname", O_RDONLY);
  if (serverFile < 0) {
    serverFile = ::open("/dev/null", O_RDONLY);
  }
  REQUIRE(serverFile >= 0);

  SpawnRequest request;
  request.add_argv("/bin/sleep");
  request.add_argv("5");
  ForkPtyTerminal first;
  ForkPtyTerminal second;
  int firstMaster = first.spawn(request, 80, 24);
  second.spawn(request, 80, 24);
  REQUIRE((::fcntl(firstMaster, F_GETFD) & FD_CLOEXEC) != 0);

  pid_t pid = second.getPid();
  for (int a = 0; a < 200 && readCommandLine(pid).find("sleep") == string::npos;
       a++) {
    sleepMs(10);
  }
  REQUIRE(readCommandLine(pid).find("sleep") != string::npos);

  vector<string> descriptors = childDescriptors(pid);
  INFO("child descriptors: " << Catch::Detail::stringify(descriptors));
  REQUIRE(descriptors.size() == 3);
  for (auto& descriptor : descriptors) {
    REQUIRE(descriptor.find("ptmx") == string::npos);
    REQUIRE(descriptor.find("hostname") == string::npos);
  }

  first.terminate(100);
  second.terminate(100);
  first.closeFd();
  second.closeFd();
  REQUIRE(first.reap(2000));
  REQUIRE(second.reap(2000));
  ::close(serverFile);
}
