#include "FakeConnection.hpp"
#include "ForkPtyTerminal.hpp"
#include "TerminalConnectionHandler.hpp"
#include "TestHeaders.hpp"

using namespace agt;

namespace {
struct ShellFixture {
  explicit ShellFixture(bool kickoffEnabled = false) {
    string pattern = GetTempDirectory() + string("agentterm_shell_XXXXXX");
    projectsDir = string(mkdtemp(&pattern[0]));
    registry.reset(new SessionRegistry(
        shared_ptr<AgentCatalog>(new AgentCatalog()), []() {
          return shared_ptr<PseudoTerminal>(new ForkPtyTerminal());
        }));
    HandlerOptions options;
    options.projectsDir = projectsDir;
    options.kickoffEnabled = kickoffEnabled;
    handler.reset(new TerminalConnectionHandler(
        registry,
        shared_ptr<ModelSettings>(
            new ModelSettings(projectsDir + "/settings.json")),
        options));
  }

  ~ShellFixture() {
    for (auto& connection : connections) {
      connection->disconnect();
    }
    for (auto& t : threads) {
      t.join();
    }
    registry->shutdown();
    fs::remove_all(projectsDir);
  }

  shared_ptr<FakeConnection> connect(const string& projectId,
                                     const string& agent) {
    shared_ptr<FakeConnection> connection(
        new FakeConnection("c" + std::to_string(connections.size())));
    connections.push_back(connection);
    threads.emplace_back([this, connection, projectId, agent]() {
      handler->run(connection, projectId, agent);
    });
    return connection;
  }

  string projectsDir;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<TerminalConnectionHandler> handler;
  vector<shared_ptr<FakeConnection>> connections;
  vector<thread> threads;
};
}  // namespace

TEST_CASE("A browser drives a shell end to end", "[Handler][integration]") {
  ShellFixture fixture;
  auto connection = fixture.connect("webapp", "bash");
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("connected")));
  REQUIRE(fs::is_directory(fs::path(fixture.projectsDir) / "webapp"));

  connection->clientSends({{"type", "command"}, {"command", "pwd"}});
  REQUIRE(connection->waitForOutput(fixture.projectsDir + "/webapp"));

  connection->clientSends({{"type", "input"}, {"data", "echo typed_$((3*3))\r"}});
  REQUIRE(connection->waitForOutput("typed_9"));

  connection->clientSends({{"type", "resize"}, {"cols", 90}, {"rows", 20}});
  connection->clientSends({{"type", "command"}, {"command", "stty size"}});
  REQUIRE(connection->waitForOutput("20 90"));

  connection->clientSends({{"type", "ping"}});
  REQUIRE(connection->waitFor(FakeConnection::hasType("pong")));
}

TEST_CASE("Kill ends the session and closes the connection",
          "[Handler][integration]") {
  ShellFixture fixture;
  auto connection = fixture.connect("webapp", "bash");
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("connected")));
  auto session = fixture.registry->get("webapp_bash");
  REQUIRE(session);
  pid_t pid = session->getTerminal()->getPid();

  connection->clientSends({{"type", "kill"}});
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("ended")));
  for (int a = 0; a < 100 && !connection->wasClosed(); a++) {
    sleepMs(20);
  }
  REQUIRE(connection->wasClosed());
  REQUIRE(fixture.registry->list().empty());
  REQUIRE((::kill(pid, 0) == -1 && errno == ESRCH));
}

TEST_CASE("Stop interrupts the foreground command", "[Handler][integration]") {
  ShellFixture fixture;
  auto connection = fixture.connect("webapp", "bash");
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("connected")));

  connection->clientSends({{"type", "command"}, {"command", "sleep 30"}});
  sleepMs(300);
  connection->clientSends({{"type", "stop"}});
  connection->clientSends(
      {{"type", "command"}, {"command", "echo after_$((4+4))"}});
  REQUIRE(connection->waitForOutput("after_8"));
  REQUIRE(fixture.registry->get("webapp_bash")->isRunning());
}

TEST_CASE("A second browser takes over the session", "[Handler][integration]") {
  ShellFixture fixture;
  auto first = fixture.connect("webapp", "bash");
  REQUIRE(first->waitFor(FakeConnection::hasStatus("connected")));
  auto firstSession = fixture.registry->get("webapp_bash");

  auto second = fixture.connect("webapp", "bash");
  REQUIRE(second->waitFor(FakeConnection::hasStatus("connected")));
  REQUIRE(first->waitFor(FakeConnection::hasStatus("ended")));

  auto secondSession = fixture.registry->get("webapp_bash");
  REQUIRE(secondSession != firstSession);

  // The first handler exits and must not take the new session with it
  for (int a = 0; a < 100 && !first->wasClosed(); a++) {
    sleepMs(20);
  }
  REQUIRE(first->wasClosed());
  REQUIRE(fixture.registry->get("webapp_bash") == secondSession);

  second->clientSends({{"type", "command"}, {"command", "echo alive_$((5*5))"}});
  REQUIRE(second->waitForOutput("alive_25"));
}

TEST_CASE("A disconnect terminates the process", "[Handler][integration]") {
  ShellFixture fixture;
  auto connection = fixture.connect("webapp", "bash");
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("connected")));
  pid_t pid = fixture.registry->get("webapp_bash")->getTerminal()->getPid();

  connection->disconnect();
  for (int a = 0; a < 200 && !fixture.registry->list().empty(); a++) {
    sleepMs(20);
  }
  REQUIRE(fixture.registry->list().empty());
  REQUIRE((::kill(pid, 0) == -1 && errno == ESRCH));
}

TEST_CASE("Kill right after connected takes effect at once",
          "[Handler][integration]") {
  ShellFixture fixture(true);
  auto connection = fixture.connect("webapp", "bash");
  REQUIRE(connection->waitFor(FakeConnection::hasStatus("connected")));

  auto start = std::chrono::steady_clock::now();
  connection->clientSends({{"type", "kill"}});
  while (!fixture.registry->list().empty() &&
         std::chrono::steady_clock::now() - start <
             std::chrono::milliseconds(2000)) {
    sleepMs(5);
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  REQUIRE(fixture.registry->list().empty());
  REQUIRE(elapsed < 1000);
}
