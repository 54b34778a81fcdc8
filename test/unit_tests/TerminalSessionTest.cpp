#include "FakeConnection.hpp"
#include "FakePseudoTerminal.hpp"
#include "OutputReader.hpp"
#include "TerminalSession.hpp"
#include "TestHeaders.hpp"

using namespace agt;

namespace {
struct SessionFixture {
  SessionFixture()
      : terminal(new FakePseudoTerminal()),
        connection(new FakeConnection()) {
    SpawnRequest request;
    request.add_argv("/bin/fake");
    terminal->spawn(request, 80, 24);
    session.reset(new TerminalSession(TerminalSession::makeId("demo", "bash"),
                                      "demo", "bash", terminal, connection, 80,
                                      24));
  }

  shared_ptr<FakePseudoTerminal> terminal;
  shared_ptr<FakeConnection> connection;
  shared_ptr<TerminalSession> session;
};
}  // namespace

TEST_CASE("TerminalSession identity is deterministic", "[TerminalSession]") {
  REQUIRE(TerminalSession::makeId("demo", "claude") == "demo_claude");
  REQUIRE(TerminalSession::makeId("demo", "claude") ==
          TerminalSession::makeId("demo", "claude"));
}

TEST_CASE("TerminalSession forwards input and commands", "[TerminalSession]") {
  SessionFixture f;
  REQUIRE(f.session->getState() == SessionState::STARTING);
  f.session->writeInput("ls");
  f.session->sendCommand("make test");
  f.session->interrupt();
  REQUIRE(f.terminal->getWritten() == "lsmake test\n\x03");
}

TEST_CASE("TerminalSession drops input once it stops running",
          "[TerminalSession]") {
  SessionFixture f;
  f.session->markEnding();
  REQUIRE_FALSE(f.session->isRunning());
  REQUIRE(f.session->getState() == SessionState::ENDING);
  f.session->writeInput("ignored");
  REQUIRE(f.terminal->getWritten().empty());
}

TEST_CASE("TerminalSession resize keeps the last applied geometry",
          "[TerminalSession]") {
  SessionFixture f;
  f.session->resize(120, 40);
  REQUIRE(f.session->getGeometry() == make_pair(120, 40));
  REQUIRE(f.terminal->getSize() == make_pair(120, 40));

  f.terminal->failResize = true;
  f.session->resize(10, 10);
  REQUIRE(f.session->getGeometry() == make_pair(120, 40));

  SessionSummary summary = f.session->summary();
  REQUIRE(summary.id() == "demo_bash");
  REQUIRE(summary.project_id() == "demo");
  REQUIRE(summary.agent() == "bash");
  REQUIRE(summary.running());
  REQUIRE(summary.cols() == 120);
  REQUIRE(summary.rows() == 40);
}

TEST_CASE("TerminalSession signals reach a live child only",
          "[TerminalSession]") {
  SessionFixture f;
  f.session->signal(SIGTERM);
  REQUIRE(f.terminal->getSignals() == vector<int>({SIGTERM}));
  f.terminal->exitChild();
  f.session->signal(SIGHUP);
  REQUIRE(f.terminal->getSignals() == vector<int>({SIGTERM}));
}

TEST_CASE("TerminalSession teardown is idempotent", "[TerminalSession]") {
  SessionFixture f;
  f.session->teardown();
  REQUIRE(f.session->getState() == SessionState::TERMINATED);
  REQUIRE_FALSE(f.session->isRunning());
  REQUIRE(f.terminal->terminated);
  REQUIRE(f.terminal->getFd() == -1);
  REQUIRE(f.terminal->reaped);

  f.session->teardown();
  f.session->writeInput("after");
  f.session->resize(1, 1);
  f.session->signal(SIGINT);
  REQUIRE(f.session->getState() == SessionState::TERMINATED);
}

TEST_CASE("TerminalSession reports a vanished client", "[TerminalSession]") {
  SessionFixture f;
  REQUIRE(f.session->sendToClient(ServerMessage::pong()));
  f.connection->disconnect();
  REQUIRE_FALSE(f.session->sendToClient(ServerMessage::pong()));
}

TEST_CASE("OutputReader streams output until the child exits",
          "[OutputReader]") {
  SessionFixture f;
  OutputReader reader(f.session);
  reader.start();

  f.terminal->emit("hello ");
  f.terminal->emit("world\r\n");
  REQUIRE(f.connection->waitForOutput("hello world\r\n"));
  REQUIRE(f.session->getState() == SessionState::RUNNING);

  f.terminal->exitChild();
  REQUIRE(f.connection->waitFor(FakeConnection::hasStatus("ended")));
  reader.cancel();
  REQUIRE(reader.isFinished());
  REQUIRE_FALSE(f.session->isRunning());

  auto messages = f.connection->sentMessages();
  const json& ended = messages.back();
  REQUIRE(ended["running"] == false);
  REQUIRE(ended["message"] == "Session ended");
}

TEST_CASE("OutputReader keeps split utf-8 characters intact",
          "[OutputReader]") {
  SessionFixture f;
  OutputReader reader(f.session);
  reader.start();

  f.terminal->emit("check \xE2\x9C");
  sleepMs(100);
  f.terminal->emit("\x93 done");
  REQUIRE(f.connection->waitForOutput("check \xE2\x9C\x93 done"));
  REQUIRE(f.connection->outputText().find("\xEF\xBF\xBD") == string::npos);
  f.terminal->exitChild();
  reader.cancel();
}

TEST_CASE("OutputReader stops promptly when cancelled", "[OutputReader]") {
  SessionFixture f;
  OutputReader reader(f.session);
  reader.start();
  sleepMs(50);

  auto start = std::chrono::steady_clock::now();
  reader.cancel();
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  REQUIRE(elapsed < 1000);
  REQUIRE(reader.isFinished());
  REQUIRE_FALSE(f.session->isRunning());
}

TEST_CASE("OutputReader gives up when the client is gone", "[OutputReader]") {
  SessionFixture f;
  OutputReader reader(f.session);
  reader.start();
  f.connection->disconnect();
  f.terminal->emit("nobody is listening");

  for (int a = 0; a < 100 && !reader.isFinished(); a++) {
    sleepMs(20);
  }
  REQUIRE(reader.isFinished());
  REQUIRE_FALSE(f.session->isRunning());
  reader.cancel();
}

TEST_CASE("OutputReader leaves output in the terminal while the client lags",
          "[OutputReader]") {
  SessionFixture f;
  f.connection->setStalled(true);
  OutputReader reader(f.session);
  reader.start();
  f.terminal->emit("held back");

  REQUIRE_FALSE(
      f.connection->waitFor(FakeConnection::hasType("output"), 300));

  f.connection->setStalled(false);
  REQUIRE(f.connection->waitForOutput("held back"));
  reader.cancel();
}

TEST_CASE("OutputReader cancels promptly while the client lags",
          "[OutputReader]") {
  SessionFixture f;
  f.connection->setStalled(true);
  OutputReader reader(f.session);
  reader.start();
  f.terminal->emit("never delivered");
  sleepMs(50);

  auto start = std::chrono::steady_clock::now();
  reader.cancel();
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  REQUIRE(elapsed < 1000);
  REQUIRE(reader.isFinished());
}
