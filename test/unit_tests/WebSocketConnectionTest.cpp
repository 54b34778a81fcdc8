#include "TestHeaders.hpp"
#include "WebSocketServer.hpp"

using namespace agt;

namespace {
shared_ptr<WebSocketConnection> makeConnection(size_t maxBytes,
                                               int sendTimeoutMs) {
  return shared_ptr<WebSocketConnection>(new WebSocketConnection(
      NULL, "/ws/terminal/demo/bash", []() {}, maxBytes, sendTimeoutMs));
}
}  // namespace

TEST_CASE("WebSocketConnection bounds the outbound queue",
          "[WebSocketConnection]") {
  auto connection = makeConnection(16 * 1024, 50);
  const string chunk(4096, 'y');

  int accepted = 0;
  for (int a = 0; a < 100; a++) {
    if (!connection->send(chunk)) {
      break;
    }
    accepted++;
  }
  REQUIRE(accepted == 4);
  REQUIRE(connection->getOutboundBytes() == 4 * chunk.size());
  REQUIRE_FALSE(connection->waitForCapacity(20));
  // A full queue does not mean the client is gone
  REQUIRE(connection->isOpen());
}

TEST_CASE("WebSocketConnection frees capacity as frames are written",
          "[WebSocketConnection]") {
  auto connection = makeConnection(8 * 1024, 50);
  const string chunk(4096, 'y');
  REQUIRE(connection->send(chunk));
  REQUIRE(connection->send(chunk));
  REQUIRE_FALSE(connection->waitForCapacity(0));

  string frame;
  REQUIRE(connection->popOutbound(&frame));
  REQUIRE(frame == chunk);
  REQUIRE(connection->waitForCapacity(0));
  REQUIRE(connection->send("{\"type\":\"pong\"}"));
}

TEST_CASE("WebSocketConnection wakes a blocked sender when drained",
          "[WebSocketConnection]") {
  auto connection = makeConnection(4096, 5000);
  REQUIRE(connection->send(string(4096, 'y')));

  atomic<bool> sent(false);
  thread sender([&]() { sent = connection->send("next"); });
  sleepMs(100);
  REQUIRE_FALSE(sent.load());

  string frame;
  REQUIRE(connection->popOutbound(&frame));
  sender.join();
  REQUIRE(sent.load());
  REQUIRE(connection->popOutbound(&frame));
  REQUIRE(frame == "next");
}

TEST_CASE("WebSocketConnection releases waiters when the socket closes",
          "[WebSocketConnection]") {
  auto connection = makeConnection(4096, 5000);
  REQUIRE(connection->send(string(4096, 'y')));

  atomic<bool> sent(true);
  thread sender([&]() { sent = connection->send("lost"); });
  sleepMs(50);
  connection->markClosed();
  sender.join();
  REQUIRE_FALSE(sent.load());
  REQUIRE(connection->getOutboundBytes() == 0);

  string message;
  REQUIRE(connection->receive(&message, 10) == ReceiveStatus::CLOSED);
}
