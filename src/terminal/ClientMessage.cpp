#include "ClientMessage.hpp"

#include "SubprocessUtils.hpp"

namespace agt {
namespace {
/**
 * Reads a terminal dimension. Any JSON number is clamped to [0, 65535] before
 * it is narrowed; a missing field takes `fallback`.
 */
optional<int> dimensionField(const json& message, const char* key,
                             int fallback) {
  auto it = message.find(key);
  if (it == message.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number()) {
    return nullopt;
  }
  double value = it->get<double>();
  return int(std::max(0.0, std::min(value, 65535.0)));
}

optional<int> signalField(const json& message) {
  auto it = message.find("signal");
  if (it == message.end() || it->is_null()) {
    return SIGINT;
  }
  if (it->is_number_integer()) {
    int signo = it->get<int>();
    if (signo <= 0 || signo >= NSIG) {
      return nullopt;
    }
    return signo;
  }
  if (it->is_string()) {
    return SubprocessUtils::parseSignal(it->get<string>());
  }
  return nullopt;
}
}  // namespace

optional<ClientMessage> parseClientMessage(const string& text) {
  json message = json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    VLOG(1) << "Ignoring malformed client message";
    return nullopt;
  }
  try {
    string type = message.value("type", "");
    if (type == "input") {
      return ClientMessage(InputMessage{message.value("data", "")});
    }
    if (type == "command") {
      return ClientMessage(CommandMessage{message.value("command", "")});
    }
    if (type == "resize") {
      auto cols = dimensionField(message, "cols", DEFAULT_TERMINAL_COLS);
      auto rows = dimensionField(message, "rows", DEFAULT_TERMINAL_ROWS);
      if (!cols || !rows) {
        VLOG(1) << "Ignoring resize with non-numeric dimensions";
        return nullopt;
      }
      ResizeMessage resize;
      resize.cols = *cols;
      resize.rows = *rows;
      return ClientMessage(resize);
    }
    if (type == "stop") {
      return ClientMessage(StopMessage{});
    }
    if (type == "signal") {
      auto signo = signalField(message);
      if (!signo) {
        VLOG(1) << "Ignoring signal message with unknown signal";
        return nullopt;
      }
      return ClientMessage(SignalMessage{*signo});
    }
    if (type == "kill") {
      return ClientMessage(KillMessage{});
    }
    if (type == "ping") {
      return ClientMessage(PingMessage{});
    }
    VLOG(1) << "Ignoring client message of unknown type: " << type;
  } catch (const json::exception& je) {
    VLOG(1) << "Ignoring client message with bad fields: " << je.what();
  }
  return nullopt;
}

namespace ServerMessage {
json status(const string& status) {
  json j;
  j["type"] = "status";
  j["status"] = status;
  return j;
}

json output(const string& data) {
  json j;
  j["type"] = "output";
  j["data"] = data;
  return j;
}

json error(const string& message) {
  json j;
  j["type"] = "error";
  j["message"] = message;
  return j;
}

json pong() {
  json j;
  j["type"] = "pong";
  return j;
}
}  // namespace ServerMessage
}  // namespace agt
