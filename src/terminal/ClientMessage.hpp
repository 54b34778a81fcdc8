#ifndef __AGT_CLIENT_MESSAGE_HPP__
#define __AGT_CLIENT_MESSAGE_HPP__

#include <variant>

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace agt {
/** @brief Raw keystrokes for the terminal. */
struct InputMessage {
  string data;
};
/** @brief A line of text; a newline is appended before writing. */
struct CommandMessage {
  string command;
};
struct ResizeMessage {
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};
/** @brief Ctrl+C through the terminal. */
struct StopMessage {};
struct SignalMessage {
  int signo = SIGINT;
};
struct KillMessage {};
struct PingMessage {};

/** @brief Every message a client may send. */
typedef std::variant<InputMessage, CommandMessage, ResizeMessage, StopMessage,
                     SignalMessage, KillMessage, PingMessage>
    ClientMessage;

/**
 * @brief Parses one inbound JSON message.
 * @returns nullopt for malformed JSON, unknown types or badly typed fields.
 */
optional<ClientMessage> parseClientMessage(const string& text);

/** @brief Builders for the messages sent to the client. */
namespace ServerMessage {
json status(const string& status);
json output(const string& data);
json error(const string& message);
json pong();
}  // namespace ServerMessage
}  // namespace agt

#endif  // __AGT_CLIENT_MESSAGE_HPP__
