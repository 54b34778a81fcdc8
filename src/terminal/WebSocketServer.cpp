#include "WebSocketServer.hpp"

#include "LogHandler.hpp"

namespace agt {
namespace {
const char PROTOCOL_NAME[] = "agentterm";
const int SERVICE_TIMEOUT_MS = 50;

void lwsLogEmitter(int level, const char* line) {
  string text(line);
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  if (level & LLL_ERR) {
    LOG(ERROR) << "libwebsockets: " << text;
  } else {
    LOG(WARNING) << "libwebsockets: " << text;
  }
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

optional<string> percentDecode(const string& s) {
  string out;
  for (size_t a = 0; a < s.size(); a++) {
    if (s[a] != '%') {
      out.push_back(s[a]);
      continue;
    }
    if (a + 2 >= s.size()) {
      return nullopt;
    }
    int high = hexValue(s[a + 1]);
    int low = hexValue(s[a + 2]);
    if (high < 0 || low < 0) {
      return nullopt;
    }
    out.push_back(char(high * 16 + low));
    a += 2;
  }
  return out;
}
}  // namespace

WebSocketConnection::WebSocketConnection(lws* _wsi, const string& _path,
                                         std::function<void()> _wakeup,
                                         size_t _maxOutboundBytes,
                                         int _sendTimeoutMs)
    : wsi(_wsi),
      path(_path),
      id(sole::uuid4().str().substr(0, 8)),
      wakeup(_wakeup),
      maxOutboundBytes(_maxOutboundBytes),
      sendTimeoutMs(_sendTimeoutMs),
      outboundBytes(0),
      closed(false),
      closeRequested(false) {}

bool WebSocketConnection::send(const string& text) {
  {
    unique_lock<mutex> lock(queueMutex);
    // The queue may overshoot the cap by one message, so a producer that
    // waited for capacity never blocks here.
    bool hasRoom = outboundSpace.wait_for(
        lock, std::chrono::milliseconds(sendTimeoutMs), [this] {
          return closed || closeRequested || outboundBytes < maxOutboundBytes;
        });
    if (closed || closeRequested) {
      return false;
    }
    if (!hasRoom) {
      LOG(WARNING) << "WebSocket " << id << " has not drained "
                   << outboundBytes << " bytes in " << sendTimeoutMs
                   << "ms, dropping a message";
      return false;
    }
    outbound.push_back(text);
    outboundBytes += text.size();
  }
  wakeup();
  return true;
}

bool WebSocketConnection::waitForCapacity(int timeoutMs) {
  unique_lock<mutex> lock(queueMutex);
  return outboundSpace.wait_for(
      lock, std::chrono::milliseconds(timeoutMs), [this] {
        return closed || closeRequested || outboundBytes < maxOutboundBytes;
      });
}

size_t WebSocketConnection::getOutboundBytes() {
  lock_guard<mutex> guard(queueMutex);
  return outboundBytes;
}

ReceiveStatus WebSocketConnection::receive(string* message, int timeoutMs) {
  unique_lock<mutex> lock(queueMutex);
  inboundReady.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                        [this] { return !inbound.empty() || closed; });
  if (!inbound.empty()) {
    *message = inbound.front();
    inbound.pop_front();
    return ReceiveStatus::MESSAGE;
  }
  return closed ? ReceiveStatus::CLOSED : ReceiveStatus::TIMEOUT;
}

bool WebSocketConnection::isOpen() {
  lock_guard<mutex> guard(queueMutex);
  return !closed && !closeRequested;
}

void WebSocketConnection::close() {
  {
    lock_guard<mutex> guard(queueMutex);
    if (closed || closeRequested) {
      return;
    }
    closeRequested = true;
  }
  outboundSpace.notify_all();
  wakeup();
}

void WebSocketConnection::onFragment(const char* data, size_t len,
                                     bool final) {
  fragments.append(data, len);
  if (!final) {
    return;
  }
  {
    lock_guard<mutex> guard(queueMutex);
    inbound.push_back(fragments);
  }
  fragments.clear();
  inboundReady.notify_all();
}

bool WebSocketConnection::popOutbound(string* text) {
  {
    lock_guard<mutex> guard(queueMutex);
    if (outbound.empty()) {
      return false;
    }
    *text = outbound.front();
    outbound.pop_front();
    outboundBytes -= text->size();
  }
  outboundSpace.notify_all();
  return true;
}

bool WebSocketConnection::hasPendingOutput() {
  lock_guard<mutex> guard(queueMutex);
  return !outbound.empty();
}

bool WebSocketConnection::readyToClose() {
  lock_guard<mutex> guard(queueMutex);
  return closeRequested && outbound.empty();
}

void WebSocketConnection::markClosed() {
  {
    lock_guard<mutex> guard(queueMutex);
    closed = true;
    outbound.clear();
    outboundBytes = 0;
  }
  inboundReady.notify_all();
  outboundSpace.notify_all();
}

WebSocketServer::WebSocketServer(const string& _bindIp, int _port,
                                 ConnectionCallback _onConnection)
    : bindIp(_bindIp),
      port(_port),
      onConnection(_onConnection),
      context(NULL),
      halt(false) {
  memset(protocols, 0, sizeof(protocols));
  protocols[0].name = PROTOCOL_NAME;
  protocols[0].callback = &WebSocketServer::serviceCallback;
  protocols[0].per_session_data_size = 0;
  protocols[0].rx_buffer_size = 0;
}

WebSocketServer::~WebSocketServer() { stop(); }

void WebSocketServer::start() {
  lws_set_log_level(LLL_ERR | LLL_WARN, lwsLogEmitter);

  lws_context_creation_info info;
  memset(&info, 0, sizeof(info));
  info.port = port;
  info.iface = bindIp.empty() ? NULL : bindIp.c_str();
  info.protocols = protocols;
  info.gid = -1;
  info.uid = -1;
  info.user = this;
  info.options = LWS_SERVER_OPTION_VALIDATE_UTF8;

  lws_context* newContext = lws_create_context(&info);
  if (newContext == NULL) {
    throw std::runtime_error("Could not start the WebSocket server on port " +
                             to_string(port));
  }
  {
    lock_guard<mutex> guard(contextMutex);
    context = newContext;
  }
  halt = false;
  serviceThread.reset(new thread(&WebSocketServer::serviceLoop, this));
  LOG(INFO) << "WebSocket server listening on "
            << (bindIp.empty() ? string("*") : bindIp) << ":" << port;
}

void WebSocketServer::stop() {
  if (!serviceThread) {
    return;
  }
  halt = true;
  wake();
  serviceThread->join();
  serviceThread.reset();

  // Handlers see their connection close and tear down their sessions.
  {
    lock_guard<mutex> guard(connectionMutex);
    for (auto& it : connections) {
      it.second->markClosed();
    }
  }
  {
    lock_guard<mutex> guard(handlerMutex);
    for (auto& handler : handlers) {
      handler.worker->join();
    }
    handlers.clear();
  }

  lws_context* oldContext;
  {
    lock_guard<mutex> guard(contextMutex);
    oldContext = context;
    context = NULL;
  }
  lws_context_destroy(oldContext);
  {
    lock_guard<mutex> guard(connectionMutex);
    connections.clear();
  }
  LOG(INFO) << "WebSocket server stopped";
}

void WebSocketServer::wake() {
  lock_guard<mutex> guard(contextMutex);
  if (context != NULL) {
    lws_cancel_service(context);
  }
}

void WebSocketServer::serviceLoop() {
  LogHandler::setThreadName("ws-service");
  while (!halt) {
    lws_context* current;
    {
      lock_guard<mutex> guard(contextMutex);
      current = context;
    }
    lws_service(current, SERVICE_TIMEOUT_MS);
    pruneHandlers();
  }
}

optional<pair<string, string>> WebSocketServer::parseTerminalPath(
    const string& path) {
  string route = path.substr(0, path.find('?'));
  vector<string> parts = split(route, '/');
  if (parts.size() != 5 || !parts[0].empty() || parts[1] != "ws" ||
      parts[2] != "terminal") {
    return nullopt;
  }
  optional<string> projectId = percentDecode(parts[3]);
  optional<string> agent = percentDecode(parts[4]);
  if (!projectId || !agent) {
    return nullopt;
  }
  return make_pair(*projectId, *agent);
}

string WebSocketServer::requestUri(lws* wsi) {
  int length = lws_hdr_total_length(wsi, WSI_TOKEN_GET_URI);
  if (length <= 0) {
    return "";
  }
  string uri(length + 1, '\0');
  int copied = lws_hdr_copy(wsi, &uri[0], length + 1, WSI_TOKEN_GET_URI);
  if (copied < 0) {
    return "";
  }
  uri.resize(copied);
  return uri;
}

int WebSocketServer::serviceCallback(lws* wsi,
                                     enum lws_callback_reasons reason,
                                     void* user, void* in, size_t len) {
  lws_context* ctx = lws_get_context(wsi);
  WebSocketServer* server =
      ctx ? static_cast<WebSocketServer*>(lws_context_user(ctx)) : NULL;
  if (server == NULL) {
    return lws_callback_http_dummy(wsi, reason, user, in, len);
  }
  return server->handleCallback(wsi, reason, user, in, len);
}

int WebSocketServer::handleCallback(lws* wsi,
                                    enum lws_callback_reasons reason,
                                    void* user, void* in, size_t len) {
  switch (reason) {
    case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION: {
      string uri = requestUri(wsi);
      if (!parseTerminalPath(uri)) {
        LOG(INFO) << "Rejecting WebSocket upgrade for " << uri;
        return -1;
      }
      return 0;
    }
    case LWS_CALLBACK_ESTABLISHED:
      onEstablished(wsi);
      return 0;
    case LWS_CALLBACK_RECEIVE: {
      auto connection = findConnection(wsi);
      if (connection) {
        bool final = lws_is_final_fragment(wsi) &&
                     lws_remaining_packet_payload(wsi) == 0;
        connection->onFragment(static_cast<const char*>(in), len, final);
      }
      return 0;
    }
    case LWS_CALLBACK_SERVER_WRITEABLE:
      return onWriteable(wsi);
    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
      lock_guard<mutex> guard(connectionMutex);
      for (auto& it : connections) {
        if (it.second->hasPendingOutput() || it.second->readyToClose()) {
          lws_callback_on_writable(it.first);
        }
      }
      return 0;
    }
    case LWS_CALLBACK_CLOSED: {
      shared_ptr<WebSocketConnection> connection;
      {
        lock_guard<mutex> guard(connectionMutex);
        auto it = connections.find(wsi);
        if (it != connections.end()) {
          connection = it->second;
          connections.erase(it);
        }
      }
      if (connection) {
        LOG(INFO) << "WebSocket " << connection->getId() << " closed";
        connection->markClosed();
      }
      return 0;
    }
    default:
      return lws_callback_http_dummy(wsi, reason, user, in, len);
  }
}

void WebSocketServer::onEstablished(lws* wsi) {
  string uri = requestUri(wsi);
  auto route = parseTerminalPath(uri);
  if (!route) {
    // Upgrades are filtered earlier, so this is a client we cannot route.
    LOG(WARNING) << "Established WebSocket with unroutable path " << uri;
    return;
  }
  shared_ptr<WebSocketConnection> connection(
      new WebSocketConnection(wsi, uri, [this] { wake(); }));
  {
    lock_guard<mutex> guard(connectionMutex);
    connections[wsi] = connection;
  }
  LOG(INFO) << "WebSocket " << connection->getId() << " connected for "
            << route->first << "/" << route->second;
  spawnHandler(connection, route->first, route->second);
}

int WebSocketServer::onWriteable(lws* wsi) {
  auto connection = findConnection(wsi);
  if (!connection) {
    return 0;
  }
  string text;
  if (connection->popOutbound(&text)) {
    vector<unsigned char> buffer(LWS_PRE + text.size());
    memcpy(buffer.data() + LWS_PRE, text.data(), text.size());
    int written =
        lws_write(wsi, buffer.data() + LWS_PRE, text.size(), LWS_WRITE_TEXT);
    if (written < int(text.size())) {
      LOG(WARNING) << "Short write on WebSocket " << connection->getId()
                   << ", dropping the connection";
      return -1;
    }
  }
  if (connection->hasPendingOutput()) {
    lws_callback_on_writable(wsi);
  } else if (connection->readyToClose()) {
    lws_close_reason(wsi, LWS_CLOSE_STATUS_NORMAL, NULL, 0);
    return -1;
  }
  return 0;
}

shared_ptr<WebSocketConnection> WebSocketServer::findConnection(lws* wsi) {
  lock_guard<mutex> guard(connectionMutex);
  auto it = connections.find(wsi);
  if (it == connections.end()) {
    return shared_ptr<WebSocketConnection>();
  }
  return it->second;
}

void WebSocketServer::spawnHandler(shared_ptr<WebSocketConnection> connection,
                                   const string& projectId,
                                   const string& agent) {
  HandlerThread handler;
  handler.done.reset(new atomic<bool>(false));
  auto done = handler.done;
  auto callback = onConnection;
  handler.worker.reset(new thread([callback, connection, projectId, agent,
                                   done]() {
    try {
      callback(connection, projectId, agent);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Connection handler for " << connection->getId()
                 << " failed: " << ex.what();
      connection->close();
    }
    *done = true;
  }));
  lock_guard<mutex> guard(handlerMutex);
  handlers.push_back(handler);
}

void WebSocketServer::pruneHandlers() {
  lock_guard<mutex> guard(handlerMutex);
  for (auto it = handlers.begin(); it != handlers.end();) {
    if (*(it->done)) {
      it->worker->join();
      it = handlers.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace agt
