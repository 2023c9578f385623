#include "ClientSession.hpp"

#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
namespace {
const uint32_t TRTP_MAGIC = 0x54525450;  // "TRTP"
const uint32_t HOTL_MAGIC = 0x484F544C;  // "HOTL"

// Servers only report a code and a sentence, so a refusal of a gated
// request is recognized by its wording.
bool looksLikePermissionDenial(const string& text) {
  string lower = text;
  transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return char(tolower(c)); });
  for (const char* marker :
       {"not allowed", "permission", "privilege", "access"}) {
    if (lower.find(marker) != string::npos) {
      return true;
    }
  }
  return false;
}

void invokeReplyCallback(const ReplyCallback& callback, const Reply& reply) {
  try {
    callback(reply);
  } catch (const std::exception& e) {
    STERROR << "Reply callback threw: " << e.what();
  }
}
}  // namespace

string sessionStateName(SessionState state) {
  switch (state) {
    case SessionState::DISCONNECTED:
      return "Disconnected";
    case SessionState::CONNECTING:
      return "Connecting";
    case SessionState::LOGGING_IN:
      return "LoggingIn";
    case SessionState::LOGGED_IN:
      return "LoggedIn";
    case SessionState::FAILED:
      return "Failed";
  }
  return "Unknown";
}

string serverEventTypeName(ServerEventType type) {
  switch (type) {
    case ServerEventType::CHAT:
      return "chat";
    case ServerEventType::PRIVATE_MESSAGE:
      return "private-message";
    case ServerEventType::BROADCAST:
      return "broadcast";
    case ServerEventType::USER_CHANGED:
      return "user-changed";
    case ServerEventType::USER_LEFT:
      return "user-left";
    case ServerEventType::AGREEMENT:
      return "agreement";
    case ServerEventType::PERMISSIONS_CHANGED:
      return "permissions-changed";
    case ServerEventType::BOARD_UPDATED:
      return "board-updated";
    case ServerEventType::DISCONNECT_MESSAGE:
      return "disconnect-message";
  }
  return "unknown";
}

ClientSession::ClientSession(shared_ptr<SocketHandler> _socketHandler)
    : socketHandler(_socketHandler),
      socketFd(-1),
      state(SessionState::DISCONNECTED),
      permissions(0),
      serverVersion(0),
      agreementAccepted(false),
      connectionOpen(false),
      nextTransactionId(1),
      nextSubscriptionId(1),
      shuttingDown(false),
      keepAliveInterval(std::chrono::seconds(CLIENT_KEEP_ALIVE_DURATION)),
      loginTimeout(std::chrono::seconds(LOGIN_TIMEOUT)),
      accessTimeout(std::chrono::milliseconds(LOGIN_ACCESS_WAIT_MS)),
      accessKnown(false) {}

ClientSession::~ClientSession() { disconnect(); }

void ClientSession::connect(const SocketEndpoint& _endpoint,
                            const Credentials& _credentials) {
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (state == SessionState::CONNECTING ||
        state == SessionState::LOGGING_IN ||
        state == SessionState::LOGGED_IN) {
      throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                         "Session is already connected");
    }
    permissions = 0;
    accessKnown = false;
    serverName.clear();
    serverVersion = 0;
    agreementAccepted = false;
    agreementText.reset();
  }
  // Leftovers of a previous, failed connection
  joinThreadsAndClose();
  endpoint = _endpoint;
  credentials = _credentials;
  codec = TransactionCodec();
  shuttingDown = false;

  LOG(INFO) << "Connecting to " << endpoint << " as " << credentials.login;
  int fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    ostringstream ss;
    ss << "Could not connect to " << endpoint;
    HotlineError error(ErrorKind::CONNECTIVITY, ss.str());
    setState(SessionState::FAILED, error);
    throw error;
  }
  socketFd = fd;
  {
    lock_guard<mutex> guard(pendingMutex);
    connectionOpen = true;
  }
  setState(SessionState::CONNECTING, nullopt);

  try {
    handshake();
  } catch (const HotlineError& error) {
    closeConnection(SessionState::FAILED, error);
    joinThreadsAndClose();
    throw;
  } catch (const std::runtime_error& re) {
    HotlineError error(ErrorKind::CONNECTIVITY,
                       string("Handshake failed: ") + re.what());
    closeConnection(SessionState::FAILED, error);
    joinThreadsAndClose();
    throw error;
  }

  readerThread = std::shared_ptr<std::thread>(
      new std::thread(&ClientSession::readLoop, this));
  setState(SessionState::LOGGING_IN, nullopt);

  auto loginPromise = make_shared<promise<Reply>>();
  auto loginFuture = loginPromise->get_future();
  registerAndSend(
      buildLoginTransaction(),
      [loginPromise](const Reply& reply) { loginPromise->set_value(reply); },
      false);
  if (loginFuture.wait_for(loginTimeout) != future_status::ready) {
    HotlineError error(ErrorKind::TIMEOUT, "The server did not answer the login");
    closeConnection(SessionState::FAILED, error);
    joinThreadsAndClose();
    throw error;
  }
  Reply reply = loginFuture.get();
  if (reply.error) {
    // Already FAILED: the reader closed the connection before resolving
    HotlineError error = *reply.error;
    closeConnection(SessionState::FAILED, error);
    joinThreadsAndClose();
    throw error;
  }

  // The reader moved the session to LOGGED_IN before resolving the login
  waitForAccess();
  if (getState() != SessionState::LOGGED_IN) {
    joinThreadsAndClose();
    throw HotlineError(ErrorKind::CONNECTION_LOST,
                       "Connection lost right after login");
  }
  keepAliveThread = std::shared_ptr<std::thread>(
      new std::thread(&ClientSession::keepAliveLoop, this));
}

void ClientSession::handshake() {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(TRTP_MAGIC);
  writer.writePrimitive<uint32_t>(HOTL_MAGIC);
  writer.writePrimitive<uint16_t>(1);
  writer.writePrimitive<uint16_t>(2);
  VLOG(1) << "Sending handshake";
  socketHandler->writeString(socketFd, writer.finish(), true);

  MessageReader reader(socketHandler->readString(socketFd, 8, true));
  if (reader.readPrimitive<uint32_t>() != TRTP_MAGIC) {
    throw HotlineError(ErrorKind::PROTOCOL,
                       "Server did not answer the Hotline handshake");
  }
  uint32_t errorCode = reader.readPrimitive<uint32_t>();
  if (errorCode != 0) {
    throw HotlineError(
        ErrorKind::CONNECTIVITY,
        "Server refused the handshake with code " + to_string(errorCode));
  }
  VLOG(1) << "Handshake complete";
}

void ClientSession::waitForAccess() {
  unique_lock<recursive_mutex> lock(stateMutex);
  bool known = accessCondition.wait_for(lock, accessTimeout, [this] {
    return accessKnown || state != SessionState::LOGGED_IN;
  });
  if (!known) {
    LOG(WARNING) << "No access privileges from " << endpoint
                 << ", gated requests will be refused";
  }
}

Transaction ClientSession::buildLoginTransaction() const {
  Transaction login(TransactionType::LOGIN);
  login.addEncodedString(FieldType::USER_LOGIN, credentials.login);
  login.addEncodedString(FieldType::USER_PASSWORD, credentials.password);
  login.addUInt16(FieldType::USER_ICON_ID, credentials.iconId);
  login.addString(FieldType::USER_NAME, credentials.nickname);
  login.addUInt32(FieldType::VERSION, HOTLINE_CLIENT_VERSION);
  return login;
}

void ClientSession::disconnect() {
  closeConnection(SessionState::DISCONNECTED,
                  HotlineError(ErrorKind::CONNECTION_LOST, "Disconnected"));
  if (readerThread && readerThread->get_id() == std::this_thread::get_id()) {
    // Called from a completion or event handler, the owner joins later
    return;
  }
  joinThreadsAndClose();
  bool changed = false;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    changed = (state == SessionState::FAILED);
  }
  if (changed) {
    setState(SessionState::DISCONNECTED, nullopt);
  }
}

uint32_t ClientSession::sendTransaction(Transaction transaction,
                                        ReplyCallback callback) {
  if (getState() != SessionState::LOGGED_IN) {
    invokeReplyCallback(
        callback, Reply{transaction, HotlineError(ErrorKind::CONNECTION_LOST,
                                                  "Session is not logged in")});
    return 0;
  }
  return registerAndSend(transaction, callback, false);
}

uint32_t ClientSession::sendGatedTransaction(Capability capability,
                                             Transaction transaction,
                                             ReplyCallback callback) {
  requireCapability(capability);
  if (getState() != SessionState::LOGGED_IN) {
    invokeReplyCallback(
        callback, Reply{transaction, HotlineError(ErrorKind::CONNECTION_LOST,
                                                  "Session is not logged in")});
    return 0;
  }
  return registerAndSend(transaction, callback, true);
}

void ClientSession::requireCapability(Capability capability) const {
  if (!isAllowed(getPermissions(), capability)) {
    LOG(INFO) << "Refusing locally, missing " << capabilityName(capability);
    throw HotlineError(ErrorKind::PERMISSION_DENIED_LOCAL,
                       "You are not allowed to " + capabilityName(capability));
  }
}

bool ClientSession::sendWithoutReply(Transaction transaction) {
  if (getState() != SessionState::LOGGED_IN) {
    return false;
  }
  transaction.setId(nextTransactionId++);
  transaction.setReply(false);
  return writeTransaction(transaction);
}

uint32_t ClientSession::registerAndSend(Transaction transaction,
                                        ReplyCallback callback, bool gated) {
  uint32_t id = nextTransactionId++;
  transaction.setId(id);
  transaction.setReply(false);
  bool registered = false;
  {
    lock_guard<mutex> guard(pendingMutex);
    if (connectionOpen) {
      pendingReplies[id] = PendingReply{callback, transaction.getType(), gated};
      registered = true;
    }
  }
  if (!registered) {
    invokeReplyCallback(callback,
                        Reply{transaction, HotlineError(ErrorKind::CONNECTION_LOST,
                                                        "Not connected")});
    return id;
  }
  // A failed write closes the connection, which resolves the slot
  writeTransaction(transaction);
  return id;
}

bool ClientSession::writeTransaction(const Transaction& transaction) {
  string frame;
  try {
    frame = TransactionCodec::encode(transaction);
  } catch (const std::runtime_error& re) {
    // Nothing was written, the connection itself is fine
    {
      lock_guard<mutex> guard(pendingMutex);
      pendingReplies.erase(transaction.getId());
    }
    throw HotlineError(ErrorKind::INVALID_ARGUMENT, re.what());
  }
  VLOG(2) << "Sending " << transaction;
  try {
    lock_guard<mutex> guard(writeMutex);
    socketHandler->writeString(socketFd, frame, true);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Write to " << endpoint << " failed: " << re.what();
    closeConnection(SessionState::FAILED,
                    HotlineError(ErrorKind::CONNECTIVITY,
                                 string("Write failed: ") + re.what()));
    return false;
  }
  return true;
}

void ClientSession::readLoop() {
  el::Helpers::setThreadName("session-reader");
  std::array<char, 64 * 1024> buffer;
  while (!shuttingDown) {
    if (!waitOnSocketData(socketFd)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(socketFd, &buffer[0], buffer.size());
    if (bytesRead < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      continue;
    }
    if (bytesRead <= 0) {
      if (!shuttingDown) {
        string reason = bytesRead == 0
                            ? string("Server closed the connection")
                            : string("Read failed: ") + strerror(errno);
        closeConnection(SessionState::FAILED,
                        HotlineError(ErrorKind::CONNECTIVITY, reason));
      }
      break;
    }
    VLOG(4) << "Read " << bytesRead << " bytes from " << endpoint;
    codec.append(&buffer[0], bytesRead);
    while (!shuttingDown) {
      Transaction transaction;
      string error;
      DecodeStatus status = codec.decode(&transaction, &error);
      if (status == DecodeStatus::INCOMPLETE_FRAME) {
        break;
      }
      if (status == DecodeStatus::MALFORMED_FRAME) {
        closeConnection(SessionState::FAILED,
                        HotlineError(ErrorKind::PROTOCOL,
                                     "Malformed transaction: " + error));
        break;
      }
      dispatch(transaction);
    }
  }
  VLOG(1) << "Reader for " << endpoint << " exiting";
}

void ClientSession::keepAliveLoop() {
  el::Helpers::setThreadName("session-keepalive");
  while (true) {
    {
      unique_lock<mutex> lock(keepAliveMutex);
      keepAliveCondition.wait_for(lock, keepAliveInterval,
                                  [this] { return shuttingDown.load(); });
    }
    if (shuttingDown) {
      break;
    }
    VLOG(1) << "Sending keepalive to " << endpoint;
    if (getServerVersion() >= KEEP_ALIVE_TRANSACTION_MIN_SERVER_VERSION) {
      sendWithoutReply(Transaction(TransactionType::KEEP_ALIVE));
    } else {
      sendTransaction(Transaction(TransactionType::GET_USER_NAME_LIST),
                      [](const Reply&) {});
    }
  }
}

void ClientSession::dispatch(const Transaction& transaction) {
  VLOG(2) << "Received " << transaction;
  if (transaction.isReply()) {
    resolveReply(transaction);
  } else {
    handlePush(transaction);
  }
}

void ClientSession::resolveReply(const Transaction& transaction) {
  PendingReply pendingReply;
  bool found = false;
  {
    lock_guard<mutex> guard(pendingMutex);
    auto it = pendingReplies.find(transaction.getId());
    if (it != pendingReplies.end()) {
      pendingReply = it->second;
      pendingReplies.erase(it);
      found = true;
    }
  }
  if (!found) {
    VLOG(1) << "Ignoring reply without a pending request: " << transaction;
    return;
  }

  Reply reply{transaction, nullopt};
  if (transaction.getErrorCode() != 0) {
    ErrorKind kind = ErrorKind::SERVER_REJECTED;
    if (pendingReply.type == TransactionType::LOGIN) {
      kind = ErrorKind::AUTHENTICATION;
    } else if (pendingReply.gated &&
               looksLikePermissionDenial(transaction.getErrorText())) {
      kind = ErrorKind::PERMISSION_DENIED_REMOTE;
    }
    reply.error = HotlineError(kind, transaction.getErrorText());
    LOG(INFO) << transactionTypeName(pendingReply.type)
              << " refused: " << reply.error->describe();
    if (kind == ErrorKind::AUTHENTICATION) {
      closeConnection(SessionState::FAILED, *reply.error);
    }
  } else if (pendingReply.type == TransactionType::LOGIN) {
    // Pushes that follow the reply in the same read must already see
    // LOGGED_IN, so the transition happens here and not in connect()
    bool loggedIn = false;
    {
      lock_guard<mutex> guard(pendingMutex);
      lock_guard<recursive_mutex> stateGuard(stateMutex);
      serverName = transaction.getString(FieldType::SERVER_NAME).value_or("");
      serverVersion =
          uint16_t(transaction.getInteger(FieldType::VERSION).value_or(0));
      auto access = transaction.getString(FieldType::USER_ACCESS);
      if (access) {
        try {
          permissions = permissionMaskFromWire(*access);
          accessKnown = true;
        } catch (const std::runtime_error& re) {
          LOG(WARNING) << "Ignoring access field in login reply: "
                       << re.what();
        }
      }
      if (connectionOpen) {
        state = SessionState::LOGGED_IN;
        loggedIn = true;
      }
    }
    if (loggedIn) {
      LOG(INFO) << "Logged in to " << getServerName() << " (server version "
                << getServerVersion() << ")";
      notifyStateSubscribers(SessionState::LOGGED_IN, nullopt);
    }
  }
  invokeReplyCallback(pendingReply.callback, reply);
}

void ClientSession::handlePush(const Transaction& transaction) {
  ServerEvent event;
  switch (transaction.getType()) {
    case TransactionType::CHAT_MESSAGE:
      event.type = ServerEventType::CHAT;
      event.text = transaction.getString(FieldType::DATA).value_or("");
      event.user.id =
          uint16_t(transaction.getInteger(FieldType::USER_ID).value_or(0));
      event.user.name =
          transaction.getString(FieldType::USER_NAME).value_or("");
      break;
    case TransactionType::SERVER_MESSAGE:
      event.text = transaction.getString(FieldType::DATA).value_or("");
      if (transaction.hasField(FieldType::USER_ID)) {
        event.type = ServerEventType::PRIVATE_MESSAGE;
        event.user.id =
            uint16_t(transaction.getInteger(FieldType::USER_ID).value_or(0));
        event.user.name =
            transaction.getString(FieldType::USER_NAME).value_or("");
      } else {
        event.type = ServerEventType::BROADCAST;
      }
      break;
    case TransactionType::NOTIFY_USER_CHANGE:
      event.type = ServerEventType::USER_CHANGED;
      event.user.id =
          uint16_t(transaction.getInteger(FieldType::USER_ID).value_or(0));
      event.user.iconId =
          uint16_t(transaction.getInteger(FieldType::USER_ICON_ID).value_or(0));
      event.user.flags =
          uint16_t(transaction.getInteger(FieldType::USER_FLAGS).value_or(0));
      event.user.name =
          transaction.getString(FieldType::USER_NAME).value_or("");
      break;
    case TransactionType::NOTIFY_USER_DELETE:
      event.type = ServerEventType::USER_LEFT;
      event.user.id =
          uint16_t(transaction.getInteger(FieldType::USER_ID).value_or(0));
      break;
    case TransactionType::SHOW_AGREEMENT: {
      event.type = ServerEventType::AGREEMENT;
      bool noAgreement =
          transaction.getInteger(FieldType::NO_SERVER_AGREEMENT).value_or(0) ==
          1;
      auto text = transaction.getString(FieldType::SERVER_AGREEMENT);
      if (!text) {
        text = transaction.getString(FieldType::DATA);
      }
      event.hasAgreement = !noAgreement && text.has_value();
      event.text = text.value_or("");
      if (event.hasAgreement) {
        lock_guard<recursive_mutex> guard(stateMutex);
        agreementText = event.text;
      }
      break;
    }
    case TransactionType::USER_ACCESS: {
      auto access = transaction.getString(FieldType::USER_ACCESS);
      if (!access) {
        LOG(WARNING) << "UserAccess push without an access field";
        return;
      }
      try {
        event.permissions = permissionMaskFromWire(*access);
      } catch (const std::runtime_error& re) {
        LOG(WARNING) << "Ignoring UserAccess push: " << re.what();
        return;
      }
      event.type = ServerEventType::PERMISSIONS_CHANGED;
      {
        lock_guard<recursive_mutex> guard(stateMutex);
        permissions = event.permissions;
        accessKnown = true;
      }
      accessCondition.notify_all();
      break;
    }
    case TransactionType::NEW_MESSAGE:
      event.type = ServerEventType::BOARD_UPDATED;
      event.text = transaction.getString(FieldType::DATA).value_or("");
      break;
    case TransactionType::DISCONNECT_MESSAGE:
      event.type = ServerEventType::DISCONNECT_MESSAGE;
      event.text = transaction.getString(FieldType::DATA).value_or("");
      publish(event);
      closeConnection(
          SessionState::FAILED,
          HotlineError(ErrorKind::CONNECTION_LOST,
                       "Disconnected by the server: " + event.text));
      return;
    default:
      LOG(INFO) << "Ignoring unsolicited " << transaction;
      return;
  }
  publish(event);
}

void ClientSession::publish(const ServerEvent& event) {
  vector<EventHandler> handlers;
  {
    lock_guard<recursive_mutex> guard(subscriberMutex);
    for (const auto& it : eventSubscribers) {
      if (it.second.first == event.type) {
        handlers.push_back(it.second.second);
      }
    }
  }
  VLOG(1) << "Publishing " << serverEventTypeName(event.type) << " to "
          << handlers.size() << " subscribers";
  for (const auto& handler : handlers) {
    try {
      handler(event);
    } catch (const std::exception& e) {
      STERROR << "Event handler threw: " << e.what();
    }
  }
}

int ClientSession::subscribe(ServerEventType type, EventHandler handler) {
  lock_guard<recursive_mutex> guard(subscriberMutex);
  int id = nextSubscriptionId++;
  eventSubscribers[id] = make_pair(type, handler);
  return id;
}

int ClientSession::subscribeState(StateHandler handler) {
  lock_guard<recursive_mutex> guard(subscriberMutex);
  int id = nextSubscriptionId++;
  stateSubscribers[id] = handler;
  return id;
}

void ClientSession::unsubscribe(int subscriptionId) {
  lock_guard<recursive_mutex> guard(subscriberMutex);
  eventSubscribers.erase(subscriptionId);
  stateSubscribers.erase(subscriptionId);
}

void ClientSession::closeConnection(SessionState newState,
                                    const HotlineError& error) {
  map<uint32_t, PendingReply> orphans;
  {
    lock_guard<mutex> guard(pendingMutex);
    if (!connectionOpen) {
      return;
    }
    connectionOpen = false;
    orphans.swap(pendingReplies);
  }
  shuttingDown = true;
  {
    lock_guard<mutex> guard(keepAliveMutex);
    keepAliveCondition.notify_all();
  }
  if (socketFd != -1) {
    socketHandler->interrupt(socketFd);
  }
  LOG(INFO) << "Connection to " << endpoint << " closed (" << error.describe()
            << "), releasing " << orphans.size() << " pending requests";
  if (newState == SessionState::DISCONNECTED) {
    setState(newState, nullopt);
  } else {
    setState(newState, error);
  }
  HotlineError lost(ErrorKind::CONNECTION_LOST, error.what());
  for (const auto& it : orphans) {
    Transaction request(it.second.type);
    request.setId(it.first);
    invokeReplyCallback(it.second.callback, Reply{request, lost});
  }
}

void ClientSession::joinThreadsAndClose() {
  if (readerThread) {
    if (readerThread->get_id() == std::this_thread::get_id()) {
      STERROR << "joinThreadsAndClose called from the reader thread";
      return;
    }
    readerThread->join();
    readerThread.reset();
  }
  if (keepAliveThread) {
    keepAliveThread->join();
    keepAliveThread.reset();
  }
  if (socketFd != -1) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}

void ClientSession::setState(SessionState newState,
                             const optional<HotlineError>& error) {
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (state == newState) {
      return;
    }
    state = newState;
  }
  accessCondition.notify_all();
  if (error) {
    LOG(INFO) << "Session " << endpoint << " is now " << newState << ": "
              << error->describe();
  } else {
    LOG(INFO) << "Session " << endpoint << " is now " << newState;
  }
  notifyStateSubscribers(newState, error);
}

void ClientSession::notifyStateSubscribers(
    SessionState newState, const optional<HotlineError>& error) {
  vector<StateHandler> handlers;
  {
    lock_guard<recursive_mutex> guard(subscriberMutex);
    for (const auto& it : stateSubscribers) handlers.push_back(it.second);
  }
  for (const auto& handler : handlers) {
    try {
      handler(newState, error);
    } catch (const std::exception& e) {
      STERROR << "State handler threw: " << e.what();
    }
  }
}

void ClientSession::getUserList(
    function<void(const vector<UserEntry>&, const optional<HotlineError>&)>
        callback) {
  sendTransaction(
      Transaction(TransactionType::GET_USER_NAME_LIST),
      [callback](const Reply& reply) {
        if (!reply.ok()) {
          callback({}, reply.error);
          return;
        }
        vector<UserEntry> users;
        try {
          for (auto field : reply.transaction.getFieldsOfType(
                   FieldType::USER_NAME_WITH_INFO)) {
            users.push_back(parseUserNameWithInfo(field->data));
          }
        } catch (const std::runtime_error& re) {
          callback({}, HotlineError(ErrorKind::PROTOCOL,
                                    string("Bad user list: ") + re.what()));
          return;
        }
        callback(users, nullopt);
      });
}

void ClientSession::sendChat(const string& text) {
  requireCapability(Capability::SEND_CHAT);
  Transaction chat(TransactionType::SEND_CHAT);
  chat.addString(FieldType::DATA, text);
  if (!sendWithoutReply(chat)) {
    throw HotlineError(ErrorKind::CONNECTION_LOST, "Chat was not sent");
  }
}

void ClientSession::sendInstantMessage(uint16_t userId, const string& text,
                                       ReplyCallback callback) {
  Transaction message(TransactionType::SEND_INSTANT_MESSAGE);
  message.addUInt16(FieldType::USER_ID, userId);
  message.addUInt32(FieldType::OPTIONS, 1);
  message.addString(FieldType::DATA, text);
  sendGatedTransaction(Capability::SEND_PRIVATE_MESSAGE, message, callback);
}

void ClientSession::broadcast(const string& text, ReplyCallback callback) {
  Transaction message(TransactionType::USER_BROADCAST);
  message.addString(FieldType::DATA, text);
  sendGatedTransaction(Capability::BROADCAST, message, callback);
}

void ClientSession::setClientUserInfo(const string& nickname,
                                      uint16_t iconId) {
  credentials.nickname = nickname;
  credentials.iconId = iconId;
  Transaction info(TransactionType::SET_CLIENT_USER_INFO);
  info.addString(FieldType::USER_NAME, nickname);
  info.addUInt16(FieldType::USER_ICON_ID, iconId);
  if (!sendWithoutReply(info)) {
    throw HotlineError(ErrorKind::CONNECTION_LOST, "User info was not sent");
  }
}

void ClientSession::acceptAgreement(ReplyCallback callback) {
  Transaction agreed(TransactionType::AGREED);
  agreed.addString(FieldType::USER_NAME, credentials.nickname);
  agreed.addUInt16(FieldType::USER_ICON_ID, credentials.iconId);
  agreed.addUInt32(FieldType::OPTIONS, 0);
  sendTransaction(agreed, [this, callback](const Reply& reply) {
    if (reply.ok()) {
      lock_guard<recursive_mutex> guard(stateMutex);
      agreementAccepted = true;
    }
    callback(reply);
  });
}

SessionState ClientSession::getState() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return state;
}

PermissionMask ClientSession::getPermissions() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return permissions;
}

string ClientSession::getServerName() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return serverName;
}

uint16_t ClientSession::getServerVersion() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return serverVersion;
}

bool ClientSession::isAgreementAccepted() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return agreementAccepted;
}

optional<string> ClientSession::getAgreementText() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return agreementText;
}

size_t ClientSession::pendingCount() {
  lock_guard<mutex> guard(pendingMutex);
  return pendingReplies.size();
}
}  // namespace hl
