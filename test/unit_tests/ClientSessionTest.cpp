#include "FakeHotlineServer.hpp"

using namespace hl;

namespace {
template <class F>
ErrorKind errorKindOf(F f) {
  try {
    f();
  } catch (const HotlineError& e) {
    return e.getKind();
  }
  FAIL("No HotlineError was thrown");
  return ErrorKind::PROTOCOL;
}

// Collects replies delivered on the reader thread.
struct ReplyCollector {
  promise<Reply> result;
  future<Reply> pending = result.get_future();

  ReplyCallback callback() {
    return [this](const Reply& reply) { result.set_value(reply); };
  }
  Reply get() { return waitFor(pending); }
};
}  // namespace

TEST_CASE("Login fills in the server identity", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = make_shared<ClientSession>(handler);

  vector<SessionState> states;
  session->subscribeState(
      [&states](SessionState state, const optional<HotlineError>& error) {
        states.push_back(state);
      });

  PermissionMask granted = permissionMaskOf(
      {Capability::SEND_CHAT, Capability::DOWNLOAD_FILE});
  auto script = std::async(std::launch::async, [&server, granted] {
    return server.acceptLogin(granted, "Test Server", 185);
  });
  Credentials credentials;
  credentials.login = "tester";
  credentials.password = "secret";
  credentials.nickname = "Bob";
  credentials.iconId = 128;
  session->connect(SocketEndpoint("fake.example", 5500), credentials);
  Transaction login = waitFor(script);

  REQUIRE(session->getState() == SessionState::LOGGED_IN);
  REQUIRE(session->getServerName() == "Test Server");
  REQUIRE(session->getServerVersion() == 185);
  REQUIRE(session->getPermissions() == granted);
  REQUIRE(states == vector<SessionState>({SessionState::CONNECTING,
                                          SessionState::LOGGING_IN,
                                          SessionState::LOGGED_IN}));

  REQUIRE(*login.getString(FieldType::USER_LOGIN) ==
          encodeHotlineString("tester"));
  REQUIRE(*login.getString(FieldType::USER_PASSWORD) ==
          encodeHotlineString("secret"));
  REQUIRE(*login.getString(FieldType::USER_NAME) == "Bob");
  REQUIRE(*login.getInteger(FieldType::USER_ICON_ID) == 128);
  REQUIRE(*login.getInteger(FieldType::VERSION) == HOTLINE_CLIENT_VERSION);

  vector<SocketEndpoint> endpoints = handler->getConnectedEndpoints();
  REQUIRE(endpoints.size() == 1);
  REQUIRE(endpoints[0].getName() == "fake.example");
  REQUIRE(endpoints[0].getPort() == 5500);
  REQUIRE(session->getServerId() == "fake.example:5500");

  session->disconnect();
  REQUIRE(session->getState() == SessionState::DISCONNECTED);
}

TEST_CASE("Connection failures", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  Credentials credentials;

  SECTION("Nothing listening") {
    auto session = make_shared<ClientSession>(handler);
    REQUIRE(errorKindOf([&] {
              session->connect(SocketEndpoint("nowhere.example", 5500),
                               credentials);
            }) == ErrorKind::CONNECTIVITY);
    REQUIRE(session->getState() == SessionState::FAILED);
  }

  SECTION("Handshake refused") {
    FakeHotlineServer server(handler);
    auto session = make_shared<ClientSession>(handler);
    auto script = std::async(std::launch::async,
                             [&server] { server.acceptHandshake(3); });
    REQUIRE(errorKindOf([&] {
              session->connect(SocketEndpoint("fake.example", 5500),
                               credentials);
            }) == ErrorKind::CONNECTIVITY);
    waitFor(script);
    REQUIRE(session->getState() == SessionState::FAILED);
  }

  SECTION("Login refused") {
    FakeHotlineServer server(handler);
    auto session = make_shared<ClientSession>(handler);
    auto script = std::async(std::launch::async, [&server] {
      server.acceptHandshake();
      Transaction login = server.expectTransaction(TransactionType::LOGIN);
      server.sendError(login, "Incorrect login.");
    });
    optional<HotlineError> lastError;
    session->subscribeState(
        [&lastError](SessionState state, const optional<HotlineError>& error) {
          if (error) lastError = error;
        });
    REQUIRE(errorKindOf([&] {
              session->connect(SocketEndpoint("fake.example", 5500),
                               credentials);
            }) == ErrorKind::AUTHENTICATION);
    waitFor(script);
    REQUIRE(session->getState() == SessionState::FAILED);
    REQUIRE(lastError);
    REQUIRE(lastError->getKind() == ErrorKind::AUTHENTICATION);
    REQUIRE(string(lastError->what()) == "Incorrect login.");
  }

  SECTION("Login times out") {
    FakeHotlineServer server(handler);
    auto session = make_shared<ClientSession>(handler);
    session->setLoginTimeout(std::chrono::milliseconds(200));
    auto script = std::async(std::launch::async, [&server] {
      server.acceptHandshake();
      server.expectTransaction(TransactionType::LOGIN);
    });
    REQUIRE(errorKindOf([&] {
              session->connect(SocketEndpoint("fake.example", 5500),
                               credentials);
            }) == ErrorKind::TIMEOUT);
    waitFor(script);
    REQUIRE(session->getState() == SessionState::FAILED);
  }
}

TEST_CASE("Replies are matched by id in any order", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  ReplyCollector first, second;
  uint32_t firstId = session->sendTransaction(
      Transaction(TransactionType::GET_FILE_NAME_LIST), first.callback());
  uint32_t secondId = session->sendTransaction(
      Transaction(TransactionType::GET_NEWS_CAT_NAME_LIST), second.callback());
  REQUIRE(firstId != secondId);

  Transaction firstRequest =
      server.expectTransaction(TransactionType::GET_FILE_NAME_LIST);
  Transaction secondRequest =
      server.expectTransaction(TransactionType::GET_NEWS_CAT_NAME_LIST);
  REQUIRE(firstRequest.getId() == firstId);
  REQUIRE(secondRequest.getId() == secondId);
  REQUIRE_FALSE(firstRequest.isReply());
  REQUIRE(session->pendingCount() == 2);

  Transaction secondReply = Transaction::replyTo(secondRequest);
  secondReply.addString(FieldType::DATA, "second");
  server.send(secondReply);
  Transaction firstReply = Transaction::replyTo(firstRequest);
  firstReply.addString(FieldType::DATA, "first");
  server.send(firstReply);

  REQUIRE(*second.get().transaction.getString(FieldType::DATA) == "second");
  REQUIRE(*first.get().transaction.getString(FieldType::DATA) == "first");
  REQUIRE(session->pendingCount() == 0);
}

TEST_CASE("Refusals of gated requests", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  SECTION("Permission wording") {
    ReplyCollector collector;
    session->broadcast("hello everyone", collector.callback());
    Transaction request =
        server.expectTransaction(TransactionType::USER_BROADCAST);
    REQUIRE(*request.getString(FieldType::DATA) == "hello everyone");
    server.sendError(request, "You are not allowed to send broadcast messages.");
    Reply reply = collector.get();
    REQUIRE_FALSE(reply.ok());
    REQUIRE(reply.error->getKind() == ErrorKind::PERMISSION_DENIED_REMOTE);
  }

  SECTION("Any other error") {
    ReplyCollector collector;
    session->broadcast("hello everyone", collector.callback());
    Transaction request =
        server.expectTransaction(TransactionType::USER_BROADCAST);
    server.sendError(request, "Server is busy.");
    Reply reply = collector.get();
    REQUIRE(reply.error->getKind() == ErrorKind::SERVER_REJECTED);
    REQUIRE(string(reply.error->what()) == "Server is busy.");
  }

  SECTION("Ungated requests never count as permission errors") {
    ReplyCollector collector;
    session->sendTransaction(Transaction(TransactionType::GET_FILE_INFO),
                             collector.callback());
    Transaction request =
        server.expectTransaction(TransactionType::GET_FILE_INFO);
    server.sendError(request, "Access to that file is not allowed.");
    REQUIRE(collector.get().error->getKind() == ErrorKind::SERVER_REJECTED);
  }

  // A refused request leaves the session usable
  REQUIRE(session->getState() == SessionState::LOGGED_IN);
}

TEST_CASE("Local permission checks send nothing", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server,
                                permissionMaskOf({Capability::SEND_CHAT}));

  bool called = false;
  REQUIRE(errorKindOf([&] {
            session->broadcast("hi", [&called](const Reply&) { called = true; });
          }) == ErrorKind::PERMISSION_DENIED_LOCAL);
  REQUIRE(errorKindOf([&] {
            session->sendInstantMessage(
                3, "hi", [&called](const Reply&) { called = true; });
          }) == ErrorKind::PERMISSION_DENIED_LOCAL);
  REQUIRE_FALSE(called);
  REQUIRE(session->pendingCount() == 0);

  // The next thing on the wire is the chat line
  session->sendChat("hello");
  Transaction chat = server.expectTransaction(TransactionType::SEND_CHAT);
  REQUIRE(*chat.getString(FieldType::DATA) == "hello");
}

TEST_CASE("Pending requests fail when the connection goes", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  ReplyCollector collector;
  session->sendTransaction(Transaction(TransactionType::GET_USER_NAME_LIST),
                           collector.callback());
  server.expectTransaction(TransactionType::GET_USER_NAME_LIST);

  SECTION("Local disconnect") {
    session->disconnect();
    REQUIRE(collector.get().error->getKind() == ErrorKind::CONNECTION_LOST);
    REQUIRE(session->getState() == SessionState::DISCONNECTED);
  }

  SECTION("Server hangs up") {
    promise<HotlineError> failure;
    auto failed = failure.get_future();
    session->subscribeState(
        [&failure](SessionState state, const optional<HotlineError>& error) {
          if (state == SessionState::FAILED) failure.set_value(*error);
        });
    server.closeConnection();
    REQUIRE(collector.get().error->getKind() == ErrorKind::CONNECTION_LOST);
    REQUIRE(waitFor(failed).getKind() == ErrorKind::CONNECTIVITY);
    REQUIRE(session->getState() == SessionState::FAILED);
  }

  // Requests after the fact resolve right away
  ReplyCollector late;
  session->sendTransaction(Transaction(TransactionType::GET_USER_NAME_LIST),
                           late.callback());
  REQUIRE(late.get().error->getKind() == ErrorKind::CONNECTION_LOST);
  REQUIRE(session->pendingCount() == 0);
}

TEST_CASE("Unsolicited transactions become events", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  mutex eventMutex;
  vector<ServerEvent> events;
  promise<void> allSeen;
  auto seen = allSeen.get_future();
  auto collect = [&](const ServerEvent& event) {
    lock_guard<mutex> guard(eventMutex);
    events.push_back(event);
    if (events.size() == 5) {
      allSeen.set_value();
    }
  };
  for (auto type : {ServerEventType::CHAT, ServerEventType::PRIVATE_MESSAGE,
                    ServerEventType::BROADCAST, ServerEventType::USER_CHANGED,
                    ServerEventType::USER_LEFT}) {
    session->subscribe(type, collect);
  }
  // Nobody listens for board updates, the event is dropped
  Transaction board(TransactionType::NEW_MESSAGE);
  board.addString(FieldType::DATA, "new post");
  server.send(board);

  Transaction chat(TransactionType::CHAT_MESSAGE);
  chat.addString(FieldType::DATA, "\r     Bob:  hi all");
  server.send(chat);

  Transaction privateMessage(TransactionType::SERVER_MESSAGE);
  privateMessage.addUInt16(FieldType::USER_ID, 7);
  privateMessage.addString(FieldType::USER_NAME, "Alice");
  privateMessage.addString(FieldType::DATA, "psst");
  server.send(privateMessage);

  Transaction broadcast(TransactionType::SERVER_MESSAGE);
  broadcast.addString(FieldType::DATA, "Server going down");
  server.send(broadcast);

  Transaction userChange(TransactionType::NOTIFY_USER_CHANGE);
  userChange.addUInt16(FieldType::USER_ID, 9);
  userChange.addUInt16(FieldType::USER_ICON_ID, 200);
  userChange.addUInt16(FieldType::USER_FLAGS, USER_FLAG_ADMIN);
  userChange.addString(FieldType::USER_NAME, "Carol");
  server.send(userChange);

  Transaction userLeft(TransactionType::NOTIFY_USER_DELETE);
  userLeft.addUInt16(FieldType::USER_ID, 9);
  server.send(userLeft);

  REQUIRE(seen.wait_for(std::chrono::seconds(10)) == pendingstatus::ready);
  lock_guard<mutex> guard(eventMutex);
  REQUIRE(events.size() == 5);
  REQUIRE(events[0].type == ServerEventType::CHAT);
  REQUIRE(events[0].text == "\r     Bob:  hi all");
  REQUIRE(events[1].type == ServerEventType::PRIVATE_MESSAGE);
  REQUIRE(events[1].user.id == 7);
  REQUIRE(events[1].user.name == "Alice");
  REQUIRE(events[1].text == "psst");
  REQUIRE(events[2].type == ServerEventType::BROADCAST);
  REQUIRE(events[2].text == "Server going down");
  REQUIRE(events[3].type == ServerEventType::USER_CHANGED);
  REQUIRE(events[3].user.name == "Carol");
  REQUIRE(events[3].user.iconId == 200);
  REQUIRE(events[3].user.isAdmin());
  REQUIRE(events[4].type == ServerEventType::USER_LEFT);
  REQUIRE(events[4].user.id == 9);
}

TEST_CASE("Access pushes replace the permissions", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);
  REQUIRE(isAllowed(session->getPermissions(), Capability::UPLOAD_FILE));

  promise<PermissionMask> changed;
  auto result = changed.get_future();
  session->subscribe(ServerEventType::PERMISSIONS_CHANGED,
                     [&changed](const ServerEvent& event) {
                       changed.set_value(event.permissions);
                     });

  PermissionMask reduced = permissionMaskOf({Capability::DOWNLOAD_FILE});
  Transaction access(TransactionType::USER_ACCESS);
  access.addField(FieldType::USER_ACCESS, permissionMaskToWire(reduced));
  server.send(access);

  REQUIRE(waitFor(result) == reduced);
  REQUIRE(session->getPermissions() == reduced);
  REQUIRE(errorKindOf([&] {
            session->requireCapability(Capability::UPLOAD_FILE);
          }) == ErrorKind::PERMISSION_DENIED_LOCAL);
  session->requireCapability(Capability::DOWNLOAD_FILE);
}

TEST_CASE("Agreement is shown and accepted", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  promise<ServerEvent> shown;
  auto result = shown.get_future();
  session->subscribe(ServerEventType::AGREEMENT,
                     [&shown](const ServerEvent& event) {
                       shown.set_value(event);
                     });
  Transaction agreement(TransactionType::SHOW_AGREEMENT);
  agreement.addString(FieldType::SERVER_AGREEMENT, "Be nice.");
  server.send(agreement);

  ServerEvent event = waitFor(result);
  REQUIRE(event.hasAgreement);
  REQUIRE(event.text == "Be nice.");
  REQUIRE(*session->getAgreementText() == "Be nice.");
  REQUIRE_FALSE(session->isAgreementAccepted());

  ReplyCollector collector;
  session->acceptAgreement(collector.callback());
  Transaction agreed = server.expectTransaction(TransactionType::AGREED);
  REQUIRE(*agreed.getString(FieldType::USER_NAME) == "unnamed");
  REQUIRE(*agreed.getInteger(FieldType::USER_ICON_ID) == HOTLINE_DEFAULT_ICON);
  server.send(Transaction::replyTo(agreed));
  REQUIRE(collector.get().ok());
  REQUIRE(session->isAgreementAccepted());
}

TEST_CASE("Pushes pipelined behind the login reply", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = make_shared<ClientSession>(handler);
  PermissionMask granted = permissionMaskOf({Capability::DOWNLOAD_FILE});

  SECTION("Agreement accepted from its handler") {
    ReplyCollector collector;
    session->subscribe(ServerEventType::AGREEMENT,
                       [&session, &collector](const ServerEvent& event) {
                         session->acceptAgreement(collector.callback());
                       });
    auto script = std::async(std::launch::async, [&server, granted] {
      server.acceptHandshake();
      Transaction login = server.expectTransaction(TransactionType::LOGIN);
      Transaction agreement(TransactionType::SHOW_AGREEMENT);
      agreement.addString(FieldType::DATA, "No warez.");
      server.sendTogether(
          {FakeHotlineServer::loginReply(login, granted), agreement});
      Transaction agreed = server.expectTransaction(TransactionType::AGREED);
      server.send(Transaction::replyTo(agreed));
    });
    session->connect(SocketEndpoint("fake.example", 5500), Credentials());
    waitFor(script);
    REQUIRE(collector.get().ok());
    REQUIRE(session->isAgreementAccepted());
  }

  SECTION("Access only arrives as a push") {
    auto script = std::async(std::launch::async, [&server, granted] {
      server.acceptHandshake();
      Transaction login = server.expectTransaction(TransactionType::LOGIN);
      server.send(FakeHotlineServer::loginReply(login, nullopt));
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      server.send(FakeHotlineServer::accessPush(granted));
    });
    session->connect(SocketEndpoint("fake.example", 5500), Credentials());
    waitFor(script);
    REQUIRE(session->getPermissions() == granted);
    session->requireCapability(Capability::DOWNLOAD_FILE);
  }

  SECTION("Access push in the same write as the reply") {
    auto script = std::async(std::launch::async, [&server, granted] {
      server.acceptHandshake();
      Transaction login = server.expectTransaction(TransactionType::LOGIN);
      server.sendTogether({FakeHotlineServer::loginReply(login, nullopt),
                           FakeHotlineServer::accessPush(granted)});
    });
    session->connect(SocketEndpoint("fake.example", 5500), Credentials());
    waitFor(script);
    REQUIRE(session->getPermissions() == granted);
  }

  SECTION("Server never sends access") {
    session->setAccessTimeout(std::chrono::milliseconds(100));
    auto script = std::async(std::launch::async, [&server] {
      server.acceptHandshake();
      Transaction login = server.expectTransaction(TransactionType::LOGIN);
      server.send(FakeHotlineServer::loginReply(login, nullopt));
    });
    session->connect(SocketEndpoint("fake.example", 5500), Credentials());
    waitFor(script);
    REQUIRE(session->getState() == SessionState::LOGGED_IN);
    REQUIRE(session->getPermissions() == 0);
    REQUIRE(errorKindOf([&] {
              session->requireCapability(Capability::DOWNLOAD_FILE);
            }) == ErrorKind::PERMISSION_DENIED_LOCAL);
  }

  SECTION("Server hangs up before sending access") {
    auto script = std::async(std::launch::async, [&server] {
      server.acceptHandshake();
      Transaction login = server.expectTransaction(TransactionType::LOGIN);
      server.send(FakeHotlineServer::loginReply(login, nullopt));
      server.closeConnection();
    });
    REQUIRE(errorKindOf([&] {
              session->connect(SocketEndpoint("fake.example", 5500),
                               Credentials());
            }) == ErrorKind::CONNECTION_LOST);
    waitFor(script);
    REQUIRE(session->getState() == SessionState::FAILED);
  }
}

TEST_CASE("A throwing state handler does not break the login",
          "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = make_shared<ClientSession>(handler);
  session->setKeepAliveInterval(std::chrono::milliseconds(50));
  session->subscribeState(
      [](SessionState state, const optional<HotlineError>& error) {
        if (state == SessionState::LOGGED_IN) {
          throw std::runtime_error("handler failure");
        }
      });
  auto script = std::async(std::launch::async, [&server] {
    server.acceptLogin(ALL_PERMISSIONS);
  });
  session->connect(SocketEndpoint("fake.example", 5500), Credentials());
  waitFor(script);
  REQUIRE(session->getState() == SessionState::LOGGED_IN);
  // The keepalive thread was started all the same
  server.expectTransaction(TransactionType::KEEP_ALIVE);
}

TEST_CASE("The server ends the session", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  promise<string> message;
  auto messageResult = message.get_future();
  session->subscribe(ServerEventType::DISCONNECT_MESSAGE,
                     [&message](const ServerEvent& event) {
                       message.set_value(event.text);
                     });
  promise<HotlineError> failure;
  auto failed = failure.get_future();
  session->subscribeState(
      [&failure](SessionState state, const optional<HotlineError>& error) {
        if (state == SessionState::FAILED) failure.set_value(*error);
      });

  Transaction goodbye(TransactionType::DISCONNECT_MESSAGE);
  goodbye.addString(FieldType::DATA, "You have been kicked.");
  server.send(goodbye);

  REQUIRE(waitFor(messageResult) == "You have been kicked.");
  REQUIRE(waitFor(failed).getKind() == ErrorKind::CONNECTION_LOST);
}

TEST_CASE("A malformed frame fails the session", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  promise<HotlineError> failure;
  auto failed = failure.get_future();
  session->subscribeState(
      [&failure](SessionState state, const optional<HotlineError>& error) {
        if (state == SessionState::FAILED) failure.set_value(*error);
      });

  // Reply flag of 2
  MessageWriter header;
  header.writePrimitive<uint8_t>(0);
  header.writePrimitive<uint8_t>(2);
  header.writePrimitive<uint16_t>(uint16_t(TransactionType::CHAT_MESSAGE));
  header.writePrimitive<uint32_t>(1);
  header.writePrimitive<uint32_t>(0);
  header.writePrimitive<uint32_t>(0);
  header.writePrimitive<uint32_t>(0);
  handler->writeString(server.getFd(), header.finish(), true);

  REQUIRE(waitFor(failed).getKind() == ErrorKind::PROTOCOL);
  REQUIRE(session->getState() == SessionState::FAILED);
}

TEST_CASE("User list and keepalive", "[ClientSession]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);

  SECTION("User list") {
    auto session = connectSession(handler, &server);
    promise<vector<UserEntry>> listed;
    auto result = listed.get_future();
    session->getUserList(
        [&listed](const vector<UserEntry>& users,
                  const optional<HotlineError>& error) {
          listed.set_value(users);
        });
    Transaction request =
        server.expectTransaction(TransactionType::GET_USER_NAME_LIST);
    Transaction reply = Transaction::replyTo(request);
    for (auto name : {"Alice", "Bob"}) {
      MessageWriter writer;
      writer.writePrimitive<uint16_t>(name[0] == 'A' ? 1 : 2);
      writer.writePrimitive<uint16_t>(414);
      writer.writePrimitive<uint16_t>(name[0] == 'A' ? USER_FLAG_AWAY : 0);
      writer.writePrimitive<uint16_t>(uint16_t(strlen(name)));
      writer.writeBytes(name);
      reply.addField(FieldType::USER_NAME_WITH_INFO, writer.finish());
    }
    server.send(reply);

    vector<UserEntry> users = waitFor(result);
    REQUIRE(users.size() == 2);
    REQUIRE(users[0].name == "Alice");
    REQUIRE(users[0].isAway());
    REQUIRE(users[1].id == 2);
    REQUIRE_FALSE(users[1].isAway());
  }

  SECTION("Keepalive on a modern server") {
    auto session = make_shared<ClientSession>(handler);
    session->setKeepAliveInterval(std::chrono::milliseconds(50));
    auto script = std::async(std::launch::async, [&server] {
      server.acceptLogin(ALL_PERMISSIONS, "Modern", 190);
    });
    session->connect(SocketEndpoint("fake.example", 5500), Credentials());
    waitFor(script);
    Transaction keepAlive = server.expectTransaction(TransactionType::KEEP_ALIVE);
    REQUIRE_FALSE(keepAlive.isReply());
  }
}
