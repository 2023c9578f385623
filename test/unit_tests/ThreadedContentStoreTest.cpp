#include "FakeHotlineServer.hpp"
#include "ThreadedContentStore.hpp"

using namespace hl;

namespace {
// Answers synchronously from canned listings.
class ScriptedContentSource : public ContentSource {
 public:
  void fetchChildren(const vector<string>& path,
                     ChildrenCallback callback) override {
    auto it = listings.find(path);
    if (it == listings.end()) {
      callback({}, HotlineError(ErrorKind::SERVER_REJECTED, "No such path"));
      return;
    }
    callback(it->second, nullopt);
  }

  void fetchBody(const ContentNode& node, BodyCallback callback) override {
    bodyFetches++;
    callback(bodies[node.remoteId], nullopt);
  }

  void post(const vector<string>& path, uint32_t remoteParentId,
            const string& title, const string& body,
            PostCallback callback) override {
    postedParents.push_back(remoteParentId);
    callback(nullopt);
  }

  map<vector<string>, vector<ContentNode>> listings;
  map<uint32_t, string> bodies;
  int bodyFetches = 0;
  vector<uint32_t> postedParents;
};

ContentNode category(const vector<string>& path) {
  ContentNode node;
  node.title = path.back();
  node.path = path;
  node.hasChildren = true;
  return node;
}

ContentNode article(const vector<string>& path, uint32_t id, uint32_t parent,
                    const string& title) {
  ContentNode node;
  node.title = title;
  node.path = path;
  node.remoteId = id;
  node.remoteParentId = parent;
  return node;
}

vector<ContentNode> listSync(ThreadedContentStore* store,
                             const vector<string>& path) {
  vector<ContentNode> result;
  optional<HotlineError> failure;
  store->listChildren(path, [&](const vector<ContentNode>& nodes,
                                const optional<HotlineError>& error) {
    result = nodes;
    failure = error;
  });
  if (failure) {
    throw *failure;
  }
  return result;
}

string bundleRecord(const string& name, uint16_t count) {
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(uint16_t(NewsCategoryType::BUNDLE));
  writer.writePrimitive<uint16_t>(count);
  writer.writePString(name);
  return writer.finish();
}

string categoryRecord(const string& name, uint16_t count) {
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(uint16_t(NewsCategoryType::CATEGORY));
  writer.writePrimitive<uint16_t>(count);
  writer.writeZeros(24);
  writer.writePString(name);
  return writer.finish();
}

struct ArticleRecord {
  uint32_t id;
  uint32_t parent;
  string title;
  string poster;
};

string articleList(const vector<ArticleRecord>& articles) {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(0);
  writer.writePrimitive<uint32_t>(uint32_t(articles.size()));
  writer.writePString("Announcements");
  writer.writePString("");
  for (const auto& a : articles) {
    writer.writePrimitive<uint32_t>(a.id);
    writer.writeBytes(encodeHotlineDate(983682367));
    writer.writePrimitive<uint32_t>(a.parent);
    writer.writePrimitive<uint32_t>(0);
    writer.writePrimitive<uint16_t>(1);
    writer.writePString(a.title);
    writer.writePString(a.poster);
    writer.writePString("text/plain");
    writer.writePrimitive<uint16_t>(10);
  }
  return writer.finish();
}

template <class T>
struct Outcome {
  promise<pair<T, optional<HotlineError>>> result;
  future<pair<T, optional<HotlineError>>> pending = result.get_future();

  function<void(const T&, const optional<HotlineError>&)> callback() {
    return [this](const T& value, const optional<HotlineError>& error) {
      result.set_value(make_pair(value, error));
    };
  }
  pair<T, optional<HotlineError>> get() { return waitFor(pending); }
};
}  // namespace

TEST_CASE("Listings build the tree", "[ThreadedContentStore]") {
  auto source = make_shared<ScriptedContentSource>();
  source->listings[vector<string>()] = {category({"General"}), category({"Off Topic"})};
  vector<string> general = {"General"};
  source->listings[general] = {
      article(general, 10, 0, "Welcome"),
      article(general, 11, 10, "Re: Welcome"),
      article(general, 12, 99, "Orphan"),
  };
  ThreadedContentStore store(source);

  REQUIRE_FALSE(store.isLoaded({}));
  REQUIRE(store.getChildren({}).empty());

  auto roots = listSync(&store, {});
  REQUIRE(store.isLoaded({}));
  REQUIRE(roots.size() == 2);
  REQUIRE(roots[0].title == "General");
  REQUIRE(roots[1].title == "Off Topic");
  REQUIRE(roots[0].hasChildren);
  REQUIRE_FALSE(roots[0].loaded);
  REQUIRE(roots[0].localId != roots[1].localId);
  REQUIRE_FALSE(roots[0].parentId);

  auto articles = listSync(&store, general);
  REQUIRE(articles.size() == 3);
  REQUIRE(articles[0].title == "Welcome");
  REQUIRE_FALSE(articles[0].parentId);
  REQUIRE(*articles[1].parentId == articles[0].localId);
  // Parent not in this listing
  REQUIRE_FALSE(articles[2].parentId);

  // The category now reports its children as loaded
  REQUIRE(store.getNode(roots[0].localId)->loaded);
  REQUIRE_FALSE(store.getNode(roots[1].localId)->loaded);

  SECTION("Listing again replaces the children") {
    source->listings[general] = {article(general, 13, 0, "Fresh")};
    auto relisted = listSync(&store, general);
    REQUIRE(relisted.size() == 1);
    REQUIRE(relisted[0].title == "Fresh");
    REQUIRE_FALSE(store.getNode(articles[0].localId));
    REQUIRE(store.getChildren(general).size() == 1);
    // Other paths are untouched
    REQUIRE(store.getChildren({}).size() == 2);
  }

  SECTION("A failed listing keeps the cache") {
    try {
      listSync(&store, {"Off Topic"});
      FAIL("Listing should fail");
    } catch (const HotlineError& e) {
      REQUIRE(e.getKind() == ErrorKind::SERVER_REJECTED);
    }
    REQUIRE_FALSE(store.isLoaded({"Off Topic"}));
    REQUIRE(store.getChildren(general).size() == 3);
  }
}

TEST_CASE("Bodies are fetched once", "[ThreadedContentStore]") {
  auto source = make_shared<ScriptedContentSource>();
  vector<string> general = {"General"};
  source->listings[general] = {article(general, 10, 0, "Welcome")};
  source->bodies[10] = "Hello and welcome.";
  ThreadedContentStore store(source);
  auto articles = listSync(&store, general);

  for (int a = 0; a < 2; a++) {
    string body;
    store.fetchBody(articles[0].localId,
                    [&body](const string& text,
                            const optional<HotlineError>& error) {
                      body = text;
                    });
    REQUIRE(body == "Hello and welcome.");
  }
  REQUIRE(source->bodyFetches == 1);
  REQUIRE(*store.getNode(articles[0].localId)->body == "Hello and welcome.");

  REQUIRE_THROWS_AS(store.fetchBody(12345, [](const string&,
                                              const optional<HotlineError>&) {}),
                    HotlineError);
}

TEST_CASE("Posting maps local parents", "[ThreadedContentStore]") {
  auto source = make_shared<ScriptedContentSource>();
  vector<string> general = {"General"};
  source->listings[general] = {article(general, 10, 0, "Welcome")};
  ThreadedContentStore store(source);
  auto articles = listSync(&store, general);

  auto done = [](const optional<HotlineError>&) {};
  store.post(general, nullopt, "New thread", "Body", done);
  store.post(general, articles[0].localId, "Re: Welcome", "Body", done);
  REQUIRE(source->postedParents == vector<uint32_t>({0, 10}));

  try {
    store.post(general, uint64_t(777), "Reply", "Body", done);
    FAIL("Unknown parent accepted");
  } catch (const HotlineError& e) {
    REQUIRE(e.getKind() == ErrorKind::INVALID_ARGUMENT);
  }
  // Posting leaves the tree alone
  REQUIRE(store.getChildren(general).size() == 1);
}

TEST_CASE("Threaded news over the wire", "[ThreadedContentStore]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);
  auto source = make_shared<NewsContentSource>(session);
  ThreadedContentStore store(source);

  Outcome<vector<ContentNode>> roots;
  store.listChildren({}, roots.callback());
  Transaction request =
      server.expectTransaction(TransactionType::GET_NEWS_CAT_NAME_LIST);
  REQUIRE_FALSE(request.hasField(FieldType::NEWS_PATH));
  Transaction reply = Transaction::replyTo(request);
  reply.addField(FieldType::NEWS_CAT_LIST_DATA_15, bundleRecord("Archive", 4));
  reply.addField(FieldType::NEWS_CAT_LIST_DATA_15,
                 categoryRecord("Announcements", 2));
  server.send(reply);

  auto rootNodes = roots.get();
  REQUIRE_FALSE(rootNodes.second);
  REQUIRE(rootNodes.first.size() == 2);
  REQUIRE(rootNodes.first[0].title == "Archive");
  REQUIRE(rootNodes.first[1].path == vector<string>({"Announcements"}));
  REQUIRE(source->isBundle({"Archive"}));
  REQUIRE_FALSE(source->isBundle({"Announcements"}));

  // A bundle lists categories
  Outcome<vector<ContentNode>> archive;
  store.listChildren({"Archive"}, archive.callback());
  request = server.expectTransaction(TransactionType::GET_NEWS_CAT_NAME_LIST);
  REQUIRE(decodeFilePath(*request.getString(FieldType::NEWS_PATH)) ==
          vector<string>({"Archive"}));
  reply = Transaction::replyTo(request);
  reply.addField(FieldType::NEWS_CAT_LIST_DATA_15, categoryRecord("1999", 7));
  server.send(reply);
  auto archiveNodes = archive.get();
  REQUIRE(archiveNodes.first.size() == 1);
  REQUIRE(archiveNodes.first[0].path == vector<string>({"Archive", "1999"}));

  // A category lists articles
  Outcome<vector<ContentNode>> articles;
  store.listChildren({"Announcements"}, articles.callback());
  request = server.expectTransaction(TransactionType::GET_NEWS_ART_NAME_LIST);
  REQUIRE(decodeFilePath(*request.getString(FieldType::NEWS_PATH)) ==
          vector<string>({"Announcements"}));
  reply = Transaction::replyTo(request);
  reply.addField(FieldType::NEWS_ART_LIST_DATA,
                 articleList({{1, 0, "Server moved", "admin"},
                              {2, 1, "Re: Server moved", "guest"}}));
  server.send(reply);

  auto articleNodes = articles.get();
  REQUIRE(articleNodes.first.size() == 2);
  REQUIRE(articleNodes.first[0].author == "admin");
  REQUIRE(articleNodes.first[0].hasChildren);
  REQUIRE(articleNodes.first[0].date == 983682367);
  REQUIRE(*articleNodes.first[1].parentId == articleNodes.first[0].localId);
  REQUIRE_FALSE(articleNodes.first[1].hasChildren);

  // Article body
  Outcome<string> body;
  store.fetchBody(articleNodes.first[0].localId, body.callback());
  request = server.expectTransaction(TransactionType::GET_NEWS_ART_DATA);
  REQUIRE(*request.getInteger(FieldType::NEWS_ART_ID) == 1);
  REQUIRE(*request.getString(FieldType::NEWS_ART_DATA_FLAVOR) == "text/plain");
  reply = Transaction::replyTo(request);
  reply.addString(FieldType::NEWS_ART_DATA, "We moved to a new host.");
  server.send(reply);
  REQUIRE(body.get().first == "We moved to a new host.");

  // Reply to the article
  promise<optional<HotlineError>> posted;
  auto postResult = posted.get_future();
  store.post({"Announcements"}, articleNodes.first[0].localId, "Re: Server moved",
             "Thanks!", [&posted](const optional<HotlineError>& error) {
               posted.set_value(error);
             });
  request = server.expectTransaction(TransactionType::POST_NEWS_ART);
  REQUIRE(*request.getInteger(FieldType::NEWS_ART_ID) == 1);
  REQUIRE(*request.getString(FieldType::NEWS_ART_TITLE) == "Re: Server moved");
  REQUIRE(*request.getString(FieldType::NEWS_ART_DATA) == "Thanks!");
  server.send(Transaction::replyTo(request));
  REQUIRE_FALSE(waitFor(postResult));

  // Articles live in categories
  try {
    store.post({}, nullopt, "Title", "Body",
               [](const optional<HotlineError>&) {});
    FAIL("Post at the root accepted");
  } catch (const HotlineError& e) {
    REQUIRE(e.getKind() == ErrorKind::INVALID_ARGUMENT);
  }
}

TEST_CASE("Unknown news paths are listed as categories",
          "[ThreadedContentStore]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);
  ThreadedContentStore store(make_shared<NewsContentSource>(session));

  // Nothing has been listed yet, so "General" can only be a category
  Outcome<vector<ContentNode>> articles;
  store.listChildren({"General"}, articles.callback());
  Transaction request =
      server.expectTransaction(TransactionType::GET_NEWS_ART_NAME_LIST);
  REQUIRE(decodeFilePath(*request.getString(FieldType::NEWS_PATH)) ==
          vector<string>({"General"}));
  Transaction reply = Transaction::replyTo(request);
  reply.addField(FieldType::NEWS_ART_LIST_DATA,
                 articleList({{7, 0, "Welcome", "admin"}}));
  server.send(reply);

  auto nodes = articles.get();
  REQUIRE_FALSE(nodes.second);
  REQUIRE(nodes.first.size() == 1);
  REQUIRE(nodes.first[0].title == "Welcome");
  REQUIRE(nodes.first[0].remoteId == 7);
  REQUIRE(store.isLoaded({"General"}));
}

TEST_CASE("Replies for a closed store are dropped", "[ThreadedContentStore]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);

  atomic<bool> called(false);
  {
    ThreadedContentStore store(make_shared<NewsContentSource>(session));
    store.listChildren({}, [&called](const vector<ContentNode>&,
                                     const optional<HotlineError>&) {
      called = true;
    });
  }
  Transaction request =
      server.expectTransaction(TransactionType::GET_NEWS_CAT_NAME_LIST);
  Transaction reply = Transaction::replyTo(request);
  reply.addField(FieldType::NEWS_CAT_LIST_DATA_15, bundleRecord("Archive", 4));
  server.send(reply);

  promise<void> listed;
  auto result = listed.get_future();
  session->getUserList(
      [&listed](const vector<UserEntry>&, const optional<HotlineError>&) {
        listed.set_value();
      });
  server.send(Transaction::replyTo(
      server.expectTransaction(TransactionType::GET_USER_NAME_LIST)));
  waitFor(result);
  REQUIRE_FALSE(called);
}

TEST_CASE("News needs the news bits", "[ThreadedContentStore]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(
      handler, &server, permissionMaskOf({Capability::NEWS_READ_ARTICLE}));
  ThreadedContentStore news(make_shared<NewsContentSource>(session));
  ThreadedContentStore board(make_shared<MessageBoardContentSource>(session));

  auto ignore = [](const optional<HotlineError>&) {};
  for (auto store : {&news, &board}) {
    try {
      store->post({"Announcements"}, nullopt, "Title", "Body", ignore);
      FAIL("Post without the post bit accepted");
    } catch (const HotlineError& e) {
      REQUIRE(e.getKind() == ErrorKind::PERMISSION_DENIED_LOCAL);
    }
  }
  REQUIRE(session->pendingCount() == 0);
}

TEST_CASE("The message board", "[ThreadedContentStore]") {
  auto handler = make_shared<SocketPairHandler>();
  FakeHotlineServer server(handler);
  auto session = connectSession(handler, &server);
  ThreadedContentStore store(make_shared<MessageBoardContentSource>(session));

  Outcome<vector<ContentNode>> posts;
  store.listChildren({}, posts.callback());
  Transaction request = server.expectTransaction(TransactionType::GET_MESSAGES);
  Transaction reply = Transaction::replyTo(request);
  reply.addString(FieldType::DATA,
                  "Selling my Quadra\rcall me\r__________________\r"
                  "Anyone here?\r__________________\r");
  server.send(reply);

  auto nodes = posts.get();
  REQUIRE_FALSE(nodes.second);
  REQUIRE(nodes.first.size() == 2);
  REQUIRE(nodes.first[0].title == "Selling my Quadra");
  REQUIRE(*nodes.first[0].body == "Selling my Quadra\ncall me");
  REQUIRE(nodes.first[1].title == "Anyone here?");

  // Bodies come with the listing, nothing is sent
  string body;
  store.fetchBody(nodes.first[1].localId,
                  [&body](const string& text,
                          const optional<HotlineError>& error) {
                    body = text;
                  });
  REQUIRE(body == "Anyone here?");

  promise<optional<HotlineError>> posted;
  auto postResult = posted.get_future();
  store.post({}, nullopt, "For sale", "Two SE/30s",
             [&posted](const optional<HotlineError>& error) {
               posted.set_value(error);
             });
  request = server.expectTransaction(TransactionType::OLD_POST_NEWS);
  REQUIRE(*request.getString(FieldType::DATA) == "For sale\rTwo SE/30s");
  server.sendError(request, "You are not allowed to post.");
  auto error = waitFor(postResult);
  REQUIRE(error);
  REQUIRE(error->getKind() == ErrorKind::PERMISSION_DENIED_REMOTE);
}
