#include "ContentSource.hpp"

namespace hl {
namespace {
const char* TEXT_FLAVOR = "text/plain";

// First line of a board post, used as its title
string postTitle(const string& post) {
  string line = post.substr(0, post.find('\n'));
  if (line.length() > 80) {
    line = line.substr(0, 77) + "...";
  }
  return line;
}
}  // namespace

NewsContentSource::NewsContentSource(shared_ptr<ClientSession> _session)
    : session(_session), lifetime(make_shared<CompletionGuard>()) {}

NewsContentSource::~NewsContentSource() { lifetime->release(); }

bool NewsContentSource::isBundle(const vector<string>& path) {
  lock_guard<mutex> guard(bundleMutex);
  return bundlePaths.find(path) != bundlePaths.end();
}

void NewsContentSource::fetchChildren(const vector<string>& path,
                                      ChildrenCallback callback) {
  if (path.empty() || isBundle(path)) {
    fetchCategories(path, callback);
  } else {
    fetchArticles(path, callback);
  }
}

void NewsContentSource::fetchCategories(const vector<string>& path,
                                        ChildrenCallback callback) {
  Transaction request(TransactionType::GET_NEWS_CAT_NAME_LIST);
  request.addPath(FieldType::NEWS_PATH, path);
  auto guard = lifetime;
  session->sendGatedTransaction(
      Capability::NEWS_READ_ARTICLE, request,
      [this, guard, path, callback](const Reply& reply) {
        bool delivered = guard->runIfAlive(
            [&] { storeCategories(path, reply, callback); });
        if (!delivered) {
          VLOG(1) << "Dropping news categories of " << joinRemotePath(path);
        }
      });
}

void NewsContentSource::storeCategories(const vector<string>& path,
                                        const Reply& reply,
                                        const ChildrenCallback& callback) {
  if (!reply.ok()) {
    callback({}, reply.error);
    return;
  }
  vector<ContentNode> nodes;
  try {
    for (auto field :
         reply.transaction.getFieldsOfType(FieldType::NEWS_CAT_LIST_DATA_15)) {
      NewsCategoryEntry category = parseNewsCategory(field->data);
      ContentNode node;
      node.title = category.name;
      node.path = path;
      node.path.push_back(category.name);
      node.hasChildren = true;
      if (category.type == NewsCategoryType::BUNDLE) {
        lock_guard<mutex> guard(bundleMutex);
        bundlePaths.insert(node.path);
      }
      nodes.push_back(node);
    }
  } catch (const std::runtime_error& re) {
    callback({}, HotlineError(ErrorKind::PROTOCOL,
                              string("Bad news category list: ") + re.what()));
    return;
  }
  callback(nodes, nullopt);
}

void NewsContentSource::fetchArticles(const vector<string>& path,
                                      ChildrenCallback callback) {
  Transaction request(TransactionType::GET_NEWS_ART_NAME_LIST);
  request.addPath(FieldType::NEWS_PATH, path);
  session->sendGatedTransaction(
      Capability::NEWS_READ_ARTICLE, request,
      [path, callback](const Reply& reply) {
        if (!reply.ok()) {
          callback({}, reply.error);
          return;
        }
        vector<NewsArticleEntry> articles;
        auto data = reply.transaction.getString(FieldType::NEWS_ART_LIST_DATA);
        if (data) {
          try {
            articles = parseNewsArticleList(*data);
          } catch (const std::runtime_error& re) {
            callback({}, HotlineError(ErrorKind::PROTOCOL,
                                      string("Bad news article list: ") +
                                          re.what()));
            return;
          }
        }
        set<uint32_t> parents;
        for (const auto& article : articles) {
          if (article.parentId) parents.insert(article.parentId);
        }
        vector<ContentNode> nodes;
        for (const auto& article : articles) {
          ContentNode node;
          node.title = article.title;
          node.author = article.poster;
          node.path = path;
          node.remoteId = article.id;
          node.remoteParentId = article.parentId;
          node.date = article.date;
          node.hasChildren = parents.count(article.id) > 0;
          nodes.push_back(node);
        }
        callback(nodes, nullopt);
      });
}

void NewsContentSource::fetchBody(const ContentNode& node,
                                  BodyCallback callback) {
  Transaction request(TransactionType::GET_NEWS_ART_DATA);
  request.addPath(FieldType::NEWS_PATH, node.path);
  request.addUInt32(FieldType::NEWS_ART_ID, node.remoteId);
  request.addString(FieldType::NEWS_ART_DATA_FLAVOR, TEXT_FLAVOR);
  session->sendGatedTransaction(
      Capability::NEWS_READ_ARTICLE, request, [callback](const Reply& reply) {
        if (!reply.ok()) {
          callback("", reply.error);
          return;
        }
        callback(reply.transaction.getString(FieldType::NEWS_ART_DATA)
                     .value_or(""),
                 nullopt);
      });
}

void NewsContentSource::post(const vector<string>& path,
                             uint32_t remoteParentId, const string& title,
                             const string& body, PostCallback callback) {
  if (path.empty()) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       "News articles are posted into a category");
  }
  Transaction request(TransactionType::POST_NEWS_ART);
  request.addPath(FieldType::NEWS_PATH, path);
  request.addUInt32(FieldType::NEWS_ART_ID, remoteParentId);
  request.addString(FieldType::NEWS_ART_TITLE, title);
  request.addString(FieldType::NEWS_ART_DATA_FLAVOR, TEXT_FLAVOR);
  request.addUInt32(FieldType::NEWS_ART_FLAGS, 0);
  request.addString(FieldType::NEWS_ART_DATA, body);
  session->sendGatedTransaction(
      Capability::NEWS_POST_ARTICLE, request,
      [callback](const Reply& reply) { callback(reply.error); });
}

MessageBoardContentSource::MessageBoardContentSource(
    shared_ptr<ClientSession> _session)
    : session(_session) {}

void MessageBoardContentSource::fetchChildren(const vector<string>& path,
                                              ChildrenCallback callback) {
  if (!path.empty()) {
    // The board has no folders
    callback({}, nullopt);
    return;
  }
  session->sendGatedTransaction(
      BOARD_READ_CAPABILITY, Transaction(TransactionType::GET_MESSAGES),
      [callback](const Reply& reply) {
        if (!reply.ok()) {
          callback({}, reply.error);
          return;
        }
        string text = reply.transaction.getString(FieldType::DATA).value_or("");
        vector<ContentNode> nodes;
        for (const auto& post : splitMessageBoard(text)) {
          ContentNode node;
          node.title = postTitle(post);
          node.body = post;
          nodes.push_back(node);
        }
        callback(nodes, nullopt);
      });
}

void MessageBoardContentSource::fetchBody(const ContentNode& node,
                                          BodyCallback callback) {
  if (node.body) {
    callback(*node.body, nullopt);
  } else {
    callback("", HotlineError(ErrorKind::INVALID_ARGUMENT,
                              "Board post has no content"));
  }
}

void MessageBoardContentSource::post(const vector<string>&, uint32_t,
                                     const string& title, const string& body,
                                     PostCallback callback) {
  Transaction request(TransactionType::OLD_POST_NEWS);
  request.addString(FieldType::DATA,
                    title.empty() ? body : title + "\r" + body);
  session->sendGatedTransaction(
      BOARD_POST_CAPABILITY, request,
      [callback](const Reply& reply) { callback(reply.error); });
}
}  // namespace hl
