#ifndef __HL_CONTENT_SOURCE__
#define __HL_CONTENT_SOURCE__

#include "ClientSession.hpp"
#include "CompletionGuard.hpp"

namespace hl {
/**
 * @brief One node of a threaded content tree (news category, news article
 * or message board post).
 */
struct ContentNode {
  /** @brief Store assigned, unique for the life of the store. */
  uint64_t localId = 0;
  /** @brief Absent for the roots of a listing. */
  optional<uint64_t> parentId;
  string title;
  string author;
  /** @brief Path the node was listed under; for categories, their own
   * path (the one that lists their children). */
  vector<string> path;
  bool hasChildren = false;
  /** @brief Whether the children of this node have been listed. */
  bool loaded = false;

  /** @brief Server identifier (article id), 0 when the server has none. */
  uint32_t remoteId = 0;
  /** @brief Server identifier of the parent article, 0 for none. */
  uint32_t remoteParentId = 0;
  time_t date = 0;
  /** @brief Set when the listing already carried the content. */
  optional<string> body;
};

typedef function<void(const vector<ContentNode>&, const optional<HotlineError>&)>
    ChildrenCallback;
typedef function<void(const string&, const optional<HotlineError>&)>
    BodyCallback;
typedef function<void(const optional<HotlineError>&)> PostCallback;

/**
 * @brief Server side of a threaded content tree.  The store owns the tree
 * and asks a source for listings, bodies and posts.
 *
 * Sources report nodes with `localId` 0 and parents expressed through
 * `remoteParentId`; the store does the mapping.  Gated operations throw
 * HotlineError PERMISSION_DENIED_LOCAL before sending anything.
 */
class ContentSource {
 public:
  virtual ~ContentSource() {}

  virtual void fetchChildren(const vector<string>& path,
                             ChildrenCallback callback) = 0;
  virtual void fetchBody(const ContentNode& node, BodyCallback callback) = 0;
  virtual void post(const vector<string>& path, uint32_t remoteParentId,
                    const string& title, const string& body,
                    PostCallback callback) = 0;
};

/**
 * @brief Threaded news: the root and bundles are listed with
 * GetNewsCatNameList, every other path is taken for a category and its
 * articles are listed with GetNewsArtNameList.
 */
class NewsContentSource : public ContentSource {
 public:
  explicit NewsContentSource(shared_ptr<ClientSession> _session);
  virtual ~NewsContentSource();

  virtual void fetchChildren(const vector<string>& path,
                             ChildrenCallback callback);
  virtual void fetchBody(const ContentNode& node, BodyCallback callback);
  virtual void post(const vector<string>& path, uint32_t remoteParentId,
                    const string& title, const string& body,
                    PostCallback callback);

  /** @brief Whether `path` was seen as a bundle (holding categories). */
  bool isBundle(const vector<string>& path);

 protected:
  void fetchCategories(const vector<string>& path, ChildrenCallback callback);
  void fetchArticles(const vector<string>& path, ChildrenCallback callback);
  void storeCategories(const vector<string>& path, const Reply& reply,
                       const ChildrenCallback& callback);

  shared_ptr<ClientSession> session;
  shared_ptr<CompletionGuard> lifetime;
  mutex bundleMutex;
  set<vector<string>> bundlePaths;
};

/**
 * @brief The flat message board.  One GetMessages reply carries every post;
 * each becomes a root node whose body is already loaded.
 */
class MessageBoardContentSource : public ContentSource {
 public:
  explicit MessageBoardContentSource(shared_ptr<ClientSession> _session);

  virtual void fetchChildren(const vector<string>& path,
                             ChildrenCallback callback);
  virtual void fetchBody(const ContentNode& node, BodyCallback callback);
  virtual void post(const vector<string>& path, uint32_t remoteParentId,
                    const string& title, const string& body,
                    PostCallback callback);

 protected:
  shared_ptr<ClientSession> session;
};
}  // namespace hl

#endif  // __HL_CONTENT_SOURCE__
