#ifndef __HL_THREADED_CONTENT_STORE__
#define __HL_THREADED_CONTENT_STORE__

#include "ContentSource.hpp"

namespace hl {
/**
 * @brief Lazily populated parent/child tree shared by news and the message
 * board.
 *
 * The store is the only writer of its nodes; callers receive copies.  A
 * listing of a path replaces whatever was cached for it, keeps the order
 * the server sent and marks the path loaded.  Bodies are only fetched for
 * the node that is asked for.  Replies that arrive after the store is
 * destroyed are dropped.
 */
class ThreadedContentStore {
 public:
  explicit ThreadedContentStore(shared_ptr<ContentSource> _source);
  virtual ~ThreadedContentStore();

  /** @throws HotlineError PERMISSION_DENIED_LOCAL */
  void listChildren(const vector<string>& path, ChildrenCallback callback);

  /**
   * @brief Delivers the content of a node, from the cache when it is
   * already known.
   * @throws HotlineError INVALID_ARGUMENT for an unknown node.
   */
  void fetchBody(uint64_t localId, BodyCallback callback);

  /**
   * @brief Posts below `parentId` (a new thread when absent) inside
   * `path`.  The tree is not touched; list the path again to see the
   * new node.
   * @throws HotlineError PERMISSION_DENIED_LOCAL or INVALID_ARGUMENT.
   */
  void post(const vector<string>& path, optional<uint64_t> parentId,
            const string& title, const string& body, PostCallback callback);

  /** @brief Cached children of `path` in server order. */
  vector<ContentNode> getChildren(const vector<string>& path);
  optional<ContentNode> getNode(uint64_t localId);
  bool isLoaded(const vector<string>& path);

 protected:
  void replaceChildren(const vector<string>& path, vector<ContentNode> nodes);
  ContentNode snapshot(const ContentNode& node);

  shared_ptr<ContentSource> source;
  shared_ptr<CompletionGuard> lifetime;

  recursive_mutex storeMutex;
  uint64_t nextLocalId;
  map<uint64_t, ContentNode> nodes;
  map<vector<string>, vector<uint64_t>> children;
  set<vector<string>> loadedPaths;
};
}  // namespace hl

#endif  // __HL_THREADED_CONTENT_STORE__
