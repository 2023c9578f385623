#include "ThreadedContentStore.hpp"

namespace hl {
ThreadedContentStore::ThreadedContentStore(shared_ptr<ContentSource> _source)
    : source(_source),
      lifetime(make_shared<CompletionGuard>()),
      nextLocalId(1) {}

ThreadedContentStore::~ThreadedContentStore() { lifetime->release(); }

void ThreadedContentStore::listChildren(const vector<string>& path,
                                        ChildrenCallback callback) {
  auto guard = lifetime;
  source->fetchChildren(path, [this, guard, path, callback](
                                  const vector<ContentNode>& fetched,
                                  const optional<HotlineError>& error) {
    bool delivered = guard->runIfAlive([&] {
      if (error) {
        callback({}, error);
        return;
      }
      replaceChildren(path, fetched);
      callback(getChildren(path), nullopt);
    });
    if (!delivered) {
      VLOG(1) << "Dropping listing of " << joinRemotePath(path)
              << " for a closed store";
    }
  });
}

void ThreadedContentStore::replaceChildren(const vector<string>& path,
                                           vector<ContentNode> fetched) {
  lock_guard<recursive_mutex> guard(storeMutex);
  auto old = children.find(path);
  if (old != children.end()) {
    for (auto id : old->second) {
      nodes.erase(id);
    }
  }
  map<uint32_t, uint64_t> localIdOfRemote;
  vector<uint64_t> ids;
  for (auto& node : fetched) {
    node.localId = nextLocalId++;
    if (node.remoteId) {
      localIdOfRemote[node.remoteId] = node.localId;
    }
    ids.push_back(node.localId);
  }
  for (auto& node : fetched) {
    node.parentId.reset();
    if (node.remoteParentId) {
      auto it = localIdOfRemote.find(node.remoteParentId);
      if (it != localIdOfRemote.end()) {
        node.parentId = it->second;
      } else {
        LOG(INFO) << "Article " << node.remoteId << " has parent "
                  << node.remoteParentId << " outside of "
                  << joinRemotePath(path);
      }
    }
    nodes[node.localId] = node;
  }
  children[path] = ids;
  loadedPaths.insert(path);
  VLOG(1) << "Loaded " << ids.size() << " nodes under "
          << joinRemotePath(path);
}

ContentNode ThreadedContentStore::snapshot(const ContentNode& node) {
  ContentNode copy = node;
  if (node.path.empty() || !node.remoteId) {
    // Categories list their children under their own path
    copy.loaded = !node.hasChildren ||
                  loadedPaths.find(node.path) != loadedPaths.end();
  } else {
    // Replies to an article arrive with the article itself
    copy.loaded = true;
  }
  return copy;
}

vector<ContentNode> ThreadedContentStore::getChildren(
    const vector<string>& path) {
  lock_guard<recursive_mutex> guard(storeMutex);
  vector<ContentNode> result;
  auto it = children.find(path);
  if (it == children.end()) {
    return result;
  }
  for (auto id : it->second) {
    result.push_back(snapshot(nodes[id]));
  }
  return result;
}

optional<ContentNode> ThreadedContentStore::getNode(uint64_t localId) {
  lock_guard<recursive_mutex> guard(storeMutex);
  auto it = nodes.find(localId);
  if (it == nodes.end()) {
    return nullopt;
  }
  return snapshot(it->second);
}

bool ThreadedContentStore::isLoaded(const vector<string>& path) {
  lock_guard<recursive_mutex> guard(storeMutex);
  return loadedPaths.find(path) != loadedPaths.end();
}

void ThreadedContentStore::fetchBody(uint64_t localId, BodyCallback callback) {
  auto node = getNode(localId);
  if (!node) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       "Unknown content node " + to_string(localId));
  }
  if (node->body) {
    callback(*node->body, nullopt);
    return;
  }
  auto guard = lifetime;
  source->fetchBody(*node, [this, guard, localId, callback](
                               const string& body,
                               const optional<HotlineError>& error) {
    bool delivered = guard->runIfAlive([&] {
      if (!error) {
        lock_guard<recursive_mutex> storeGuard(storeMutex);
        auto it = nodes.find(localId);
        if (it != nodes.end()) {
          it->second.body = body;
        }
      }
      callback(body, error);
    });
    if (!delivered) {
      VLOG(1) << "Dropping body of node " << localId << " for a closed store";
    }
  });
}

void ThreadedContentStore::post(const vector<string>& path,
                                optional<uint64_t> parentId,
                                const string& title, const string& body,
                                PostCallback callback) {
  uint32_t remoteParentId = 0;
  if (parentId) {
    auto parent = getNode(*parentId);
    if (!parent) {
      throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                         "Unknown parent node " + to_string(*parentId));
    }
    remoteParentId = parent->remoteId;
  }
  source->post(path, remoteParentId, title, body, callback);
}
}  // namespace hl
