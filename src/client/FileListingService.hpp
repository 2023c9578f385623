#ifndef __HL_FILE_LISTING_SERVICE__
#define __HL_FILE_LISTING_SERVICE__

#include "ClientSession.hpp"
#include "CompletionGuard.hpp"
#include "HotlineObjects.hpp"

namespace hl {
typedef function<void(const vector<FileEntry>&, const optional<HotlineError>&)>
    ListingCallback;
typedef function<void(const FileEntry&, const optional<HotlineError>&)>
    FileInfoCallback;

/**
 * @brief Path addressed browsing of the server's file tree.
 *
 * Every listing replaces the cached snapshot of its path.  When two
 * listings of the same path are in flight, the reply of the most recent
 * request wins even if it arrives first.
 *
 * Replies that arrive after the service is destroyed are dropped without
 * calling their callbacks.
 */
class FileListingService {
 public:
  explicit FileListingService(shared_ptr<ClientSession> _session);
  virtual ~FileListingService();

  void listFiles(const vector<string>& path, ListingCallback callback);
  /** @brief Last snapshot of `path`, if it was ever listed. */
  optional<vector<FileEntry>> getSnapshot(const vector<string>& path);

  void getFileInfo(const vector<string>& path, const string& name,
                   FileInfoCallback callback);

  /** @throws HotlineError PERMISSION_DENIED_LOCAL */
  void deleteFile(const vector<string>& path, const string& name,
                  bool isFolder, ReplyCallback callback);
  /** @throws HotlineError PERMISSION_DENIED_LOCAL */
  void newFolder(const vector<string>& path, const string& name,
                 ReplyCallback callback);
  /** @throws HotlineError PERMISSION_DENIED_LOCAL */
  void renameFile(const vector<string>& path, const string& name,
                  const string& newName, bool isFolder,
                  ReplyCallback callback);
  /** @throws HotlineError PERMISSION_DENIED_LOCAL */
  void setComment(const vector<string>& path, const string& name,
                  const string& comment, ReplyCallback callback);

 protected:
  void storeListing(const vector<string>& path, uint64_t sequence,
                    const Reply& reply, const ListingCallback& callback);

  shared_ptr<ClientSession> session;
  shared_ptr<CompletionGuard> lifetime;

  mutex snapshotMutex;
  map<vector<string>, vector<FileEntry>> snapshots;
  /** @brief Sequence of the request whose reply filled each snapshot. */
  map<vector<string>, uint64_t> snapshotSequence;
  uint64_t nextSequence;
};
}  // namespace hl

#endif  // __HL_FILE_LISTING_SERVICE__
