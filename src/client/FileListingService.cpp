#include "FileListingService.hpp"

namespace hl {
FileListingService::FileListingService(shared_ptr<ClientSession> _session)
    : session(_session),
      lifetime(make_shared<CompletionGuard>()),
      nextSequence(1) {}

FileListingService::~FileListingService() { lifetime->release(); }

void FileListingService::listFiles(const vector<string>& path,
                                   ListingCallback callback) {
  uint64_t sequence;
  {
    lock_guard<mutex> guard(snapshotMutex);
    sequence = nextSequence++;
  }
  Transaction request(TransactionType::GET_FILE_NAME_LIST);
  request.addPath(FieldType::FILE_PATH, path);
  VLOG(1) << "Listing " << joinRemotePath(path);
  auto guard = lifetime;
  session->sendTransaction(request, [this, guard, path, sequence,
                                     callback](const Reply& reply) {
    bool delivered = guard->runIfAlive(
        [&] { storeListing(path, sequence, reply, callback); });
    if (!delivered) {
      VLOG(1) << "Dropping listing of " << joinRemotePath(path)
              << " for a closed service";
    }
  });
}

void FileListingService::storeListing(const vector<string>& path,
                                      uint64_t sequence, const Reply& reply,
                                      const ListingCallback& callback) {
  if (!reply.ok()) {
    callback({}, reply.error);
    return;
  }
  vector<FileEntry> entries;
  try {
    for (auto field :
         reply.transaction.getFieldsOfType(FieldType::FILE_NAME_WITH_INFO)) {
      entries.push_back(parseFileNameWithInfo(field->data, path));
    }
  } catch (const std::runtime_error& re) {
    callback({}, HotlineError(ErrorKind::PROTOCOL,
                              string("Bad file listing: ") + re.what()));
    return;
  }
  {
    lock_guard<mutex> guard(snapshotMutex);
    auto it = snapshotSequence.find(path);
    if (it == snapshotSequence.end() || it->second < sequence) {
      snapshots[path] = entries;
      snapshotSequence[path] = sequence;
    } else {
      VLOG(1) << "Keeping newer snapshot of " << joinRemotePath(path);
    }
  }
  callback(entries, nullopt);
}

optional<vector<FileEntry>> FileListingService::getSnapshot(
    const vector<string>& path) {
  lock_guard<mutex> guard(snapshotMutex);
  auto it = snapshots.find(path);
  if (it == snapshots.end()) {
    return nullopt;
  }
  return it->second;
}

void FileListingService::getFileInfo(const vector<string>& path,
                                     const string& name,
                                     FileInfoCallback callback) {
  Transaction request(TransactionType::GET_FILE_INFO);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, path);
  session->sendTransaction(request, [path, name,
                                     callback](const Reply& reply) {
    FileEntry entry;
    entry.name = name;
    entry.path = path;
    if (!reply.ok()) {
      callback(entry, reply.error);
      return;
    }
    const Transaction& t = reply.transaction;
    entry.name = t.getString(FieldType::FILE_NAME).value_or(name);
    entry.type = t.getString(FieldType::FILE_TYPE_STRING).value_or("");
    entry.creator = t.getString(FieldType::FILE_CREATOR_STRING).value_or("");
    entry.comment = t.getString(FieldType::FILE_COMMENT).value_or("");
    // Servers leave the size out for folders
    entry.size = t.getInteger(FieldType::FILE_SIZE).value_or(0);
    entry.isFolder = entry.type == "fldr" || entry.type == "Folder";
    try {
      auto created = t.getString(FieldType::FILE_CREATE_DATE);
      if (created) entry.created = decodeHotlineDate(*created);
      auto modified = t.getString(FieldType::FILE_MODIFY_DATE);
      if (modified) entry.modified = decodeHotlineDate(*modified);
    } catch (const std::runtime_error& re) {
      callback(entry, HotlineError(ErrorKind::PROTOCOL,
                                   string("Bad file date: ") + re.what()));
      return;
    }
    callback(entry, nullopt);
  });
}

void FileListingService::deleteFile(const vector<string>& path,
                                    const string& name, bool isFolder,
                                    ReplyCallback callback) {
  Transaction request(TransactionType::DELETE_FILE);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, path);
  session->sendGatedTransaction(
      isFolder ? Capability::DELETE_FOLDER : Capability::DELETE_FILE, request,
      callback);
}

void FileListingService::newFolder(const vector<string>& path,
                                   const string& name,
                                   ReplyCallback callback) {
  Transaction request(TransactionType::NEW_FOLDER);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, path);
  session->sendGatedTransaction(Capability::CREATE_FOLDER, request, callback);
}

void FileListingService::renameFile(const vector<string>& path,
                                    const string& name, const string& newName,
                                    bool isFolder, ReplyCallback callback) {
  if (newName.empty() || newName.find('/') != string::npos) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       "Invalid file name: " + newName);
  }
  Transaction request(TransactionType::SET_FILE_INFO);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, path);
  request.addString(FieldType::FILE_NEW_NAME, newName);
  session->sendGatedTransaction(
      isFolder ? Capability::RENAME_FOLDER : Capability::RENAME_FILE, request,
      callback);
}

void FileListingService::setComment(const vector<string>& path,
                                    const string& name, const string& comment,
                                    ReplyCallback callback) {
  Transaction request(TransactionType::SET_FILE_INFO);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, path);
  request.addString(FieldType::FILE_COMMENT, comment);
  session->sendGatedTransaction(Capability::SET_FILE_COMMENT, request,
                                callback);
}
}  // namespace hl
