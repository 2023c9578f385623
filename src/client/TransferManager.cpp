#include "TransferManager.hpp"

namespace hl {
string transferStateName(TransferState state) {
  switch (state) {
    case TransferState::PENDING:
      return "Pending";
    case TransferState::ACTIVE:
      return "Active";
    case TransferState::PAUSED:
      return "Paused";
    case TransferState::COMPLETED:
      return "Completed";
    case TransferState::FAILED:
      return "Failed";
    case TransferState::CANCELLED:
      return "Cancelled";
  }
  return "Unknown";
}

/**
 * @brief Routes the byte counts of one data connection back into the
 * manager.
 */
class JobSink : public TransferSink {
 public:
  JobSink(TransferManager* _manager, uint64_t _transferId)
      : manager(_manager), transferId(_transferId) {}

  virtual bool bytesMoved(uint64_t count) {
    return manager->recordProgress(transferId, count);
  }
  virtual void itemStarted(const vector<string>& relativePath, uint64_t size) {
    manager->itemStarted(transferId, relativePath, size);
  }
  virtual void itemFinished() { manager->itemFinished(transferId); }

 protected:
  TransferManager* manager;
  uint64_t transferId;
};

TransferManager::TransferManager(int workerCount, bool _resumeEnabled)
    : resumeEnabled(_resumeEnabled),
      nextTransferId(1),
      nextSubscriptionId(1),
      workers(new ThreadPool(max(1, workerCount))) {
  LOG(INFO) << "Transfer manager with " << max(1, workerCount)
            << " workers, resume " << (resumeEnabled ? "on" : "off");
}

TransferManager::~TransferManager() {
  {
    lock_guard<recursive_mutex> guard(transferMutex);
    for (const auto& it : jobs) {
      if (!it.second->transfer.isTerminal() && !it.second->transfer.parentId) {
        finish(it.first, TransferState::CANCELLED,
               HotlineError(ErrorKind::CANCELLED, "Transfer manager shut down"));
      }
    }
  }
  // Joins the workers
  workers.reset();
}

shared_ptr<TransferManager::TransferJob> TransferManager::createJob(
    shared_ptr<ClientSession> session, TransferDirection direction,
    const string& title, uint64_t totalSize, bool isFolder) {
  auto job = make_shared<TransferJob>();
  job->transfer.title = title;
  job->transfer.totalSize = totalSize;
  job->transfer.direction = direction;
  job->transfer.isFolder = isFolder;
  job->transfer.serverId = session->getServerId();
  job->estimator.setTotal(totalSize);
  job->socketHandler = session->getSocketHandler();
  job->dataEndpoint = session->getEndpoint().transferEndpoint();
  if (isFolder) {
    job->aggregate.reset(new FolderTransferAggregate());
  }
  lock_guard<recursive_mutex> guard(transferMutex);
  job->transfer.id = nextTransferId++;
  jobs[job->transfer.id] = job;
  LOG(INFO) << "Transfer " << job->transfer.id << " (" << title << ") queued";
  publishProgress(job->transfer);
  return job;
}

void TransferManager::sendTransferRequest(shared_ptr<ClientSession> session,
                                          shared_ptr<TransferJob> job,
                                          Capability capability,
                                          Transaction request,
                                          TransferBody body) {
  uint64_t transferId = job->transfer.id;
  try {
    session->sendGatedTransaction(
        capability, request, [this, job, body](const Reply& reply) {
          uint64_t transferId = job->transfer.id;
          if (!reply.ok()) {
            finish(transferId, TransferState::FAILED, reply.error);
            return;
          }
          auto referenceNumber =
              reply.transaction.getInteger(FieldType::REFERENCE_NUMBER);
          if (!referenceNumber) {
            finish(transferId, TransferState::FAILED,
                   HotlineError(ErrorKind::PROTOCOL,
                                "The server did not issue a transfer reference"));
            return;
          }
          {
            lock_guard<recursive_mutex> guard(transferMutex);
            if (job->transfer.isTerminal()) {
              VLOG(1) << "Transfer " << transferId
                      << " ended before its reference arrived";
              return;
            }
            job->transfer.referenceNumber = uint32_t(*referenceNumber);
          }
          auto transferSize =
              reply.transaction.getInteger(FieldType::TRANSFER_SIZE);
          if (transferSize &&
              job->transfer.direction == TransferDirection::DOWNLOAD) {
            setTotalSize(job, *transferSize);
          }
          Transaction replyCopy = reply.transaction;
          try {
            workers->enqueue([this, job, body, replyCopy]() {
              runJob(job, body, replyCopy);
            });
          } catch (const std::runtime_error& re) {
            finish(transferId, TransferState::FAILED,
                   HotlineError(ErrorKind::TRANSFER,
                                string("Cannot schedule transfer: ") + re.what()));
          }
        });
  } catch (const HotlineError& error) {
    finish(transferId, TransferState::FAILED, error);
    throw;
  }
}

void TransferManager::runJob(shared_ptr<TransferJob> job, TransferBody body,
                             Transaction reply) {
  el::Helpers::setThreadName("transfer-worker");
  uint64_t transferId = job->transfer.id;
  {
    lock_guard<recursive_mutex> guard(transferMutex);
    if (job->transfer.isTerminal()) {
      return;
    }
  }
  VLOG(1) << "Transfer " << transferId << " connecting to "
          << job->dataEndpoint;
  int fd = job->socketHandler->connect(job->dataEndpoint);
  if (fd < 0) {
    ostringstream ss;
    ss << "Could not open the data connection to " << job->dataEndpoint;
    finish(transferId, TransferState::FAILED,
           HotlineError(ErrorKind::TRANSFER, ss.str()));
    return;
  }
  {
    lock_guard<recursive_mutex> guard(transferMutex);
    if (job->transfer.isTerminal()) {
      job->socketHandler->close(fd);
      return;
    }
    job->dataFd = fd;
    job->transfer.state = TransferState::ACTIVE;
    LOG(INFO) << "Transfer " << transferId << " active";
    publishProgress(job->transfer);
  }

  try {
    JobSink sink(this, transferId);
    TransferConnection connection(job->socketHandler, fd, &sink);
    string previewBytes = body(&connection, reply);
    TransferState outcome = TransferState::COMPLETED;
    {
      lock_guard<recursive_mutex> guard(transferMutex);
      if (job->aggregate) {
        job->aggregate->seal();
        outcome = job->aggregate->getState();
        if (outcome == TransferState::ACTIVE) {
          outcome = TransferState::FAILED;
        }
      }
    }
    if (outcome == TransferState::COMPLETED) {
      finish(transferId, outcome, nullopt,
             job->transfer.isPreview ? &previewBytes : NULL);
    } else {
      finish(transferId, outcome,
             HotlineError(ErrorKind::TRANSFER, "A file of the folder failed"));
    }
  } catch (const HotlineError& error) {
    finish(transferId,
           error.getKind() == ErrorKind::CANCELLED ? TransferState::CANCELLED
                                                   : TransferState::FAILED,
           error);
  } catch (const std::runtime_error& re) {
    finish(transferId, TransferState::FAILED,
           HotlineError(ErrorKind::TRANSFER, re.what()));
  }

  {
    lock_guard<recursive_mutex> guard(transferMutex);
    job->dataFd = -1;
  }
  job->socketHandler->close(fd);
}

void TransferManager::setTotalSize(shared_ptr<TransferJob> job,
                                   uint64_t totalSize) {
  lock_guard<recursive_mutex> guard(transferMutex);
  job->transfer.totalSize = totalSize;
  job->estimator.setTotal(totalSize);
}

uint64_t TransferManager::startDownload(shared_ptr<ClientSession> session,
                                        const FileEntry& file,
                                        const fs::path& destinationDir) {
  session->requireCapability(Capability::DOWNLOAD_FILE);
  if (file.isFolder) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       file.name + " is a folder");
  }
  fs::path target = destinationDir / file.name;
  uint64_t resumeOffset = 0;
  if (resumeEnabled && fs::is_regular_file(target)) {
    std::error_code ec;
    resumeOffset = fs::file_size(target, ec);
    if (ec) resumeOffset = 0;
  }
  auto job = createJob(session, TransferDirection::DOWNLOAD, file.name,
                       file.size, false);
  job->transfer.remotePath = file.fullPath();
  job->transfer.localPath = target;

  Transaction request(TransactionType::DOWNLOAD_FILE);
  request.addString(FieldType::FILE_NAME, file.name);
  request.addPath(FieldType::FILE_PATH, file.path);
  if (resumeOffset) {
    LOG(INFO) << "Asking to resume " << target << " at " << resumeOffset;
    request.addField(FieldType::FILE_RESUME_DATA,
                     encodeResumeData(uint32_t(resumeOffset)));
  }
  sendTransferRequest(
      session, job, Capability::DOWNLOAD_FILE, request,
      [target, resumeOffset](TransferConnection* connection,
                             const Transaction& reply) {
        connection->downloadFile(
            uint32_t(reply.getInteger(FieldType::REFERENCE_NUMBER).value_or(0)),
            target, resumeOffset);
        return string();
      });
  return job->transfer.id;
}

uint64_t TransferManager::startPreview(shared_ptr<ClientSession> session,
                                       const FileEntry& file) {
  session->requireCapability(Capability::DOWNLOAD_FILE);
  if (file.isFolder) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       file.name + " is a folder");
  }
  auto job = createJob(session, TransferDirection::DOWNLOAD, file.name,
                       file.size, false);
  job->transfer.isPreview = true;
  job->transfer.remotePath = file.fullPath();

  Transaction request(TransactionType::DOWNLOAD_FILE);
  request.addString(FieldType::FILE_NAME, file.name);
  request.addPath(FieldType::FILE_PATH, file.path);
  request.addUInt32(FieldType::FILE_TRANSFER_OPTIONS, TRANSFER_OPTION_PREVIEW);
  sendTransferRequest(
      session, job, Capability::DOWNLOAD_FILE, request,
      [](TransferConnection* connection, const Transaction& reply) {
        return connection->downloadPreview(
            uint32_t(reply.getInteger(FieldType::REFERENCE_NUMBER).value_or(0)),
            reply.getInteger(FieldType::TRANSFER_SIZE).value_or(0));
      });
  return job->transfer.id;
}

uint64_t TransferManager::startUpload(shared_ptr<ClientSession> session,
                                      const fs::path& localFile,
                                      const vector<string>& destinationPath) {
  session->requireCapability(Capability::UPLOAD_FILE);
  if (!fs::is_regular_file(localFile)) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       localFile.string() + " is not a file");
  }
  std::error_code ec;
  uint64_t fileSize = fs::file_size(localFile, ec);
  if (ec) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       "Cannot read " + localFile.string() + ": " + ec.message());
  }
  uint64_t total = flattenedFileSize(
      TransferConnection::describeLocalFile(localFile), fileSize);
  if (total > numeric_limits<uint32_t>::max()) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       localFile.string() + " is too large for Hotline");
  }
  string name = localFile.filename().string();
  auto job =
      createJob(session, TransferDirection::UPLOAD, name, total, false);
  job->transfer.remotePath = destinationPath;
  job->transfer.remotePath.push_back(name);
  job->transfer.localPath = localFile;

  Transaction request(TransactionType::UPLOAD_FILE);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, destinationPath);
  request.addUInt32(FieldType::TRANSFER_SIZE, uint32_t(total));
  bool resume = resumeEnabled;
  sendTransferRequest(
      session, job, Capability::UPLOAD_FILE, request,
      [this, job, localFile, fileSize, resume](TransferConnection* connection,
                                               const Transaction& reply) {
        uint64_t offset = 0;
        auto resumeData = reply.getString(FieldType::FILE_RESUME_DATA);
        if (resume && resumeData) {
          offset = decodeResumeData(*resumeData);
          LOG(INFO) << "Server resumes " << localFile << " at " << offset;
          if (offset <= fileSize) {
            setTotalSize(job,
                         flattenedFileSize(
                             TransferConnection::describeLocalFile(localFile),
                             fileSize - offset));
          }
        }
        connection->uploadFile(
            uint32_t(reply.getInteger(FieldType::REFERENCE_NUMBER).value_or(0)),
            localFile, offset);
        return string();
      });
  return job->transfer.id;
}

uint64_t TransferManager::startFolderDownload(shared_ptr<ClientSession> session,
                                              const FileEntry& folder,
                                              const fs::path& destinationDir) {
  session->requireCapability(Capability::DOWNLOAD_FOLDER);
  if (!folder.isFolder) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       folder.name + " is not a folder");
  }
  fs::path target = destinationDir / folder.name;
  auto job =
      createJob(session, TransferDirection::DOWNLOAD, folder.name, 0, true);
  job->transfer.remotePath = folder.fullPath();
  job->transfer.localPath = target;

  Transaction request(TransactionType::DOWNLOAD_FOLDER);
  request.addString(FieldType::FILE_NAME, folder.name);
  request.addPath(FieldType::FILE_PATH, folder.path);
  bool resume = resumeEnabled;
  sendTransferRequest(
      session, job, Capability::DOWNLOAD_FOLDER, request,
      [target, resume](TransferConnection* connection,
                       const Transaction& reply) {
        int itemCount =
            int(reply.getInteger(FieldType::FOLDER_ITEM_COUNT).value_or(0));
        connection->downloadFolder(
            uint32_t(reply.getInteger(FieldType::REFERENCE_NUMBER).value_or(0)),
            target, itemCount, resume);
        return string();
      });
  return job->transfer.id;
}

uint64_t TransferManager::startFolderUpload(
    shared_ptr<ClientSession> session, const fs::path& localFolder,
    const vector<string>& destinationPath) {
  session->requireCapability(Capability::UPLOAD_FOLDER);
  if (!fs::is_directory(localFolder)) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       localFolder.string() + " is not a folder");
  }
  vector<FolderUploadItem> items =
      TransferConnection::listLocalFolder(localFolder);
  uint64_t total = 0;
  for (const auto& item : items) total += item.size;
  if (total > numeric_limits<uint32_t>::max() || items.size() > 0xFFFF) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       localFolder.string() + " is too large for Hotline");
  }
  // "dir/" has an empty filename
  string name = localFolder.filename().string();
  if (name.empty()) name = localFolder.parent_path().filename().string();
  auto job = createJob(session, TransferDirection::UPLOAD, name, total, true);
  job->transfer.remotePath = destinationPath;
  job->transfer.remotePath.push_back(name);
  job->transfer.localPath = localFolder;

  Transaction request(TransactionType::UPLOAD_FOLDER);
  request.addString(FieldType::FILE_NAME, name);
  request.addPath(FieldType::FILE_PATH, destinationPath);
  request.addUInt32(FieldType::TRANSFER_SIZE, uint32_t(total));
  request.addUInt16(FieldType::FOLDER_ITEM_COUNT, uint16_t(items.size()));
  bool resume = resumeEnabled;
  sendTransferRequest(
      session, job, Capability::UPLOAD_FOLDER, request,
      [items, resume](TransferConnection* connection,
                      const Transaction& reply) {
        connection->uploadFolder(
            uint32_t(reply.getInteger(FieldType::REFERENCE_NUMBER).value_or(0)),
            items, resume);
        return string();
      });
  return job->transfer.id;
}

bool TransferManager::recordProgress(uint64_t transferId, uint64_t bytes) {
  lock_guard<recursive_mutex> guard(transferMutex);
  auto it = jobs.find(transferId);
  if (it == jobs.end() || it->second->transfer.isTerminal()) {
    return false;
  }
  auto job = it->second;
  Transfer& transfer = job->transfer;
  transfer.transferredBytes += bytes;
  if (job->aggregate) {
    if (job->currentItem) {
      job->aggregate->addProgress(*job->currentItem, bytes);
    }
    if (job->aggregate->getTotalSize() > transfer.totalSize) {
      transfer.totalSize = job->aggregate->getTotalSize();
      job->estimator.setTotal(transfer.totalSize);
    }
    if (job->currentChildId) {
      auto child = jobs.find(*job->currentChildId);
      if (child != jobs.end() && !child->second->transfer.isTerminal()) {
        Transfer& childTransfer = child->second->transfer;
        childTransfer.transferredBytes += bytes;
        child->second->estimator.update(bytes);
        childTransfer.speedEstimate =
            child->second->estimator.getBytesPerSecond();
        childTransfer.etaEstimate =
            child->second->estimator.getSecondsRemaining();
        publishProgress(childTransfer);
      }
    }
  }
  job->estimator.update(bytes);
  transfer.speedEstimate = job->estimator.getBytesPerSecond();
  transfer.etaEstimate = job->estimator.getSecondsRemaining();
  LOG_EVERY_N(256, INFO) << "Transfer " << transferId << ": "
                         << transfer.transferredBytes << "/"
                         << transfer.totalSize;
  publishProgress(transfer);
  return true;
}

void TransferManager::itemStarted(uint64_t transferId,
                                  const vector<string>& relativePath,
                                  uint64_t size) {
  lock_guard<recursive_mutex> guard(transferMutex);
  auto it = jobs.find(transferId);
  if (it == jobs.end() || it->second->transfer.isTerminal() ||
      !it->second->aggregate) {
    return;
  }
  auto folder = it->second;
  auto child = make_shared<TransferJob>();
  child->transfer.id = nextTransferId++;
  child->transfer.parentId = transferId;
  child->transfer.title =
      relativePath.empty() ? folder->transfer.title : relativePath.back();
  child->transfer.totalSize = size;
  child->transfer.direction = folder->transfer.direction;
  child->transfer.serverId = folder->transfer.serverId;
  child->transfer.state = TransferState::ACTIVE;
  child->transfer.remotePath = folder->transfer.remotePath;
  child->transfer.localPath = folder->transfer.localPath;
  for (const auto& segment : relativePath) {
    child->transfer.remotePath.push_back(segment);
    child->transfer.localPath /= segment;
  }
  child->estimator.setTotal(size);
  child->socketHandler = folder->socketHandler;
  child->dataEndpoint = folder->dataEndpoint;
  jobs[child->transfer.id] = child;

  folder->currentItem = folder->aggregate->addConstituent(size);
  folder->currentChildId = child->transfer.id;
  VLOG(1) << "Transfer " << transferId << " file "
          << joinRemotePath(relativePath) << " (" << size << " bytes)";
  publishProgress(child->transfer);
}

void TransferManager::itemFinished(uint64_t transferId) {
  lock_guard<recursive_mutex> guard(transferMutex);
  auto it = jobs.find(transferId);
  if (it == jobs.end() || it->second->transfer.isTerminal() ||
      !it->second->currentItem) {
    return;
  }
  auto folder = it->second;
  folder->aggregate->finishConstituent(*folder->currentItem,
                                       TransferState::COMPLETED);
  uint64_t childId = *folder->currentChildId;
  folder->currentItem.reset();
  folder->currentChildId.reset();
  finish(childId, TransferState::COMPLETED, nullopt);
}

bool TransferManager::finish(uint64_t transferId, TransferState state,
                             const optional<HotlineError>& error,
                             const string* previewBytes) {
  lock_guard<recursive_mutex> guard(transferMutex);
  auto it = jobs.find(transferId);
  if (it == jobs.end() || it->second->transfer.isTerminal()) {
    return false;
  }
  auto job = it->second;
  if (job->currentChildId) {
    // The file in flight shares the fate of its folder
    job->aggregate->finishConstituent(*job->currentItem, state);
    uint64_t childId = *job->currentChildId;
    job->currentItem.reset();
    job->currentChildId.reset();
    finish(childId, state, error);
  }
  Transfer& transfer = job->transfer;
  transfer.state = state;
  transfer.error = error;
  transfer.etaEstimate.reset();
  if (state == TransferState::CANCELLED && job->dataFd != -1) {
    job->socketHandler->interrupt(job->dataFd);
  }
  if (error) {
    LOG(INFO) << "Transfer " << transferId << " (" << transfer.title
              << ") " << state << ": " << error->describe();
  } else {
    LOG(INFO) << "Transfer " << transferId << " (" << transfer.title
              << ") " << state << " after " << transfer.transferredBytes
              << " bytes";
  }
  if (previewBytes && state == TransferState::COMPLETED) {
    publishPreview(transfer, *previewBytes);
  }
  publishCompletion(transfer);
  transferCondition.notify_all();
  return true;
}

bool TransferManager::cancel(uint64_t transferId) {
  lock_guard<recursive_mutex> guard(transferMutex);
  auto it = jobs.find(transferId);
  if (it == jobs.end()) {
    LOG(WARNING) << "Cancel of unknown transfer " << transferId;
    return false;
  }
  if (it->second->transfer.parentId) {
    return cancel(*it->second->transfer.parentId);
  }
  if (it->second->transfer.isTerminal()) {
    VLOG(1) << "Transfer " << transferId << " already finished";
    return false;
  }
  return finish(transferId, TransferState::CANCELLED,
                HotlineError(ErrorKind::CANCELLED, "Cancelled"));
}

int TransferManager::cancelAllForServer(const string& serverId) {
  lock_guard<recursive_mutex> guard(transferMutex);
  vector<uint64_t> ids;
  for (const auto& it : jobs) {
    const Transfer& transfer = it.second->transfer;
    if (transfer.serverId == serverId && !transfer.parentId &&
        !transfer.isTerminal()) {
      ids.push_back(it.first);
    }
  }
  int cancelled = 0;
  for (auto id : ids) {
    if (cancel(id)) cancelled++;
  }
  LOG(INFO) << "Cancelled " << cancelled << " transfers for " << serverId;
  return cancelled;
}

optional<Transfer> TransferManager::getTransfer(uint64_t transferId) {
  lock_guard<recursive_mutex> guard(transferMutex);
  auto it = jobs.find(transferId);
  if (it == jobs.end()) {
    return nullopt;
  }
  return it->second->transfer;
}

vector<Transfer> TransferManager::getTransfers() {
  lock_guard<recursive_mutex> guard(transferMutex);
  vector<Transfer> transfers;
  for (const auto& it : jobs) {
    transfers.push_back(it.second->transfer);
  }
  return transfers;
}

bool TransferManager::waitForTransfer(uint64_t transferId,
                                      std::chrono::milliseconds timeout) {
  unique_lock<recursive_mutex> lock(transferMutex);
  return transferCondition.wait_for(lock, timeout, [this, transferId] {
    auto it = jobs.find(transferId);
    return it == jobs.end() || it->second->transfer.isTerminal();
  });
}

int TransferManager::clearFinished() {
  lock_guard<recursive_mutex> guard(transferMutex);
  int removed = 0;
  for (auto it = jobs.begin(); it != jobs.end();) {
    const Transfer& transfer = it->second->transfer;
    bool parentAlive = false;
    if (transfer.parentId) {
      auto parent = jobs.find(*transfer.parentId);
      parentAlive =
          parent != jobs.end() && !parent->second->transfer.isTerminal();
    }
    if (transfer.isTerminal() && !parentAlive) {
      it = jobs.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

int TransferManager::subscribe(shared_ptr<CallbackDispatcher> dispatcher,
                               TransferCallbacks callbacks) {
  lock_guard<recursive_mutex> guard(transferMutex);
  int id = nextSubscriptionId++;
  subscribers[id] = make_pair(dispatcher, callbacks);
  return id;
}

void TransferManager::unsubscribe(int subscriptionId) {
  lock_guard<recursive_mutex> guard(transferMutex);
  subscribers.erase(subscriptionId);
}

void TransferManager::publishProgress(const Transfer& transfer) {
  for (const auto& it : subscribers) {
    auto callback = it.second.second.onProgress;
    if (callback) {
      Transfer snapshot = transfer;
      it.second.first->post([callback, snapshot]() { callback(snapshot); });
    }
  }
}

void TransferManager::publishCompletion(const Transfer& transfer) {
  for (const auto& it : subscribers) {
    auto callback = transfer.direction == TransferDirection::DOWNLOAD
                        ? it.second.second.onDownloadComplete
                        : it.second.second.onUploadComplete;
    if (callback) {
      Transfer snapshot = transfer;
      it.second.first->post([callback, snapshot]() { callback(snapshot); });
    }
  }
}

void TransferManager::publishPreview(const Transfer& transfer,
                                     const string& bytes) {
  auto shared = make_shared<string>(bytes);
  for (const auto& it : subscribers) {
    auto callback = it.second.second.onPreviewReady;
    if (callback) {
      Transfer snapshot = transfer;
      it.second.first->post(
          [callback, snapshot, shared]() { callback(snapshot, *shared); });
    }
  }
}
}  // namespace hl
