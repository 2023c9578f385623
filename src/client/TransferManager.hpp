#ifndef __HL_TRANSFER_MANAGER__
#define __HL_TRANSFER_MANAGER__

#include "CallbackDispatcher.hpp"
#include "ClientSession.hpp"
#include "HotlineObjects.hpp"
#include "Transfer.hpp"
#include "TransferConnection.hpp"
#include "TransferRateEstimator.hpp"

namespace hl {
/**
 * @brief What an observer wants to hear about.  Any member may be left
 * empty.  Exactly one of the completion callbacks fires per transfer,
 * whatever ended it; onPreviewReady fires just before it when a preview
 * succeeds.
 */
struct TransferCallbacks {
  function<void(const Transfer&)> onProgress;
  function<void(const Transfer&)> onDownloadComplete;
  function<void(const Transfer&)> onUploadComplete;
  function<void(const Transfer&, const string&)> onPreviewReady;
};

/**
 * @brief Owns every transfer and the worker threads that move their bytes.
 *
 * Starting a transfer checks the capability, creates a PENDING record and
 * asks the server for a reference number over the control connection.
 * The reply queues the transfer on the worker pool; the record turns
 * ACTIVE once a worker has opened the data connection.  Records are only
 * changed here, under one lock, and every change is published to the
 * subscribers through their dispatchers while that lock is held, so
 * observers see the changes of a transfer in order and nothing after its
 * terminal state.
 *
 * Transfers do not depend on the control connection once they run:
 * disconnecting a session leaves them alone (see cancelAllForServer).
 * The manager must outlive the sessions it started transfers on.
 */
class TransferManager {
 public:
  TransferManager(int workerCount = 4, bool _resumeEnabled = false);
  virtual ~TransferManager();

  /**
   * @brief Downloads `file` into `destinationDir`.
   * @throws HotlineError PERMISSION_DENIED_LOCAL before anything is sent,
   * INVALID_ARGUMENT for a folder.
   * @return Id of the new transfer.
   */
  uint64_t startDownload(shared_ptr<ClientSession> session,
                         const FileEntry& file, const fs::path& destinationDir);
  /**
   * @brief Uploads `localFile` into the remote folder `destinationPath`.
   * @throws HotlineError PERMISSION_DENIED_LOCAL or INVALID_ARGUMENT.
   */
  uint64_t startUpload(shared_ptr<ClientSession> session,
                       const fs::path& localFile,
                       const vector<string>& destinationPath);
  /** @brief Fetches `file` into memory, delivered through onPreviewReady. */
  uint64_t startPreview(shared_ptr<ClientSession> session,
                        const FileEntry& file);
  uint64_t startFolderDownload(shared_ptr<ClientSession> session,
                               const FileEntry& folder,
                               const fs::path& destinationDir);
  uint64_t startFolderUpload(shared_ptr<ClientSession> session,
                             const fs::path& localFolder,
                             const vector<string>& destinationPath);

  /**
   * @brief Cancels a PENDING or ACTIVE transfer and closes its data
   * connection.  Partial data stays on disk.  Cancelling a file of a
   * folder transfer cancels the folder.
   * @return false when the transfer is unknown or already terminal.
   */
  bool cancel(uint64_t transferId);
  /** @return Number of transfers cancelled. */
  int cancelAllForServer(const string& serverId);

  optional<Transfer> getTransfer(uint64_t transferId);
  vector<Transfer> getTransfers();
  /** @return true when the transfer reached a terminal state in time. */
  bool waitForTransfer(uint64_t transferId, std::chrono::milliseconds timeout);
  /** @brief Forgets terminal transfers.  @return how many were dropped. */
  int clearFinished();

  int subscribe(shared_ptr<CallbackDispatcher> dispatcher,
                TransferCallbacks callbacks);
  void unsubscribe(int subscriptionId);

  inline bool isResumeEnabled() const { return resumeEnabled; }

 protected:
  struct TransferJob {
    Transfer transfer;
    TransferRateEstimator estimator;
    shared_ptr<SocketHandler> socketHandler;
    SocketEndpoint dataEndpoint;
    int dataFd = -1;
    unique_ptr<FolderTransferAggregate> aggregate;
    optional<size_t> currentItem;
    optional<uint64_t> currentChildId;
  };
  friend class JobSink;

  /** @brief Moves the bytes once the server handed out a reference.
   * Returns the preview bytes for previews. */
  typedef function<string(TransferConnection*, const Transaction&)>
      TransferBody;

  shared_ptr<TransferJob> createJob(shared_ptr<ClientSession> session,
                                    TransferDirection direction,
                                    const string& title, uint64_t totalSize,
                                    bool isFolder);
  void sendTransferRequest(shared_ptr<ClientSession> session,
                           shared_ptr<TransferJob> job, Capability capability,
                           Transaction request, TransferBody body);
  void runJob(shared_ptr<TransferJob> job, TransferBody body,
              Transaction reply);
  void setTotalSize(shared_ptr<TransferJob> job, uint64_t totalSize);

  bool recordProgress(uint64_t transferId, uint64_t bytes);
  void itemStarted(uint64_t transferId, const vector<string>& relativePath,
                   uint64_t size);
  void itemFinished(uint64_t transferId);
  /**
   * @brief Moves a transfer to a terminal state and notifies, once.
   * @return false when it already was terminal.
   */
  bool finish(uint64_t transferId, TransferState state,
              const optional<HotlineError>& error,
              const string* previewBytes = NULL);

  void publishProgress(const Transfer& transfer);
  void publishCompletion(const Transfer& transfer);
  void publishPreview(const Transfer& transfer, const string& bytes);

  bool resumeEnabled;

  recursive_mutex transferMutex;
  condition_variable_any transferCondition;
  map<uint64_t, shared_ptr<TransferJob>> jobs;
  uint64_t nextTransferId;

  map<int, pair<shared_ptr<CallbackDispatcher>, TransferCallbacks>>
      subscribers;
  int nextSubscriptionId;

  std::unique_ptr<ThreadPool> workers;
};
}  // namespace hl

#endif  // __HL_TRANSFER_MANAGER__
