#ifndef __HL_TRANSFER_CONNECTION__
#define __HL_TRANSFER_CONNECTION__

#include "Headers.hpp"
#include "HotlineError.hpp"
#include "HtxfCodec.hpp"
#include "SocketHandler.hpp"

namespace hl {
/**
 * @brief Receives the byte counts of a data connection as they move.
 */
class TransferSink {
 public:
  virtual ~TransferSink() {}

  /** @return false once the transfer was cancelled; the loop then stops. */
  virtual bool bytesMoved(uint64_t count) = 0;

  /** @brief Folder transfers: a constituent file of `size` bytes begins. */
  virtual void itemStarted(const vector<string>& relativePath,
                           uint64_t size) {}
  /** @brief Folder transfers: the current file is complete (or the server
   * already had it). */
  virtual void itemFinished() {}
};

/** @brief One entry of a local folder about to be uploaded. */
struct FolderUploadItem {
  /** @brief Path below the uploaded folder. */
  vector<string> relativePath;
  fs::path localPath;
  bool isFolder = false;
  /** @brief Flattened size for files. */
  uint64_t size = 0;
};

/**
 * @brief Speaks HTXF on an established data connection.
 *
 * Each operation sends the handshake for `referenceNumber` and moves the
 * whole transfer, reporting every chunk to the sink.  I/O errors surface
 * as std::runtime_error (socket) or HotlineError TRANSFER (disk,
 * unexpected data); a cancel through the sink surfaces as HotlineError
 * CANCELLED.  The descriptor stays owned by the caller.
 */
class TransferConnection {
 public:
  static const int CHUNK_SIZE = 64 * 1024;

  TransferConnection(shared_ptr<SocketHandler> _socketHandler, int _fd,
                     TransferSink* _sink);

  /**
   * @brief Receives a flattened file into `target`.  A non zero
   * `resumeOffset` appends the DATA fork to the existing file.
   */
  void downloadFile(uint32_t referenceNumber, const fs::path& target,
                    uint64_t resumeOffset);
  /** @brief Receives `size` raw bytes into memory. */
  string downloadPreview(uint32_t referenceNumber, uint64_t size);
  /** @brief Sends `source` flattened, the DATA fork from `resumeOffset`. */
  void uploadFile(uint32_t referenceNumber, const fs::path& source,
                  uint64_t resumeOffset);
  /**
   * @brief Runs the folder download loop for `itemCount` items, writing
   * below `targetDir`.  With `resume`, files that already exist locally
   * are asked for from their current size.
   */
  void downloadFolder(uint32_t referenceNumber, const fs::path& targetDir,
                      int itemCount, bool resume);
  /** @brief Runs the folder upload loop over `items`. */
  void uploadFolder(uint32_t referenceNumber,
                    const vector<FolderUploadItem>& items, bool resume);

  /** @brief INFO fork describing a local file. */
  static FileInfoFork describeLocalFile(const fs::path& path);
  /** @brief Walks a local folder (hidden entries skipped, names sorted). */
  static vector<FolderUploadItem> listLocalFolder(const fs::path& root);

 protected:
  void readFlattenedFile(const fs::path& target, uint64_t resumeOffset);
  void writeFlattenedFile(const fs::path& source, uint64_t resumeOffset);
  string readCounted(size_t count);
  void writeCounted(const string& s);
  void sendAction(FolderAction action, const string& payload = "");
  FolderAction readAction();
  void checkCancelled(uint64_t count);

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  TransferSink* sink;
};
}  // namespace hl

#endif  // __HL_TRANSFER_CONNECTION__
