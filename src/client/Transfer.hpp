#ifndef __HL_TRANSFER__
#define __HL_TRANSFER__

#include "Headers.hpp"
#include "HotlineError.hpp"

namespace hl {
enum class TransferState {
  PENDING,
  ACTIVE,
  /** @brief Reserved; this client never pauses a transfer. */
  PAUSED,
  COMPLETED,
  FAILED,
  CANCELLED,
};

enum class TransferDirection {
  UPLOAD,
  DOWNLOAD,
};

string transferStateName(TransferState state);

inline ostream& operator<<(ostream& os, TransferState state) {
  return os << transferStateName(state);
}

inline bool isTerminal(TransferState state) {
  return state == TransferState::COMPLETED || state == TransferState::FAILED ||
         state == TransferState::CANCELLED;
}

/**
 * @brief Snapshot of one transfer as owned by the TransferManager.
 * Observers only ever see copies.
 */
struct Transfer {
  uint64_t id = 0;
  /** @brief Token the server issued for the data connection. */
  uint32_t referenceNumber = 0;
  string title;
  uint64_t totalSize = 0;
  uint64_t transferredBytes = 0;
  TransferDirection direction = TransferDirection::DOWNLOAD;
  bool isFolder = false;
  bool isPreview = false;
  TransferState state = TransferState::PENDING;
  /** @brief Bytes per second, absent until the estimate settles. */
  optional<double> speedEstimate;
  /** @brief Seconds remaining, absent while the speed is unknown. */
  optional<double> etaEstimate;
  /** @brief Server the transfer belongs to ("host:port"). */
  string serverId;
  /** @brief Set for the files of a folder transfer. */
  optional<uint64_t> parentId;
  vector<string> remotePath;
  fs::path localPath;
  optional<HotlineError> error;

  bool isTerminal() const { return hl::isTerminal(state); }
};

/**
 * @brief Progress and outcome of a folder transfer computed from its
 * constituent files.
 *
 * Constituents are added as the folder loop meets them.  Once sealed, the
 * folder is COMPLETED when every constituent completed.  A failed (or
 * cancelled) constituent makes the folder FAILED (or CANCELLED) at once;
 * files already written stay where they are.
 */
class FolderTransferAggregate {
 public:
  FolderTransferAggregate() : sealed(false) {}

  size_t addConstituent(uint64_t totalSize) {
    constituents.push_back({totalSize, 0, TransferState::ACTIVE});
    return constituents.size() - 1;
  }

  /** @brief Adds `bytes` to a constituent; ignored once it is terminal. */
  void addProgress(size_t index, uint64_t bytes) {
    Constituent& c = constituents.at(index);
    if (!hl::isTerminal(c.state)) {
      c.transferredBytes += bytes;
    }
  }

  void finishConstituent(size_t index, TransferState state) {
    Constituent& c = constituents.at(index);
    if (!hl::isTerminal(c.state)) {
      c.state = state;
    }
  }

  /** @brief No further constituents will be added. */
  void seal() { sealed = true; }

  TransferState getState() const {
    bool allCompleted = true;
    for (const auto& c : constituents) {
      if (c.state == TransferState::FAILED) {
        return TransferState::FAILED;
      }
      if (c.state == TransferState::CANCELLED) {
        return TransferState::CANCELLED;
      }
      if (c.state != TransferState::COMPLETED) {
        allCompleted = false;
      }
    }
    if (sealed && allCompleted) {
      return TransferState::COMPLETED;
    }
    return TransferState::ACTIVE;
  }

  uint64_t getTotalSize() const {
    uint64_t total = 0;
    for (const auto& c : constituents) total += c.totalSize;
    return total;
  }

  uint64_t getTransferredBytes() const {
    uint64_t sum = 0;
    for (const auto& c : constituents) sum += c.transferredBytes;
    return sum;
  }

  size_t size() const { return constituents.size(); }

 protected:
  struct Constituent {
    uint64_t totalSize;
    uint64_t transferredBytes;
    TransferState state;
  };

  vector<Constituent> constituents;
  bool sealed;
};
}  // namespace hl

#endif  // __HL_TRANSFER__
