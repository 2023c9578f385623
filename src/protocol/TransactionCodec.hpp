#ifndef __HL_TRANSACTION_CODEC_H__
#define __HL_TRANSACTION_CODEC_H__

#include "Headers.hpp"
#include "Transaction.hpp"

namespace hl {
enum class DecodeStatus {
  /** @brief A full frame was consumed and decoded. */
  TRANSACTION,
  /** @brief More bytes are needed; nothing was consumed. */
  INCOMPLETE_FRAME,
  /** @brief The stream is corrupt and cannot be resynchronized. */
  MALFORMED_FRAME,
};

/**
 * @brief Frames transactions to and from the control connection.
 *
 * Incoming bytes are appended as they arrive; decode() pulls complete
 * frames off the front of the buffer one at a time, so a single read may
 * yield several pipelined transactions and a frame may span many reads.
 */
class TransactionCodec {
 public:
  TransactionCodec() : malformed(false) {}

  /**
   * @brief Serializes header and body.
   * @throws std::runtime_error if a field exceeds 65535 bytes.
   */
  static string encode(const Transaction& transaction);

  /**
   * @brief Decodes the frame at the start of `buffer` without modifying it.
   * @param consumed Set to the frame length when TRANSACTION is returned.
   * @param error Set to a description when MALFORMED_FRAME is returned.
   */
  static DecodeStatus decodeFrame(const string& buffer, size_t* consumed,
                                  Transaction* transaction, string* error);

  inline void append(const char* data, size_t length) {
    buffer.append(data, length);
  }
  inline void append(const string& data) { buffer.append(data); }

  /**
   * @brief Decodes the next buffered frame.  Once MALFORMED_FRAME has been
   * returned every later call returns it too.
   */
  DecodeStatus decode(Transaction* transaction, string* error = NULL);

  inline size_t bufferedBytes() const { return buffer.length(); }

 protected:
  string buffer;
  bool malformed;
  string malformedReason;
};
}  // namespace hl

#endif  // __HL_TRANSACTION_CODEC_H__
