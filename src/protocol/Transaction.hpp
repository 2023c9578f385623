#ifndef __HL_TRANSACTION_H__
#define __HL_TRANSACTION_H__

#include "Headers.hpp"
#include "TransactionTypes.hpp"

namespace hl {
/**
 * @brief One tagged parameter of a transaction.  The payload is kept as raw
 * wire bytes; typed access goes through the Transaction helpers.
 */
struct Field {
  FieldType type;
  string data;

  bool operator==(const Field& other) const {
    return type == other.type && data == other.data;
  }
};

/**
 * @brief A framed request or reply on the control connection.
 */
class Transaction {
 public:
  /** @brief Size of the fixed header that precedes every body. */
  static const int HEADER_SIZE = 20;

  Transaction()
      : flags(0),
        reply(false),
        type(TransactionType::REPLY),
        id(0),
        errorCode(0) {}

  explicit Transaction(TransactionType _type)
      : flags(0), reply(false), type(_type), id(0), errorCode(0) {}

  /** @brief Builds the reply to `request`, carrying its id and type. */
  static Transaction replyTo(const Transaction& request,
                             uint32_t errorCode = 0) {
    Transaction t(request.getType());
    t.setId(request.getId());
    t.setReply(true);
    t.setErrorCode(errorCode);
    return t;
  }

  inline TransactionType getType() const { return type; }
  inline void setType(TransactionType _type) { type = _type; }
  inline uint32_t getId() const { return id; }
  inline void setId(uint32_t _id) { id = _id; }
  inline bool isReply() const { return reply; }
  inline void setReply(bool _reply) { reply = _reply; }
  inline uint32_t getErrorCode() const { return errorCode; }
  inline void setErrorCode(uint32_t _errorCode) { errorCode = _errorCode; }
  inline uint8_t getFlags() const { return flags; }
  inline void setFlags(uint8_t _flags) { flags = _flags; }
  inline const vector<Field>& getFields() const { return fields; }

  inline void addField(FieldType fieldType, const string& data) {
    fields.push_back({fieldType, data});
  }
  void addString(FieldType fieldType, const string& s) {
    addField(fieldType, s);
  }
  /** @brief Adds a string obfuscated the Hotline way (each byte ^ 0xFF). */
  void addEncodedString(FieldType fieldType, const string& s);
  void addUInt16(FieldType fieldType, uint16_t value);
  void addUInt32(FieldType fieldType, uint32_t value);
  /**
   * @brief Adds a path field.  The root path (no segments) is expressed by
   * leaving the field out, so nothing is added for it.
   */
  void addPath(FieldType fieldType, const vector<string>& path);

  bool hasField(FieldType fieldType) const;
  const Field* getField(FieldType fieldType) const;
  /** @brief All fields with the given tag, in wire order. */
  vector<const Field*> getFieldsOfType(FieldType fieldType) const;
  optional<string> getString(FieldType fieldType) const;
  /**
   * @brief Decodes an integer field of 1, 2, 4 or 8 bytes.  Any other
   * length yields nullopt.
   */
  optional<uint64_t> getInteger(FieldType fieldType) const;
  /** @brief ErrorText when present, otherwise a generic message. */
  string getErrorText() const;

  /** @brief Size of the encoded body (field count plus fields). */
  uint32_t bodySize() const;

  bool operator==(const Transaction& other) const {
    return flags == other.flags && reply == other.reply &&
           type == other.type && id == other.id &&
           errorCode == other.errorCode && fields == other.fields;
  }
  bool operator!=(const Transaction& other) const { return !(*this == other); }

 protected:
  uint8_t flags;
  bool reply;
  TransactionType type;
  uint32_t id;
  uint32_t errorCode;
  vector<Field> fields;
};

ostream& operator<<(ostream& os, const Transaction& t);
}  // namespace hl

#endif  // __HL_TRANSACTION_H__
