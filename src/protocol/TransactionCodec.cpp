#include "TransactionCodec.hpp"

#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
string TransactionCodec::encode(const Transaction& transaction) {
  MessageWriter writer;
  uint32_t bodySize = transaction.bodySize();
  writer.writePrimitive<uint8_t>(transaction.getFlags());
  writer.writePrimitive<uint8_t>(transaction.isReply() ? 1 : 0);
  writer.writePrimitive<uint16_t>(uint16_t(transaction.getType()));
  writer.writePrimitive<uint32_t>(transaction.getId());
  writer.writePrimitive<uint32_t>(transaction.getErrorCode());
  writer.writePrimitive<uint32_t>(bodySize);
  writer.writePrimitive<uint32_t>(bodySize);
  if (bodySize) {
    const auto& fields = transaction.getFields();
    if (fields.size() > 0xFFFF) {
      throw std::runtime_error("Too many fields in transaction");
    }
    writer.writePrimitive<uint16_t>(uint16_t(fields.size()));
    for (const auto& field : fields) {
      if (field.data.length() > 0xFFFF) {
        throw std::runtime_error("Field " + to_string(uint16_t(field.type)) +
                                 " is too large: " +
                                 to_string(field.data.length()));
      }
      writer.writePrimitive<uint16_t>(uint16_t(field.type));
      writer.writePrimitive<uint16_t>(uint16_t(field.data.length()));
      writer.writeBytes(field.data);
    }
  }
  return writer.finish();
}

DecodeStatus TransactionCodec::decodeFrame(const string& buffer,
                                           size_t* consumed,
                                           Transaction* transaction,
                                           string* error) {
  if (buffer.length() < size_t(Transaction::HEADER_SIZE)) {
    return DecodeStatus::INCOMPLETE_FRAME;
  }
  MessageReader header(buffer.substr(0, Transaction::HEADER_SIZE));
  uint8_t flags = header.readPrimitive<uint8_t>();
  uint8_t isReply = header.readPrimitive<uint8_t>();
  uint16_t type = header.readPrimitive<uint16_t>();
  uint32_t id = header.readPrimitive<uint32_t>();
  uint32_t errorCode = header.readPrimitive<uint32_t>();
  uint32_t totalSize = header.readPrimitive<uint32_t>();
  uint32_t dataSize = header.readPrimitive<uint32_t>();

  string reason;
  if (isReply > 1) {
    reason = "invalid reply flag " + to_string(isReply);
  } else if (dataSize != totalSize) {
    reason = "multi-part transaction (total " + to_string(totalSize) +
             ", data " + to_string(dataSize) + ")";
  } else if (dataSize > MAX_TRANSACTION_SIZE) {
    reason = "transaction too large: " + to_string(dataSize);
  } else if (dataSize == 1) {
    reason = "body too short for a field count";
  }
  if (!reason.empty()) {
    if (error) *error = reason;
    return DecodeStatus::MALFORMED_FRAME;
  }

  if (buffer.length() < Transaction::HEADER_SIZE + size_t(dataSize)) {
    return DecodeStatus::INCOMPLETE_FRAME;
  }

  Transaction t((TransactionType)type);
  t.setFlags(flags);
  t.setReply(isReply == 1);
  t.setId(id);
  t.setErrorCode(errorCode);
  if (dataSize) {
    MessageReader body(buffer.substr(Transaction::HEADER_SIZE, dataSize));
    try {
      uint16_t fieldCount = body.readPrimitive<uint16_t>();
      for (int a = 0; a < fieldCount; a++) {
        uint16_t fieldType = body.readPrimitive<uint16_t>();
        uint16_t fieldSize = body.readPrimitive<uint16_t>();
        t.addField((FieldType)fieldType, body.readBytes(fieldSize));
      }
    } catch (const std::runtime_error& re) {
      if (error) *error = string("field list overruns body: ") + re.what();
      return DecodeStatus::MALFORMED_FRAME;
    }
    if (body.sizeRemaining() != 0) {
      if (error) {
        *error = to_string(body.sizeRemaining()) +
                 " trailing bytes after the field list";
      }
      return DecodeStatus::MALFORMED_FRAME;
    }
  }
  *consumed = Transaction::HEADER_SIZE + dataSize;
  *transaction = t;
  return DecodeStatus::TRANSACTION;
}

DecodeStatus TransactionCodec::decode(Transaction* transaction,
                                      string* error) {
  if (malformed) {
    if (error) *error = malformedReason;
    return DecodeStatus::MALFORMED_FRAME;
  }
  size_t consumed = 0;
  string reason;
  DecodeStatus status = decodeFrame(buffer, &consumed, transaction, &reason);
  if (status == DecodeStatus::TRANSACTION) {
    buffer.erase(0, consumed);
    VLOG(3) << "Decoded " << *transaction << " (" << consumed << " bytes, "
            << buffer.length() << " still buffered)";
  } else if (status == DecodeStatus::MALFORMED_FRAME) {
    LOG(WARNING) << "Malformed transaction frame: " << reason;
    malformed = true;
    malformedReason = reason;
    if (error) *error = reason;
  }
  return status;
}
}  // namespace hl
