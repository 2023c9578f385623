#include "Transaction.hpp"

#include "HotlineObjects.hpp"
#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
string transactionTypeName(TransactionType type) {
  switch (type) {
    case TransactionType::REPLY:
      return "Reply";
    case TransactionType::GET_MESSAGES:
      return "GetMessages";
    case TransactionType::NEW_MESSAGE:
      return "NewMessage";
    case TransactionType::OLD_POST_NEWS:
      return "OldPostNews";
    case TransactionType::SERVER_MESSAGE:
      return "ServerMessage";
    case TransactionType::SEND_CHAT:
      return "SendChat";
    case TransactionType::CHAT_MESSAGE:
      return "ChatMessage";
    case TransactionType::LOGIN:
      return "Login";
    case TransactionType::SEND_INSTANT_MESSAGE:
      return "SendInstantMessage";
    case TransactionType::SHOW_AGREEMENT:
      return "ShowAgreement";
    case TransactionType::DISCONNECT_USER:
      return "DisconnectUser";
    case TransactionType::DISCONNECT_MESSAGE:
      return "DisconnectMessage";
    case TransactionType::AGREED:
      return "Agreed";
    case TransactionType::GET_FILE_NAME_LIST:
      return "GetFileNameList";
    case TransactionType::DOWNLOAD_FILE:
      return "DownloadFile";
    case TransactionType::UPLOAD_FILE:
      return "UploadFile";
    case TransactionType::DELETE_FILE:
      return "DeleteFile";
    case TransactionType::NEW_FOLDER:
      return "NewFolder";
    case TransactionType::GET_FILE_INFO:
      return "GetFileInfo";
    case TransactionType::SET_FILE_INFO:
      return "SetFileInfo";
    case TransactionType::DOWNLOAD_FOLDER:
      return "DownloadFolder";
    case TransactionType::UPLOAD_FOLDER:
      return "UploadFolder";
    case TransactionType::GET_USER_NAME_LIST:
      return "GetUserNameList";
    case TransactionType::NOTIFY_USER_CHANGE:
      return "NotifyUserChange";
    case TransactionType::NOTIFY_USER_DELETE:
      return "NotifyUserDelete";
    case TransactionType::SET_CLIENT_USER_INFO:
      return "SetClientUserInfo";
    case TransactionType::USER_ACCESS:
      return "UserAccess";
    case TransactionType::USER_BROADCAST:
      return "UserBroadcast";
    case TransactionType::GET_NEWS_CAT_NAME_LIST:
      return "GetNewsCatNameList";
    case TransactionType::GET_NEWS_ART_NAME_LIST:
      return "GetNewsArtNameList";
    case TransactionType::GET_NEWS_ART_DATA:
      return "GetNewsArtData";
    case TransactionType::POST_NEWS_ART:
      return "PostNewsArt";
    case TransactionType::KEEP_ALIVE:
      return "KeepAlive";
  }
  return "Unknown";
}

void Transaction::addEncodedString(FieldType fieldType, const string& s) {
  addField(fieldType, encodeHotlineString(s));
}

void Transaction::addUInt16(FieldType fieldType, uint16_t value) {
  MessageWriter writer;
  writer.writePrimitive<uint16_t>(value);
  addField(fieldType, writer.finish());
}

void Transaction::addUInt32(FieldType fieldType, uint32_t value) {
  MessageWriter writer;
  writer.writePrimitive<uint32_t>(value);
  addField(fieldType, writer.finish());
}

void Transaction::addPath(FieldType fieldType, const vector<string>& path) {
  if (path.empty()) {
    return;
  }
  addField(fieldType, encodeFilePath(path));
}

bool Transaction::hasField(FieldType fieldType) const {
  return getField(fieldType) != NULL;
}

const Field* Transaction::getField(FieldType fieldType) const {
  for (const auto& field : fields) {
    if (field.type == fieldType) {
      return &field;
    }
  }
  return NULL;
}

vector<const Field*> Transaction::getFieldsOfType(FieldType fieldType) const {
  vector<const Field*> retval;
  for (const auto& field : fields) {
    if (field.type == fieldType) {
      retval.push_back(&field);
    }
  }
  return retval;
}

optional<string> Transaction::getString(FieldType fieldType) const {
  auto field = getField(fieldType);
  if (field == NULL) {
    return nullopt;
  }
  return field->data;
}

optional<uint64_t> Transaction::getInteger(FieldType fieldType) const {
  auto field = getField(fieldType);
  if (field == NULL) {
    return nullopt;
  }
  MessageReader reader(field->data);
  switch (field->data.length()) {
    case 1:
      return reader.readPrimitive<uint8_t>();
    case 2:
      return reader.readPrimitive<uint16_t>();
    case 4:
      return reader.readPrimitive<uint32_t>();
    case 8:
      return reader.readPrimitive<uint64_t>();
    default:
      return nullopt;
  }
}

string Transaction::getErrorText() const {
  auto text = getString(FieldType::ERROR_TEXT);
  if (text && !text->empty()) {
    return *text;
  }
  return "Server returned error code " + to_string(errorCode);
}

uint32_t Transaction::bodySize() const {
  if (fields.empty()) {
    return 0;
  }
  uint32_t size = 2;
  for (const auto& field : fields) {
    size += 4 + field.data.length();
  }
  return size;
}

ostream& operator<<(ostream& os, const Transaction& t) {
  os << (t.isReply() ? "reply " : "") << t.getType() << " id=" << t.getId();
  if (t.getErrorCode()) {
    os << " error=" << t.getErrorCode();
  }
  os << " fields=" << t.getFields().size();
  return os;
}
}  // namespace hl
