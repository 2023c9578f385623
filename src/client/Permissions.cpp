#include "Permissions.hpp"

#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace hl {
bool canManageUsers(PermissionMask permissions) {
  return isAllowed(permissions, Capability::CREATE_USER) ||
         isAllowed(permissions, Capability::DELETE_USER) ||
         isAllowed(permissions, Capability::READ_USER) ||
         isAllowed(permissions, Capability::MODIFY_USER);
}

PermissionMask permissionMaskOf(const vector<Capability>& capabilities) {
  PermissionMask mask = 0;
  for (auto capability : capabilities) {
    mask |= capabilityBit(capability);
  }
  return mask;
}

PermissionMask permissionMaskFromWire(const string& data) {
  if (data.length() != 8) {
    throw std::runtime_error("Access field must be 8 bytes, got " +
                             to_string(data.length()));
  }
  MessageReader reader(data);
  return reader.readPrimitive<uint64_t>();
}

string permissionMaskToWire(PermissionMask permissions) {
  MessageWriter writer;
  writer.writePrimitive<uint64_t>(permissions);
  return writer.finish();
}

string capabilityName(Capability capability) {
  switch (capability) {
    case Capability::DELETE_FILE:
      return "delete-file";
    case Capability::UPLOAD_FILE:
      return "upload-file";
    case Capability::DOWNLOAD_FILE:
      return "download-file";
    case Capability::RENAME_FILE:
      return "rename-file";
    case Capability::MOVE_FILE:
      return "move-file";
    case Capability::CREATE_FOLDER:
      return "create-folder";
    case Capability::DELETE_FOLDER:
      return "delete-folder";
    case Capability::RENAME_FOLDER:
      return "rename-folder";
    case Capability::MOVE_FOLDER:
      return "move-folder";
    case Capability::READ_CHAT:
      return "read-chat";
    case Capability::SEND_CHAT:
      return "send-chat";
    case Capability::CREATE_USER:
      return "create-user";
    case Capability::DELETE_USER:
      return "delete-user";
    case Capability::READ_USER:
      return "read-user";
    case Capability::MODIFY_USER:
      return "modify-user";
    case Capability::NEWS_READ_ARTICLE:
      return "news-read";
    case Capability::NEWS_POST_ARTICLE:
      return "news-post";
    case Capability::DISCONNECT_USER:
      return "disconnect-user";
    case Capability::GET_CLIENT_INFO:
      return "get-client-info";
    case Capability::UPLOAD_ANYWHERE:
      return "upload-anywhere";
    case Capability::SET_FILE_COMMENT:
      return "set-file-comment";
    case Capability::BROADCAST:
      return "broadcast";
    case Capability::UPLOAD_FOLDER:
      return "upload-folder";
    case Capability::DOWNLOAD_FOLDER:
      return "download-folder";
    case Capability::SEND_PRIVATE_MESSAGE:
      return "send-private-message";
  }
  return "unknown";
}

const vector<Capability>& allCapabilities() {
  static const vector<Capability> capabilities = {
      Capability::DELETE_FILE,       Capability::UPLOAD_FILE,
      Capability::DOWNLOAD_FILE,     Capability::RENAME_FILE,
      Capability::MOVE_FILE,         Capability::CREATE_FOLDER,
      Capability::DELETE_FOLDER,     Capability::RENAME_FOLDER,
      Capability::MOVE_FOLDER,       Capability::READ_CHAT,
      Capability::SEND_CHAT,         Capability::CREATE_USER,
      Capability::DELETE_USER,       Capability::READ_USER,
      Capability::MODIFY_USER,       Capability::NEWS_READ_ARTICLE,
      Capability::NEWS_POST_ARTICLE, Capability::DISCONNECT_USER,
      Capability::GET_CLIENT_INFO,   Capability::UPLOAD_ANYWHERE,
      Capability::SET_FILE_COMMENT,  Capability::BROADCAST,
      Capability::UPLOAD_FOLDER,     Capability::DOWNLOAD_FOLDER,
      Capability::SEND_PRIVATE_MESSAGE,
  };
  return capabilities;
}
}  // namespace hl
