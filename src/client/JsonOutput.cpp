#include "JsonOutput.hpp"

namespace hl {
void to_json(json& j, const FileEntry& entry) {
  j = json{{"name", entry.name},
           {"path", joinRemotePath(entry.fullPath())},
           {"folder", entry.isFolder},
           {"type", entry.type},
           {"creator", entry.creator}};
  if (entry.isFolder) {
    j["items"] = entry.size;
  } else {
    j["size"] = entry.size;
  }
  if (!entry.comment.empty()) {
    j["comment"] = entry.comment;
  }
  if (entry.modified) {
    j["modified"] = int64_t(entry.modified);
  }
}

void to_json(json& j, const UserEntry& user) {
  j = json{{"id", user.id},
           {"name", user.name},
           {"icon", user.iconId},
           {"admin", user.isAdmin()},
           {"away", user.isAway()}};
}

void to_json(json& j, const ContentNode& node) {
  j = json{{"id", node.localId},
           {"title", node.title},
           {"path", joinRemotePath(node.path)},
           {"hasChildren", node.hasChildren}};
  if (node.parentId) {
    j["parent"] = *node.parentId;
  }
  if (!node.author.empty()) {
    j["author"] = node.author;
  }
  if (node.date) {
    j["date"] = int64_t(node.date);
  }
  if (node.body) {
    j["body"] = *node.body;
  }
}

void to_json(json& j, const HotlineError& error) {
  j = json{{"kind", errorKindName(error.getKind())}, {"message", error.what()}};
}

void to_json(json& j, const Transfer& transfer) {
  j = json{{"id", transfer.id},
           {"title", transfer.title},
           {"direction", transfer.direction == TransferDirection::UPLOAD
                             ? "upload"
                             : "download"},
           {"folder", transfer.isFolder},
           {"state", transferStateName(transfer.state)},
           {"transferred", transfer.transferredBytes},
           {"total", transfer.totalSize},
           {"server", transfer.serverId}};
  if (!transfer.localPath.empty()) {
    j["local"] = transfer.localPath.string();
  }
  if (transfer.speedEstimate) {
    j["bytesPerSecond"] = *transfer.speedEstimate;
  }
  if (transfer.error) {
    j["error"] = *transfer.error;
  }
}

void to_json(json& j, const ServerEvent& event) {
  j = json{{"event", serverEventTypeName(event.type)}};
  switch (event.type) {
    case ServerEventType::CHAT:
    case ServerEventType::BROADCAST:
    case ServerEventType::BOARD_UPDATED:
    case ServerEventType::DISCONNECT_MESSAGE:
      j["text"] = event.text;
      break;
    case ServerEventType::PRIVATE_MESSAGE:
      j["text"] = event.text;
      j["user"] = event.user;
      break;
    case ServerEventType::USER_CHANGED:
      j["user"] = event.user;
      break;
    case ServerEventType::USER_LEFT:
      j["userId"] = event.user.id;
      break;
    case ServerEventType::AGREEMENT:
      j["hasAgreement"] = event.hasAgreement;
      if (event.hasAgreement) j["text"] = event.text;
      break;
    case ServerEventType::PERMISSIONS_CHANGED: {
      json allowed = json::array();
      for (auto capability : allCapabilities()) {
        if (isAllowed(event.permissions, capability)) {
          allowed.push_back(capabilityName(capability));
        }
      }
      j["allowed"] = allowed;
    } break;
  }
}
}  // namespace hl
