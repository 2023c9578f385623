#ifndef __HL_SERVER_EVENT_H__
#define __HL_SERVER_EVENT_H__

#include "HotlineObjects.hpp"
#include "Permissions.hpp"

namespace hl {
enum class ServerEventType {
  CHAT,
  PRIVATE_MESSAGE,
  BROADCAST,
  USER_CHANGED,
  USER_LEFT,
  AGREEMENT,
  PERMISSIONS_CHANGED,
  BOARD_UPDATED,
  DISCONNECT_MESSAGE,
};

string serverEventTypeName(ServerEventType type);

/**
 * @brief An unsolicited server transaction, decoded.  `type` selects which
 * of the payload members are meaningful:
 *
 * - CHAT, BROADCAST, BOARD_UPDATED, DISCONNECT_MESSAGE: text
 * - PRIVATE_MESSAGE: text, user (id and name of the sender)
 * - USER_CHANGED: user
 * - USER_LEFT: user.id
 * - AGREEMENT: text, hasAgreement
 * - PERMISSIONS_CHANGED: permissions
 */
struct ServerEvent {
  ServerEventType type = ServerEventType::CHAT;
  string text;
  UserEntry user;
  PermissionMask permissions = 0;
  bool hasAgreement = false;
};
}  // namespace hl

#endif  // __HL_SERVER_EVENT_H__
