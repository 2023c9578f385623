#ifndef __HL_PERMISSIONS_H__
#define __HL_PERMISSIONS_H__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Named capability bits of the Hotline access mask.  The value is
 * the bit index counted from the most significant bit of the 8 byte
 * UserAccess field.
 */
enum class Capability : int {
  DELETE_FILE = 0,
  UPLOAD_FILE = 1,
  DOWNLOAD_FILE = 2,
  RENAME_FILE = 3,
  MOVE_FILE = 4,
  CREATE_FOLDER = 5,
  DELETE_FOLDER = 6,
  RENAME_FOLDER = 7,
  MOVE_FOLDER = 8,
  READ_CHAT = 9,
  SEND_CHAT = 10,
  CREATE_USER = 14,
  DELETE_USER = 15,
  READ_USER = 16,
  MODIFY_USER = 17,
  NEWS_READ_ARTICLE = 20,
  NEWS_POST_ARTICLE = 21,
  DISCONNECT_USER = 22,
  GET_CLIENT_INFO = 24,
  UPLOAD_ANYWHERE = 25,
  SET_FILE_COMMENT = 28,
  BROADCAST = 32,
  UPLOAD_FOLDER = 38,
  DOWNLOAD_FOLDER = 39,
  SEND_PRIVATE_MESSAGE = 40,
};

/** @brief Servers gate the message board with the news bits. */
const Capability BOARD_READ_CAPABILITY = Capability::NEWS_READ_ARTICLE;
const Capability BOARD_POST_CAPABILITY = Capability::NEWS_POST_ARTICLE;

typedef uint64_t PermissionMask;

inline PermissionMask capabilityBit(Capability capability) {
  return uint64_t(1) << (63 - int(capability));
}

/** @brief True when `capability` is set in `permissions`. */
inline bool isAllowed(PermissionMask permissions, Capability capability) {
  return (permissions & capabilityBit(capability)) != 0;
}

/** @brief Any account administration bit counts as managing users. */
bool canManageUsers(PermissionMask permissions);

/** @brief Mask with exactly the given capabilities set. */
PermissionMask permissionMaskOf(const vector<Capability>& capabilities);

/**
 * @brief Reads the 8 byte UserAccess field.
 * @throws std::runtime_error if data is not 8 bytes long.
 */
PermissionMask permissionMaskFromWire(const string& data);
string permissionMaskToWire(PermissionMask permissions);

string capabilityName(Capability capability);
const vector<Capability>& allCapabilities();
}  // namespace hl

#endif  // __HL_PERMISSIONS_H__
