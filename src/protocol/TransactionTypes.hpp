#ifndef __HL_TRANSACTION_TYPES_H__
#define __HL_TRANSACTION_TYPES_H__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Transaction type codes carried in every transaction header.
 *
 * Types marked "push" are sent unsolicited by the server; the rest are
 * requests issued by the client and answered with a reply of the same
 * type.
 */
enum class TransactionType : uint16_t {
  REPLY = 0,
  /** @brief Fetch the whole message board as one text blob. */
  GET_MESSAGES = 101,
  /** @brief push: the message board has a new post. */
  NEW_MESSAGE = 102,
  /** @brief Post to the message board. */
  OLD_POST_NEWS = 103,
  /** @brief push: private message, or admin broadcast without a user id. */
  SERVER_MESSAGE = 104,
  SEND_CHAT = 105,
  /** @brief push: one line of public chat. */
  CHAT_MESSAGE = 106,
  LOGIN = 107,
  SEND_INSTANT_MESSAGE = 108,
  /** @brief push: the server agreement the user must accept. */
  SHOW_AGREEMENT = 109,
  DISCONNECT_USER = 110,
  /** @brief push: the server is about to drop this client. */
  DISCONNECT_MESSAGE = 111,
  AGREED = 121,
  GET_FILE_NAME_LIST = 200,
  DOWNLOAD_FILE = 202,
  UPLOAD_FILE = 203,
  DELETE_FILE = 204,
  NEW_FOLDER = 205,
  GET_FILE_INFO = 206,
  SET_FILE_INFO = 207,
  DOWNLOAD_FOLDER = 210,
  UPLOAD_FOLDER = 213,
  GET_USER_NAME_LIST = 300,
  /** @brief push: a user joined or changed name/icon/flags. */
  NOTIFY_USER_CHANGE = 301,
  /** @brief push: a user left. */
  NOTIFY_USER_DELETE = 302,
  SET_CLIENT_USER_INFO = 304,
  /** @brief push: replaces the client's access privileges. */
  USER_ACCESS = 354,
  USER_BROADCAST = 355,
  GET_NEWS_CAT_NAME_LIST = 370,
  GET_NEWS_ART_NAME_LIST = 371,
  GET_NEWS_ART_DATA = 400,
  POST_NEWS_ART = 410,
  KEEP_ALIVE = 500,
};

/**
 * @brief Field (parameter) tags used inside a transaction body.
 */
enum class FieldType : uint16_t {
  ERROR_TEXT = 100,
  DATA = 101,
  USER_NAME = 102,
  USER_ID = 103,
  USER_ICON_ID = 104,
  USER_LOGIN = 105,
  USER_PASSWORD = 106,
  REFERENCE_NUMBER = 107,
  TRANSFER_SIZE = 108,
  CHAT_OPTIONS = 109,
  USER_ACCESS = 110,
  USER_FLAGS = 112,
  OPTIONS = 113,
  WAITING_COUNT = 116,
  SERVER_AGREEMENT = 150,
  NO_SERVER_AGREEMENT = 154,
  VERSION = 160,
  SERVER_NAME = 162,
  FILE_NAME_WITH_INFO = 200,
  FILE_NAME = 201,
  FILE_PATH = 202,
  FILE_RESUME_DATA = 203,
  FILE_TRANSFER_OPTIONS = 204,
  FILE_TYPE_STRING = 205,
  FILE_CREATOR_STRING = 206,
  FILE_SIZE = 207,
  FILE_CREATE_DATE = 208,
  FILE_MODIFY_DATE = 209,
  FILE_COMMENT = 210,
  FILE_NEW_NAME = 211,
  FILE_NEW_PATH = 212,
  FOLDER_ITEM_COUNT = 220,
  USER_NAME_WITH_INFO = 300,
  NEWS_ART_LIST_DATA = 321,
  NEWS_CAT_NAME = 322,
  NEWS_CAT_LIST_DATA_15 = 323,
  NEWS_PATH = 325,
  NEWS_ART_ID = 326,
  NEWS_ART_DATA_FLAVOR = 327,
  NEWS_ART_TITLE = 328,
  NEWS_ART_POSTER = 329,
  NEWS_ART_DATE = 330,
  NEWS_ART_DATA = 333,
  NEWS_ART_FLAGS = 334,
  NEWS_ART_PARENT_ART = 335,
};

/** @brief Readable name of a transaction type, for logs. */
string transactionTypeName(TransactionType type);

inline ostream& operator<<(ostream& os, TransactionType type) {
  return os << transactionTypeName(type) << "(" << uint16_t(type) << ")";
}

inline ostream& operator<<(ostream& os, FieldType type) {
  return os << uint16_t(type);
}
}  // namespace hl

#endif  // __HL_TRANSACTION_TYPES_H__
