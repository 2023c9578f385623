#ifndef __HL_HOTLINE_ERROR_H__
#define __HL_HOTLINE_ERROR_H__

#include "Headers.hpp"

namespace hl {
enum class ErrorKind {
  /** @brief Host unreachable, connection refused or reset. */
  CONNECTIVITY,
  /** @brief The server sent bytes that do not frame. */
  PROTOCOL,
  /** @brief The server rejected the login. */
  AUTHENTICATION,
  /** @brief The local permission mask forbids the action; nothing was sent. */
  PERMISSION_DENIED_LOCAL,
  /** @brief The server refused a gated action. */
  PERMISSION_DENIED_REMOTE,
  /** @brief The server answered a request with a non-zero error code. */
  SERVER_REJECTED,
  /** @brief A data connection or local disk operation failed. */
  TRANSFER,
  /** @brief The control connection went away before the reply arrived. */
  CONNECTION_LOST,
  CANCELLED,
  TIMEOUT,
  INVALID_ARGUMENT,
};

inline string errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::CONNECTIVITY:
      return "ConnectivityError";
    case ErrorKind::PROTOCOL:
      return "ProtocolError";
    case ErrorKind::AUTHENTICATION:
      return "AuthenticationError";
    case ErrorKind::PERMISSION_DENIED_LOCAL:
      return "PermissionDenied(local)";
    case ErrorKind::PERMISSION_DENIED_REMOTE:
      return "PermissionDenied(remote)";
    case ErrorKind::SERVER_REJECTED:
      return "ServerRejected";
    case ErrorKind::TRANSFER:
      return "TransferError";
    case ErrorKind::CONNECTION_LOST:
      return "ConnectionLost";
    case ErrorKind::CANCELLED:
      return "Cancelled";
    case ErrorKind::TIMEOUT:
      return "Timeout";
    case ErrorKind::INVALID_ARGUMENT:
      return "InvalidArgument";
  }
  return "Unknown";
}

/**
 * @brief Every failure the client core reports: a kind the caller can
 * switch on plus a human readable message.
 */
class HotlineError : public std::runtime_error {
 public:
  HotlineError(ErrorKind _kind, const string& message)
      : std::runtime_error(message), kind(_kind) {}

  inline ErrorKind getKind() const { return kind; }

  string describe() const { return errorKindName(kind) + ": " + what(); }

 protected:
  ErrorKind kind;
};

inline ostream& operator<<(ostream& os, const HotlineError& error) {
  return os << error.describe();
}
}  // namespace hl

#endif  // __HL_HOTLINE_ERROR_H__
