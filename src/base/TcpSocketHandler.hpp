#ifndef __HL_TCP_SOCKET_HANDLER__
#define __HL_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace hl {
/**
 * @brief Outbound IPv4/IPv6 connections built on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the
   * server, giving each resolved address `connectTimeoutSeconds`.
   */
  virtual int connect(const SocketEndpoint& endpoint);

  void setConnectTimeout(int seconds) { connectTimeoutSeconds = seconds; }

 protected:
  /** @brief Serializes resolver access across sessions and transfers. */
  recursive_mutex mutex;
  int connectTimeoutSeconds;

  /**
   * @brief Disables Nagle and sets linger on a connected socket.
   */
  void initSocket(int fd);
};
}  // namespace hl

#endif  // __HL_TCP_SOCKET_HANDLER__
