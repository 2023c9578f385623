#ifndef __HL_SOCKET_HANDLER__
#define __HL_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace hl {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 *
 * Both the control connection and every transfer data connection go through
 * a SocketHandler so tests can substitute socketpairs for TCP.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the internal transfer timeout while
   * waiting.
   * @throws std::runtime_error when the peer closes the socket, on read
   * errors, or on timeout.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  inline string readString(int fd, size_t count, bool timeout) {
    string s(count, '\0');
    if (count) {
      readAll(fd, &s[0], count, timeout);
    }
    return s;
  }

  inline void writeString(int fd, const string& s, bool timeout) {
    if (!s.empty()) {
      writeAllOrThrow(fd, s.data(), s.length(), timeout);
    }
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Shuts down both directions of fd without releasing it, waking up
   * any thread blocked on it.  The owner still calls close().
   */
  virtual void interrupt(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace hl

#endif  // __HL_SOCKET_HANDLER__
