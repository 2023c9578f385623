#ifndef __HL_SOCKET_ENDPOINT__
#define __HL_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Host and port of a Hotline server.
 *
 * The control connection uses `port`, file transfers use `port + 1`.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  explicit SocketEndpoint(const string &_name)
      : name(_name), port(HOTLINE_DEFAULT_PORT) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  /** @brief Endpoint of the data connection that carries transfers. */
  SocketEndpoint transferEndpoint() const {
    return SocketEndpoint(name, port + 1);
  }

  /**
   * @brief Parses "host" or "host:port".  Bracketed IPv6 literals
   * ("[::1]:5500") are accepted.
   * @throws std::runtime_error when the port is not a number in range.
   */
  static SocketEndpoint parse(const string &s) {
    string host = s;
    string portString;
    if (!s.empty() && s[0] == '[') {
      auto close = s.find(']');
      if (close == string::npos) {
        throw std::runtime_error("Invalid address: " + s);
      }
      host = s.substr(1, close - 1);
      if (close + 1 < s.length() && s[close + 1] == ':') {
        portString = s.substr(close + 2);
      }
    } else {
      auto colon = s.rfind(':');
      if (colon != string::npos && s.find(':') == colon) {
        host = s.substr(0, colon);
        portString = s.substr(colon + 1);
      }
    }
    if (host.empty()) {
      throw std::runtime_error("Invalid address: " + s);
    }
    if (portString.empty()) {
      return SocketEndpoint(host);
    }
    int port = 0;
    try {
      port = stoi(portString);
    } catch (const std::logic_error &) {
      throw std::runtime_error("Invalid port in address: " + s);
    }
    if (port <= 0 || port > 65534) {
      throw std::runtime_error("Invalid port in address: " + s);
    }
    return SocketEndpoint(host, port);
  }

  bool operator==(const SocketEndpoint &other) const {
    return name == other.name && port == other.port;
  }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace hl

#endif  // __HL_SOCKET_ENDPOINT__
