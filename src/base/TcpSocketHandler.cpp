#include "TcpSocketHandler.hpp"

namespace hl {
TcpSocketHandler::TcpSocketHandler() : connectTimeoutSeconds(10) {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
#if __NetBSD__
  hints.ai_flags = (AI_CANONNAME | AI_ADDRCONFIG);
#else
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG | AI_ALL);
#endif
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname = endpoint.getName();

  int rc;
  {
    lock_guard<std::recursive_mutex> guard(mutex);
    // (re)initialize the DNS system
    ::res_init();
    rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  }

  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Nonblocking just for the connect phase
    setBlocking(sockFd, false);
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = connectTimeoutSeconds;
    tv.tv_usec = 0;
    VLOG(4) << "Before selecting sockFd";
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    if (!FD_ISSET(sockFd, &fdset)) {
      LOG(INFO) << "Timed out connecting to " << endpoint;
      ::close(sockFd);
      sockFd = -1;
      continue;
    }

    int so_error;
    socklen_t len = sizeof so_error;
    FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));
    if (so_error != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error
                << " " << strerror(so_error);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }

    if (p->ai_canonname) {
      LOG(INFO) << "Connected to server: " << p->ai_canonname << " using fd "
                << sockFd;
    } else {
      LOG(INFO) << "Connected to server: " << endpoint << " using fd "
                << sockFd;
    }
    // Make sure that socket becomes blocking once it's attached to a server.
    setBlocking(sockFd, true);
    initSocket(sockFd);
    break;  // if we get here, we must have connected successfully
  }
  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
  } else {
    addToActiveSockets(sockFd);
  }

  freeaddrinfo(results);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
  struct linger so_linger;
  so_linger.l_onoff = 1;
  so_linger.l_linger = 5;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, SOL_SOCKET, SO_LINGER, &so_linger, sizeof so_linger));
}
}  // namespace hl
