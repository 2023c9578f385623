#ifndef __HL_HEADERS__
#define __HL_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#if __APPLE__
#include <sys/ucred.h>
#elif __FreeBSD__
#include <sys/socket.h>
#endif

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ThreadPool.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Hotline servers listen on 5500 and accept transfers on port + 1
static const int HOTLINE_DEFAULT_PORT = 5500;

// Icon sent by clients that have not chosen one
static const uint16_t HOTLINE_DEFAULT_ICON = 414;

// Version number this client reports in the login transaction
static const uint32_t HOTLINE_CLIENT_VERSION = 123;

// Servers from this version on understand the dedicated keepalive
// transaction.  Older ones are kept awake with a user list request.
static const uint16_t KEEP_ALIVE_TRANSACTION_MIN_SERVER_VERSION = 185;

// Seconds between two keepalive transactions
const int CLIENT_KEEP_ALIVE_DURATION = 180;

// Seconds the session waits for the login reply
const int LOGIN_TIMEOUT = 30;

// Milliseconds the session waits for a UserAccess push when the login
// reply carries no access privileges
const int LOGIN_ACCESS_WAIT_MS = 2000;

// Upper bound on a single control transaction body
const uint32_t MAX_TRANSACTION_SIZE = 16 * 1024 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef HL_VERSION
#define HL_VERSION "unknown"
#endif

namespace hl {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Splits a slash separated remote path into its segments, dropping
 * empty segments so that "/", "" and "//" all name the root.
 */
inline vector<string> splitRemotePath(const string &path) {
  vector<string> segments;
  for (const auto &segment : split(path, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

inline string joinRemotePath(const vector<string> &segments) {
  string s = "/";
  for (size_t a = 0; a < segments.size(); a++) {
    if (a) s += "/";
    s += segments[a];
  }
  return s;
}

/**
 * @brief Waits up to `seconds` for fd to become readable.
 */
inline bool waitOnSocketData(int fd, int seconds = 1) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = seconds;
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  if (select(fd + 1, &fdset, NULL, NULL, &tv) == -1) {
    if (GetErrno() == EINTR || GetErrno() == EBADF) {
      return false;
    }
    FATAL_FAIL(-1);
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace hl

#endif  // __HL_HEADERS__
