#ifndef __HL_CLIENT_CONFIG__
#define __HL_CLIENT_CONFIG__

#include "ClientSession.hpp"
#include "HotlineError.hpp"
#include "SocketEndpoint.hpp"

namespace hl {
/**
 * @brief Settings of the command line client.  Starts out with the
 * defaults, is overlaid with a config file and finally with the command
 * line.
 *
 * Config file layout:
 *
 *   [Server]     host, port, login, password, nick, icon
 *   [Transfers]  download_dir, workers, resume
 *   [Debug]      verbose, logdir
 */
class ClientConfig {
 public:
  ClientConfig();
  ~ClientConfig();

  /**
   * @brief Reads an ini file on top of the current values.  Keys missing
   * from the file keep their value.
   * @throws HotlineError INVALID_ARGUMENT when the file cannot be read or a
   * value does not parse.
   */
  void loadFile(const string& filename);

  /** @throws HotlineError INVALID_ARGUMENT without a host. */
  SocketEndpoint getEndpoint() const;
  Credentials getCredentials() const;

  string host;
  int port;
  string login;
  string password;
  string nickname;
  uint16_t iconId;

  string downloadDir;
  int workers;
  bool resume;

  int verbose;
  string logDir;
};

/** @brief "1", "true", "yes" and "on" (any case) are true. */
bool parseConfigBool(const string& value);
}  // namespace hl

#endif  // __HL_CLIENT_CONFIG__
