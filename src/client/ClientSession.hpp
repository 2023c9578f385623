#ifndef __HL_CLIENT_SESSION__
#define __HL_CLIENT_SESSION__

#include "Headers.hpp"
#include "HotlineError.hpp"
#include "Permissions.hpp"
#include "ServerEvent.hpp"
#include "SocketHandler.hpp"
#include "Transaction.hpp"
#include "TransactionCodec.hpp"

namespace hl {
enum class SessionState {
  DISCONNECTED,
  CONNECTING,
  LOGGING_IN,
  LOGGED_IN,
  FAILED,
};

string sessionStateName(SessionState state);

inline ostream& operator<<(ostream& os, SessionState state) {
  return os << sessionStateName(state);
}

/**
 * @brief Login identity supplied by the bookmark store.  The password is
 * wiped from memory when the credentials go away.
 */
struct Credentials {
  string login = "guest";
  string password;
  string nickname = "unnamed";
  uint16_t iconId = HOTLINE_DEFAULT_ICON;

  ~Credentials() {
    if (!password.empty()) {
      sodium_memzero(&password[0], password.size());
    }
  }
};

/**
 * @brief Outcome of a request: the reply transaction, or the error that
 * resolved the pending slot instead.
 */
struct Reply {
  Transaction transaction;
  optional<HotlineError> error;

  bool ok() const { return !error; }
};

typedef function<void(const Reply&)> ReplyCallback;
typedef function<void(const ServerEvent&)> EventHandler;
typedef function<void(SessionState, const optional<HotlineError>&)>
    StateHandler;

/**
 * @brief The control connection to one Hotline server.
 *
 * ClientSession owns the socket, performs the handshake and login, keeps
 * the table of requests waiting for a reply and runs the read loop that
 * resolves them.  Replies are matched by transaction id only, so any
 * number of requests may be outstanding and complete in any order.
 * Unsolicited transactions are decoded into ServerEvents and handed to
 * the subscribers of that event type in the order the server sent them.
 *
 * Completions and event handlers run on the reader thread.
 */
class ClientSession {
 public:
  ClientSession(shared_ptr<SocketHandler> _socketHandler);

  virtual ~ClientSession();

  /**
   * @brief Opens the control connection and logs in.  Blocks until the
   * login reply arrives and, when the reply carries no access privileges,
   * until the server pushes them (bounded by the access timeout).  The
   * session is LOGGED_IN as soon as the reply is read, so event handlers
   * running meanwhile can already send requests.
   * @throws HotlineError CONNECTIVITY, PROTOCOL, AUTHENTICATION or TIMEOUT;
   * the session is left FAILED.
   */
  void connect(const SocketEndpoint& endpoint, const Credentials& credentials);

  /**
   * @brief Closes the connection.  Every pending request is resolved with
   * CONNECTION_LOST and the state becomes DISCONNECTED.
   */
  void disconnect();

  /**
   * @brief Sends a request and registers `callback` for its reply.  Never
   * blocks on the reply.  If the session is not logged in, or the
   * connection drops before the reply arrives, the callback receives a
   * CONNECTION_LOST error.
   * @return The transaction id assigned to the request.
   */
  uint32_t sendTransaction(Transaction transaction, ReplyCallback callback);

  /**
   * @brief Like sendTransaction, but first checks `capability` against the
   * permission mask.
   * @throws HotlineError PERMISSION_DENIED_LOCAL before anything is sent.
   */
  uint32_t sendGatedTransaction(Capability capability, Transaction transaction,
                                ReplyCallback callback);

  /**
   * @brief Sends a transaction the server does not answer.
   * @return false if the session is not logged in or the write failed.
   */
  bool sendWithoutReply(Transaction transaction);

  /** @throws HotlineError PERMISSION_DENIED_LOCAL when not allowed. */
  void requireCapability(Capability capability) const;

  int subscribe(ServerEventType type, EventHandler handler);
  int subscribeState(StateHandler handler);
  void unsubscribe(int subscriptionId);

  void getUserList(function<void(const vector<UserEntry>&,
                                 const optional<HotlineError>&)>
                       callback);
  void sendChat(const string& text);
  void sendInstantMessage(uint16_t userId, const string& text,
                          ReplyCallback callback);
  void broadcast(const string& text, ReplyCallback callback);
  void setClientUserInfo(const string& nickname, uint16_t iconId);
  /** @brief Sends Agreed with the session's nickname and icon. */
  void acceptAgreement(ReplyCallback callback);

  SessionState getState() const;
  PermissionMask getPermissions() const;
  string getServerName() const;
  uint16_t getServerVersion() const;
  bool isAgreementAccepted() const;
  optional<string> getAgreementText() const;
  inline const SocketEndpoint& getEndpoint() const { return endpoint; }
  /** @brief Identity used to associate transfers with this server. */
  inline string getServerId() const {
    ostringstream ss;
    ss << endpoint;
    return ss.str();
  }
  inline shared_ptr<SocketHandler> getSocketHandler() { return socketHandler; }

  void setKeepAliveInterval(std::chrono::milliseconds interval) {
    keepAliveInterval = interval;
  }
  void setLoginTimeout(std::chrono::milliseconds timeout) {
    loginTimeout = timeout;
  }
  void setAccessTimeout(std::chrono::milliseconds timeout) {
    accessTimeout = timeout;
  }

  /** @brief Number of requests still waiting for a reply. */
  size_t pendingCount();

 protected:
  struct PendingReply {
    ReplyCallback callback;
    TransactionType type;
    bool gated;
  };

  void handshake();
  Transaction buildLoginTransaction() const;
  /** @brief Waits until the permission mask is known or the login is
   * over. */
  void waitForAccess();
  uint32_t registerAndSend(Transaction transaction, ReplyCallback callback,
                           bool gated);
  bool writeTransaction(const Transaction& transaction);

  void readLoop();
  void keepAliveLoop();
  void dispatch(const Transaction& transaction);
  void resolveReply(const Transaction& transaction);
  void handlePush(const Transaction& transaction);
  void publish(const ServerEvent& event);

  /**
   * @brief Stops accepting requests, wakes the threads, fails every
   * pending slot with `error` and moves to `newState`.  Idempotent; safe
   * to call from the reader thread.
   */
  void closeConnection(SessionState newState, const HotlineError& error);
  /** @brief Joins the threads and releases the socket.  Not callable from
   * the reader thread. */
  void joinThreadsAndClose();
  void setState(SessionState newState, const optional<HotlineError>& error);
  /** @brief Calls every state handler; a throwing handler is logged. */
  void notifyStateSubscribers(SessionState newState,
                              const optional<HotlineError>& error);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  Credentials credentials;
  int socketFd;
  TransactionCodec codec;

  mutable recursive_mutex stateMutex;
  SessionState state;
  PermissionMask permissions;
  string serverName;
  uint16_t serverVersion;
  bool agreementAccepted;
  optional<string> agreementText;

  /** @brief Serializes frames onto the socket. */
  mutex writeMutex;

  /** @brief Guards pendingReplies and connectionOpen. */
  mutex pendingMutex;
  map<uint32_t, PendingReply> pendingReplies;
  bool connectionOpen;
  atomic<uint32_t> nextTransactionId;

  recursive_mutex subscriberMutex;
  int nextSubscriptionId;
  map<int, pair<ServerEventType, EventHandler>> eventSubscribers;
  map<int, StateHandler> stateSubscribers;

  atomic<bool> shuttingDown;
  std::shared_ptr<std::thread> readerThread;
  std::shared_ptr<std::thread> keepAliveThread;
  mutex keepAliveMutex;
  condition_variable keepAliveCondition;
  std::chrono::milliseconds keepAliveInterval;
  std::chrono::milliseconds loginTimeout;

  /** @brief Signalled under stateMutex when the access mask arrives or
   * the state changes. */
  condition_variable_any accessCondition;
  std::chrono::milliseconds accessTimeout;
  bool accessKnown;
};
}  // namespace hl

#endif  // __HL_CLIENT_SESSION__
