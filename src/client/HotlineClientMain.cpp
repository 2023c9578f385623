#include <cxxopts.hpp>
#include <iomanip>

#include "ClientConfig.hpp"
#include "ClientSession.hpp"
#include "FileListingService.hpp"
#include "Headers.hpp"
#include "JsonOutput.hpp"
#include "LogHandler.hpp"
#include "TcpSocketHandler.hpp"
#include "ThreadedContentStore.hpp"
#include "TransferManager.hpp"

using namespace hl;

namespace {
const std::chrono::seconds REQUEST_TIMEOUT(60);

bool jsonOutput = false;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

template <class T>
T waitForResult(std::future<T>& result, const string& what) {
  if (result.wait_for(REQUEST_TIMEOUT) != std::future_status::ready) {
    throw HotlineError(ErrorKind::TIMEOUT, what + " timed out");
  }
  return result.get();
}

template <class T>
void fulfill(std::promise<T>* promise, const T& value,
             const optional<HotlineError>& error) {
  if (error) {
    promise->set_exception(std::make_exception_ptr(*error));
  } else {
    promise->set_value(value);
  }
}

void printJson(const json& j) { CLOG(INFO, "stdout") << j.dump(2) << endl; }

string formatSize(uint64_t bytes) {
  ostringstream ss;
  if (bytes >= 1024 * 1024) {
    ss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0))
       << "M";
  } else if (bytes >= 1024) {
    ss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << "K";
  } else {
    ss << bytes;
  }
  return ss.str();
}

vector<FileEntry> listFolder(FileListingService* listing,
                             const vector<string>& path) {
  auto promise = make_shared<std::promise<vector<FileEntry>>>();
  auto result = promise->get_future();
  listing->listFiles(path, [promise](const vector<FileEntry>& entries,
                                     const optional<HotlineError>& error) {
    fulfill(promise.get(), entries, error);
  });
  return waitForResult(result, "Listing " + joinRemotePath(path));
}

/** @brief Looks a remote path up in its parent folder. */
FileEntry lookupEntry(FileListingService* listing, const string& remotePath) {
  vector<string> path = splitRemotePath(remotePath);
  if (path.empty()) {
    throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                       "The root folder cannot be transferred");
  }
  string name = path.back();
  path.pop_back();
  for (const auto& entry : listFolder(listing, path)) {
    if (entry.name == name) {
      return entry;
    }
  }
  throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                     remotePath + " does not exist on the server");
}

void printListing(const vector<FileEntry>& entries) {
  if (jsonOutput) {
    printJson(json(entries));
    return;
  }
  for (const auto& entry : entries) {
    if (entry.isFolder) {
      CLOG(INFO, "stdout") << "d " << setw(8) << entry.size << "  "
                           << entry.name << "/" << endl;
    } else {
      CLOG(INFO, "stdout") << "- " << setw(8) << formatSize(entry.size)
                           << "  " << entry.name << endl;
    }
  }
}

vector<ContentNode> listContent(ThreadedContentStore* store,
                                const vector<string>& path) {
  auto promise = make_shared<std::promise<vector<ContentNode>>>();
  auto result = promise->get_future();
  store->listChildren(path, [promise](const vector<ContentNode>& nodes,
                                      const optional<HotlineError>& error) {
    fulfill(promise.get(), nodes, error);
  });
  return waitForResult(result, "Listing " + joinRemotePath(path));
}

void postContent(ThreadedContentStore* store, const vector<string>& path,
                 const string& title, const string& body) {
  auto promise = make_shared<std::promise<bool>>();
  auto result = promise->get_future();
  store->post(path, nullopt, title, body,
              [promise](const optional<HotlineError>& error) {
                fulfill(promise.get(), true, error);
              });
  waitForResult(result, "Posting");
  if (!jsonOutput) {
    CLOG(INFO, "stdout") << "Posted" << endl;
  }
}

void printNews(const vector<ContentNode>& nodes) {
  if (jsonOutput) {
    printJson(json(nodes));
    return;
  }
  for (const auto& node : nodes) {
    if (node.remoteId == 0) {
      CLOG(INFO, "stdout") << "+ " << node.title << endl;
    } else {
      CLOG(INFO, "stdout") << (node.parentId ? "    " : "")
                           << setw(6) << node.remoteId << "  " << node.title
                           << (node.author.empty() ? "" : " (" + node.author +
                                                              ")")
                           << endl;
    }
  }
}

void printBoard(const vector<ContentNode>& posts) {
  if (jsonOutput) {
    printJson(json(posts));
    return;
  }
  for (const auto& post : posts) {
    CLOG(INFO, "stdout") << (post.body ? *post.body : post.title) << endl
                         << "__________________________________________________"
                         << endl;
  }
}

void printUsers(const vector<UserEntry>& users) {
  if (jsonOutput) {
    printJson(json(users));
    return;
  }
  for (const auto& user : users) {
    CLOG(INFO, "stdout") << setw(5) << user.id << "  " << user.name
                         << (user.isAdmin() ? " [admin]" : "")
                         << (user.isAway() ? " [away]" : "") << endl;
  }
}

void printEvent(const ServerEvent& event) {
  if (jsonOutput) {
    CLOG(INFO, "stdout") << json(event).dump() << endl;
    return;
  }
  switch (event.type) {
    case ServerEventType::CHAT:
      CLOG(INFO, "stdout") << event.text << endl;
      break;
    case ServerEventType::PRIVATE_MESSAGE:
      CLOG(INFO, "stdout") << "[private from " << event.user.name << "] "
                           << event.text << endl;
      break;
    case ServerEventType::BROADCAST:
      CLOG(INFO, "stdout") << "[broadcast] " << event.text << endl;
      break;
    case ServerEventType::USER_CHANGED:
      CLOG(INFO, "stdout") << "* " << event.user.name << " ("
                           << event.user.id << ") is here" << endl;
      break;
    case ServerEventType::USER_LEFT:
      CLOG(INFO, "stdout") << "* user " << event.user.id << " left" << endl;
      break;
    case ServerEventType::AGREEMENT:
      if (event.hasAgreement) {
        CLOG(INFO, "stdout") << event.text << endl;
      }
      break;
    case ServerEventType::PERMISSIONS_CHANGED:
      CLOG(INFO, "stdout") << "* permissions changed" << endl;
      break;
    case ServerEventType::BOARD_UPDATED:
      CLOG(INFO, "stdout") << "* new board post" << endl;
      break;
    case ServerEventType::DISCONNECT_MESSAGE:
      CLOG(INFO, "stdout") << "* disconnected: " << event.text << endl;
      break;
  }
}

/**
 * @brief Drives one transfer to its end on the main thread, printing
 * progress at most once a second.
 * @return the process exit code.
 */
int runTransfer(TransferManager* manager, uint64_t transferId) {
  auto dispatcher = make_shared<QueuedDispatcher>();
  auto lastPrint = std::chrono::steady_clock::now();
  TransferCallbacks callbacks;
  callbacks.onProgress = [transferId, &lastPrint](const Transfer& transfer) {
    auto now = std::chrono::steady_clock::now();
    if (jsonOutput || transfer.id != transferId ||
        now - lastPrint < std::chrono::seconds(1)) {
      return;
    }
    lastPrint = now;
    ostringstream ss;
    ss << transfer.title << ": " << formatSize(transfer.transferredBytes)
       << " / " << formatSize(transfer.totalSize);
    if (transfer.speedEstimate) {
      ss << " at " << formatSize(uint64_t(*transfer.speedEstimate)) << "/s";
    }
    if (transfer.etaEstimate) {
      ss << ", " << int(*transfer.etaEstimate) << "s left";
    }
    CLOG(INFO, "stdout") << ss.str() << endl;
  };
  callbacks.onPreviewReady = [transferId](const Transfer& transfer,
                                          const string& bytes) {
    if (transfer.id != transferId) return;
    if (jsonOutput) {
      json j = transfer;
      j["preview"] = bytes;
      printJson(j);
    } else {
      CLOG(INFO, "stdout") << bytes << endl;
    }
  };
  int subscription = manager->subscribe(dispatcher, callbacks);
  while (!manager->waitForTransfer(transferId, std::chrono::milliseconds(250))) {
    dispatcher->runPending();
  }
  dispatcher->runPending();
  manager->unsubscribe(subscription);

  auto transfer = manager->getTransfer(transferId);
  if (!transfer) {
    STERROR << "Transfer " << transferId << " vanished";
    return 1;
  }
  if (!transfer->isPreview || transfer->state != TransferState::COMPLETED) {
    if (jsonOutput) {
      printJson(json(*transfer));
    } else if (transfer->error) {
      CLOG(INFO, "stdout") << transfer->title << ": "
                           << transfer->error->describe() << endl;
    } else {
      CLOG(INFO, "stdout") << transfer->title << ": "
                           << transferStateName(transfer->state) << " ("
                           << formatSize(transfer->transferredBytes) << ")"
                           << endl;
    }
  }
  return transfer->state == TransferState::COMPLETED ? 0 : 1;
}

void listen(shared_ptr<ClientSession> session) {
  mutex listenMutex;
  condition_variable listenCondition;
  bool done = false;
  for (auto type :
       {ServerEventType::CHAT, ServerEventType::PRIVATE_MESSAGE,
        ServerEventType::BROADCAST, ServerEventType::USER_CHANGED,
        ServerEventType::USER_LEFT, ServerEventType::PERMISSIONS_CHANGED,
        ServerEventType::BOARD_UPDATED, ServerEventType::DISCONNECT_MESSAGE}) {
    session->subscribe(type, printEvent);
  }
  int stateSubscription = session->subscribeState(
      [&](SessionState state, const optional<HotlineError>& error) {
        if (state == SessionState::LOGGED_IN) return;
        if (error && !jsonOutput) {
          CLOG(INFO, "stdout") << error->describe() << endl;
        }
        lock_guard<mutex> guard(listenMutex);
        done = true;
        listenCondition.notify_all();
      });
  if (!jsonOutput) {
    CLOG(INFO, "stdout") << "Listening, press ctrl+c to quit" << endl;
  }
  unique_lock<mutex> lock(listenMutex);
  listenCondition.wait(lock, [&done] { return done; });
  lock.unlock();
  session->unsubscribe(stateSubscription);
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  hl::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, hl::InterruptSignalHandler);
  // A dropped data connection surfaces as EPIPE
  ::signal(SIGPIPE, SIG_IGN);

  if (sodium_init() == -1) {
    CLOG(INFO, "stdout") << "libsodium failed to initialize" << endl;
    exit(1);
  }

  cxxopts::Options options("hlclient", "Command line Hotline client");
  int exitCode = 0;
  try {
    options.positional_help("host[:port]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Server to connect to", cxxopts::value<std::string>())  //
        ("login", "Account name", cxxopts::value<std::string>())        //
        ("password", "Account password", cxxopts::value<std::string>())  //
        ("nick", "Nickname shown to other users",
         cxxopts::value<std::string>())                                 //
        ("icon", "Icon id", cxxopts::value<int>())                      //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())                                 //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())                                 //
        ("logtostdout", "Write log to stdout")                          //
        ("v,verbose", "Enable verbose logging", cxxopts::value<int>())  //
        ("json", "Print results as JSON")                               //
        ("ls", "List a remote folder", cxxopts::value<std::string>())   //
        ("get", "Download a remote file", cxxopts::value<std::string>())  //
        ("put", "Upload a local file", cxxopts::value<std::string>())     //
        ("getfolder", "Download a remote folder",
         cxxopts::value<std::string>())  //
        ("putfolder", "Upload a local folder",
         cxxopts::value<std::string>())  //
        ("to", "Destination: remote folder for uploads, local folder for "
               "downloads",
         cxxopts::value<std::string>())  //
        ("preview", "Print the start of a remote file",
         cxxopts::value<std::string>())  //
        ("news", "List a news bundle or category",
         cxxopts::value<std::string>()->implicit_value("/"))  //
        ("board", "Print the message board")                  //
        ("post", "Post to the message board",
         cxxopts::value<std::string>())  //
        ("postnews", "Post an article into a news category",
         cxxopts::value<std::string>())                                  //
        ("title", "Title of a post", cxxopts::value<std::string>())      //
        ("body", "Text of a news article", cxxopts::value<std::string>())  //
        ("chat", "Send a chat line", cxxopts::value<std::string>())      //
        ("users", "List the users online")                               //
        ("listen", "Print chat and server events until interrupted");

    options.parse_positional({"host"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "hlclient version " << HL_VERSION << endl;
      exit(0);
    }

    jsonOutput = result.count("json") > 0;

    ClientConfig config;
    if (result.count("cfgfile")) {
      config.loadFile(result["cfgfile"].as<string>());
    }
    if (result.count("host")) {
      SocketEndpoint endpoint =
          SocketEndpoint::parse(result["host"].as<string>());
      config.host = endpoint.getName();
      config.port = endpoint.getPort();
    }
    if (result.count("login")) {
      config.login = result["login"].as<string>();
    }
    if (result.count("password")) {
      config.password = result["password"].as<string>();
    }
    if (result.count("nick")) {
      config.nickname = result["nick"].as<string>();
    }
    if (result.count("icon")) {
      int icon = result["icon"].as<int>();
      if (icon < 0 || icon > 0xFFFF) {
        CLOG(INFO, "stdout") << "Invalid icon id: " << icon << endl;
        exit(1);
      }
      config.iconId = uint16_t(icon);
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }

    el::Loggers::setVerboseLevel(config.verbose);
    LogHandler::setupLogFiles(&defaultConf, config.logDir, "hlclient",
                              result.count("logtostdout") > 0);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("client-main");

    if (config.host.empty()) {
      CLOG(INFO, "stdout") << "Missing host to connect to" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    // The manager outlives the session so late replies find it
    TransferManager transferManager(config.workers, config.resume);
    shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
    auto session = make_shared<ClientSession>(socketHandler);
    weak_ptr<ClientSession> weakSession = session;
    session->subscribe(
        ServerEventType::AGREEMENT, [weakSession](const ServerEvent& event) {
          printEvent(event);
          auto agreeingSession = weakSession.lock();
          if (!agreeingSession) return;
          agreeingSession->acceptAgreement([](const Reply& reply) {
            if (!reply.ok()) {
              LOG(WARNING) << "Agreement not accepted: "
                           << reply.error->describe();
            }
          });
        });

    try {
      session->connect(config.getEndpoint(), config.getCredentials());
      if (!jsonOutput) {
        CLOG(INFO, "stdout") << "Connected to " << session->getServerName()
                             << endl;
      }

      FileListingService listing(session);
      string destination =
          result.count("to") ? result["to"].as<string>() : "";

      if (result.count("ls")) {
        printListing(listFolder(&listing,
                                splitRemotePath(result["ls"].as<string>())));
      } else if (result.count("get") || result.count("getfolder")) {
        bool folder = result.count("getfolder") > 0;
        FileEntry entry = lookupEntry(
            &listing, result[folder ? "getfolder" : "get"].as<string>());
        fs::path target = destination.empty() ? fs::path(config.downloadDir)
                                              : fs::path(destination);
        uint64_t id =
            folder ? transferManager.startFolderDownload(session, entry, target)
                   : transferManager.startDownload(session, entry, target);
        exitCode = runTransfer(&transferManager, id);
      } else if (result.count("put") || result.count("putfolder")) {
        bool folder = result.count("putfolder") > 0;
        fs::path source = result[folder ? "putfolder" : "put"].as<string>();
        vector<string> remote = splitRemotePath(destination);
        uint64_t id =
            folder ? transferManager.startFolderUpload(session, source, remote)
                   : transferManager.startUpload(session, source, remote);
        exitCode = runTransfer(&transferManager, id);
      } else if (result.count("preview")) {
        FileEntry entry =
            lookupEntry(&listing, result["preview"].as<string>());
        exitCode = runTransfer(&transferManager,
                               transferManager.startPreview(session, entry));
      } else if (result.count("news")) {
        ThreadedContentStore store(make_shared<NewsContentSource>(session));
        printNews(listContent(&store,
                              splitRemotePath(result["news"].as<string>())));
      } else if (result.count("board")) {
        ThreadedContentStore store(
            make_shared<MessageBoardContentSource>(session));
        printBoard(listContent(&store, {}));
      } else if (result.count("post")) {
        ThreadedContentStore store(
            make_shared<MessageBoardContentSource>(session));
        postContent(&store, {},
                    result.count("title") ? result["title"].as<string>() : "",
                    result["post"].as<string>());
      } else if (result.count("postnews")) {
        if (!result.count("title") || !result.count("body")) {
          throw HotlineError(ErrorKind::INVALID_ARGUMENT,
                             "--postnews needs --title and --body");
        }
        auto source = make_shared<NewsContentSource>(session);
        ThreadedContentStore store(source);
        vector<string> category =
            splitRemotePath(result["postnews"].as<string>());
        postContent(&store, category, result["title"].as<string>(),
                    result["body"].as<string>());
      } else if (result.count("chat")) {
        session->sendChat(result["chat"].as<string>());
      } else if (result.count("users")) {
        auto promise = make_shared<std::promise<vector<UserEntry>>>();
        auto users = promise->get_future();
        session->getUserList([promise](const vector<UserEntry>& entries,
                                       const optional<HotlineError>& error) {
          fulfill(promise.get(), entries, error);
        });
        printUsers(waitForResult(users, "User list"));
      } else if (result.count("listen")) {
        listen(session);
      }
    } catch (const HotlineError& error) {
      if (jsonOutput) {
        printJson(json{{"error", error}});
      } else {
        CLOG(INFO, "stdout") << error.describe() << endl;
      }
      exitCode = 1;
    }
    session->disconnect();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const HotlineError& error) {
    CLOG(INFO, "stdout") << error.describe() << endl;
    exitCode = 1;
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
