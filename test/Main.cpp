#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace hl;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      hl::LogHandler::setupLogHandler(&argc, &argv);
  hl::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  hl::HandleTerminate();
  // Tests close data connections under the client's feet
  ::signal(SIGPIPE, SIG_IGN);

  if (sodium_init() == -1) {
    CLOG(INFO, "stdout") << "libsodium failed to initialize" << endl;
    return 1;
  }

  string logDirectoryPattern = GetTempDirectory() + string("hl_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  hl::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log");

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
