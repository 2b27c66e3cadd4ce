#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace at;

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
      at::LogHandler::setupLogHandler(&argc, &argv);
  at::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  at::HandleTerminate();

  // Writes to a closed client socket in the API tests must not kill the run
  ::signal(SIGPIPE, SIG_IGN);

  string logDirectory = makeTempDirectory("at_test");
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  LoggingConfig logging;
  logging.logDirectory = logDirectory;
  logging.redirectStderr = false;
  at::LogHandler::configureLogging(&defaultConf, logging, "log");

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(logDirectory, ec);
  return result;
}
