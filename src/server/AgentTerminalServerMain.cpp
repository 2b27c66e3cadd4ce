#include <cxxopts.hpp>

#include "ApiServer.hpp"
#include "CredentialCipher.hpp"
#include "LogHandler.hpp"
#include "PseudoUserTerminal.hpp"
#include "SqliteSessionStore.hpp"
#include "StoreWriter.hpp"

using namespace at;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  at::HandleTerminate();

  // Shutdown signals are blocked before any thread starts so they are only
  // ever delivered to the sigwait below
  sigset_t shutdownSignals;
  sigemptyset(&shutdownSignals);
  sigaddset(&shutdownSignals, SIGINT);
  sigaddset(&shutdownSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &shutdownSignals, NULL);
  // A client hanging up mid-response must not kill the server
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("atserver",
                           "Multi-tenant host for interactive CLI agents");
  ServerConfig config;
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("host", "Address to listen on", cxxopts::value<string>())  //
        ("port", "Port to listen on", cxxopts::value<int>())        //
        ("workspace", "Base directory for session workspaces",
         cxxopts::value<string>())  //
        ("db", "Path of the SQLite session database",
         cxxopts::value<string>())                           //
        ("release", "Refuse to start without an auth token")  //
        ("logtostdout", "log to stdout")                      //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("generatekey", "Print a new encryption key and exit")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "atserver version " << AT_VERSION << endl;
      exit(0);
    }
    if (result.count("generatekey")) {
      CLOG(INFO, "stdout") << CredentialCipher::generateHexKey() << endl;
      exit(0);
    }

    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      config.loadIniFile(cfgfilename);
    }
    config.applyEnvironment();

    // Command line options take priority over the config file
    if (result.count("host")) {
      config.network.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.network.port = result["port"].as<int>();
    }
    if (result.count("workspace")) {
      config.session.workspaceBasePath = result["workspace"].as<string>();
    }
    if (result.count("db")) {
      config.store.sqlitePath = result["db"].as<string>();
    }
    if (result.count("release")) {
      config.security.releaseMode = true;
    }
    if (result.count("logtostdout")) {
      config.logging.logToStdout = true;
    }
    if (result.count("verbose")) {
      config.logging.verbose = result["verbose"].as<int>();
    }

    config.validate();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(ERROR, "stdout") << "Invalid configuration: " << re.what() << endl;
    exit(1);
  }

  LogHandler::configureLogging(&defaultConf, config.logging, "atserver");
  // set thread name
  el::Helpers::setThreadName("atserver-main");

  GOOGLE_PROTOBUF_VERIFY_VERSION;

  shared_ptr<CredentialCipher> cipher;
  if (!config.security.encryptionKey.empty()) {
    try {
      cipher.reset(new CredentialCipher(config.security.encryptionKey));
    } catch (const SessionError &se) {
      STFATAL << "Invalid encryption key: " << se.what();
    }
    wipeString(&config.security.encryptionKey);
  }

  shared_ptr<StoreWriter> storeWriter;
  if (!config.store.sqlitePath.empty()) {
    try {
      storeWriter.reset(new StoreWriter(
          make_shared<SqliteSessionStore>(config.store.sqlitePath)));
    } catch (const SessionError &se) {
      STFATAL << "Cannot open session store: " << se.what();
    }
  } else {
    LOG(INFO) << "No session store configured, running in memory only";
  }

  auto manager = make_shared<SessionManager>(
      config.session,
      []() -> shared_ptr<SessionTerminal> {
        return make_shared<PseudoUserTerminal>();
      },
      storeWriter, cipher);
  manager->recoverSessions();
  manager->startTimeoutChecker();

  auto authGate = make_shared<AuthGate>(config.security.apiAuthToken);
  wipeString(&config.security.apiAuthToken);
  auto rateLimiter = make_shared<RateLimiter>(
      config.security.rateLimitPerSecond, config.security.rateLimitBurst);
  rateLimiter->startPurger();

  {
    ApiServer apiServer(config, manager, authGate, rateLimiter);
    try {
      apiServer.start();
    } catch (const std::runtime_error &re) {
      STFATAL << "Cannot start API server: " << re.what();
    }
    LOG(INFO) << "atserver " << AT_VERSION << " started";

    int sig = 0;
    while (sigwait(&shutdownSignals, &sig) != 0) {
    }
    LOG(INFO) << "Received signal " << sig << ", shutting down";
    apiServer.stop();
  }

  manager->stopTimeoutChecker();
  manager->cleanupAll();
  rateLimiter->stopPurger();
  if (storeWriter) {
    storeWriter->flush();
  }
  LOG(INFO) << "Shutdown complete";

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
