#ifndef __AT_SERVER_CONFIG__
#define __AT_SERVER_CONFIG__

#include "Headers.hpp"

namespace at {
const string WORKSPACE_ISOLATED = "isolated";
const string WORKSPACE_PERSISTENT = "persistent";

/**
 * @brief Settings that govern session creation, quotas and eviction.
 */
struct SessionConfig {
  int maxPerUser = 3;
  int timeoutMinutes = 30;
  int outputBufferSize = 100;
  string workspaceBasePath = "/tmp/agentterminal-sessions";
  string workspaceType = WORKSPACE_ISOLATED;
  string agentCommand = "claude";
  vector<string> agentArgs;
  chrono::milliseconds killGracePeriod = chrono::milliseconds(2000);
  size_t maxCommandLength = 16384;
  chrono::milliseconds commandInterval = chrono::milliseconds(100);
  chrono::milliseconds sweepInterval = chrono::seconds(60);
};

struct NetworkConfig {
  string host = "localhost";
  int port = 3000;
};

struct SecurityConfig {
  /** @brief 64 hex chars.  Empty means credentials are never persisted. */
  string encryptionKey;
  /** @brief Bearer token.  Empty means authentication is disabled. */
  string apiAuthToken;
  vector<string> corsAllowedOrigins = {"http://localhost"};
  string tlsCertPath;
  string tlsKeyPath;
  bool releaseMode = false;
  double rateLimitPerSecond = 10.0;
  int rateLimitBurst = 20;
};

struct StoreConfig {
  /** @brief Path of the SQLite database.  Empty disables persistence. */
  string sqlitePath;
};

struct LoggingConfig {
  int verbose = 0;
  bool silent = false;
  bool logToStdout = false;
  // only applies when not logging to stdout
  bool redirectStderr = true;
  string logDirectory = GetTempDirectory() + "atserver";
  // default max log file size is 20MB
  string maxLogSize = "20971520";
};

/**
 * @brief Complete server configuration assembled from defaults, an INI
 * file, the environment and the command line, in that order.
 */
class ServerConfig {
 public:
  SessionConfig session;
  NetworkConfig network;
  SecurityConfig security;
  StoreConfig store;
  LoggingConfig logging;

  /**
   * @brief Overlays values found in an INI file onto the current settings.
   * @throws std::runtime_error if the file cannot be parsed or a value is
   * malformed.
   */
  void loadIniFile(const string& path);

  /**
   * @brief Reads secrets from the environment and removes them from it so
   * child processes never inherit them.
   */
  void applyEnvironment();

  /**
   * @brief Checks the assembled configuration for consistency.
   * @throws std::runtime_error describing the first problem found.
   */
  void validate() const;

  /** @brief Splits a comma separated list, trimming each entry. */
  static vector<string> parseList(const string& value);
};
}  // namespace at

#endif  // __AT_SERVER_CONFIG__
