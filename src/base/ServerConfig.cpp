#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace at {
namespace {
int parseInt(const char* section, const char* key, const char* value) {
  try {
    size_t consumed = 0;
    int retval = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return retval;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid integer for [") + section + "] " +
                             key + ": " + value);
  }
}

bool parseBool(const char* value) {
  string s(value);
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  return s == "1" || s == "true" || s == "yes" || s == "on";
}
}  // namespace

vector<string> ServerConfig::parseList(const string& value) {
  vector<string> retval;
  for (const auto& item : split(value, ',')) {
    string trimmed = trim(item);
    if (!trimmed.empty()) {
      retval.push_back(trimmed);
    }
  }
  return retval;
}

void ServerConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char* value = NULL;

  if ((value = ini.GetValue("Networking", "host", NULL))) {
    network.host = value;
  }
  if ((value = ini.GetValue("Networking", "port", NULL))) {
    network.port = parseInt("Networking", "port", value);
  }

  if ((value = ini.GetValue("Session", "timeout_minutes", NULL))) {
    session.timeoutMinutes = parseInt("Session", "timeout_minutes", value);
  }
  if ((value = ini.GetValue("Session", "max_per_user", NULL))) {
    session.maxPerUser = parseInt("Session", "max_per_user", value);
  }
  if ((value = ini.GetValue("Session", "output_buffer_size", NULL))) {
    session.outputBufferSize =
        parseInt("Session", "output_buffer_size", value);
  }
  if ((value = ini.GetValue("Session", "agent_command", NULL))) {
    session.agentCommand = value;
  }
  if ((value = ini.GetValue("Session", "agent_args", NULL))) {
    session.agentArgs.clear();
    for (const auto& arg : split(value, ' ')) {
      if (!arg.empty()) {
        session.agentArgs.push_back(arg);
      }
    }
  }
  if ((value = ini.GetValue("Session", "kill_grace_ms", NULL))) {
    session.killGracePeriod =
        chrono::milliseconds(parseInt("Session", "kill_grace_ms", value));
  }
  if ((value = ini.GetValue("Session", "max_command_length", NULL))) {
    session.maxCommandLength =
        size_t(parseInt("Session", "max_command_length", value));
  }
  if ((value = ini.GetValue("Session", "command_interval_ms", NULL))) {
    session.commandInterval =
        chrono::milliseconds(parseInt("Session", "command_interval_ms", value));
  }
  if ((value = ini.GetValue("Session", "sweep_interval_seconds", NULL))) {
    session.sweepInterval =
        chrono::seconds(parseInt("Session", "sweep_interval_seconds", value));
  }

  if ((value = ini.GetValue("Workspace", "base_path", NULL))) {
    session.workspaceBasePath = value;
  }
  if ((value = ini.GetValue("Workspace", "type", NULL))) {
    session.workspaceType = value;
  }

  if ((value = ini.GetValue("Security", "encryption_key", NULL))) {
    security.encryptionKey = value;
  }
  if ((value = ini.GetValue("Security", "api_auth_token", NULL))) {
    security.apiAuthToken = value;
  }
  if ((value = ini.GetValue("Security", "cors_allowed_origins", NULL))) {
    security.corsAllowedOrigins = parseList(value);
  }
  if ((value = ini.GetValue("Security", "tls_cert_path", NULL))) {
    security.tlsCertPath = value;
  }
  if ((value = ini.GetValue("Security", "tls_key_path", NULL))) {
    security.tlsKeyPath = value;
  }
  if ((value = ini.GetValue("Security", "release_mode", NULL))) {
    security.releaseMode = parseBool(value);
  }
  if ((value = ini.GetValue("Security", "rate_limit_per_second", NULL))) {
    security.rateLimitPerSecond =
        double(parseInt("Security", "rate_limit_per_second", value));
  }
  if ((value = ini.GetValue("Security", "rate_limit_burst", NULL))) {
    security.rateLimitBurst = parseInt("Security", "rate_limit_burst", value);
  }

  if ((value = ini.GetValue("Store", "sqlite_path", NULL))) {
    store.sqlitePath = value;
  }

  if ((value = ini.GetValue("Debug", "verbose", NULL))) {
    logging.verbose = parseInt("Debug", "verbose", value);
  }
  // read silent setting
  if ((value = ini.GetValue("Debug", "silent", NULL))) {
    logging.silent = atoi(value) != 0;
  }
  // read log file size limit
  if ((value = ini.GetValue("Debug", "logsize", NULL)) && atoi(value) != 0) {
    // make sure maxlogsize is a string of int value
    logging.maxLogSize = to_string(atoi(value));
  }
  if ((value = ini.GetValue("Debug", "logdir", NULL))) {
    logging.logDirectory = value;
  }
}

void ServerConfig::applyEnvironment() {
  const char* value = ::getenv(ENCRYPTION_KEY_ENV.c_str());
  if (value) {
    security.encryptionKey = value;
    ::unsetenv(ENCRYPTION_KEY_ENV.c_str());
  }
  value = ::getenv(API_AUTH_TOKEN_ENV.c_str());
  if (value) {
    security.apiAuthToken = value;
    ::unsetenv(API_AUTH_TOKEN_ENV.c_str());
  }
}

void ServerConfig::validate() const {
  if (network.port <= 0 || network.port > 65535) {
    throw std::runtime_error("Port must be between 1 and 65535");
  }
  if (network.host.empty()) {
    throw std::runtime_error("Host must not be empty");
  }
  if (session.maxPerUser <= 0) {
    throw std::runtime_error("max_per_user must be positive");
  }
  if (session.timeoutMinutes <= 0) {
    throw std::runtime_error("timeout_minutes must be positive");
  }
  if (session.maxCommandLength == 0) {
    throw std::runtime_error("max_command_length must be positive");
  }
  if (session.commandInterval.count() < 0 ||
      session.killGracePeriod.count() < 0) {
    throw std::runtime_error("Intervals must not be negative");
  }
  if (session.sweepInterval.count() <= 0) {
    throw std::runtime_error("sweep_interval_seconds must be positive");
  }
  if (session.workspaceBasePath.empty() ||
      !fs::path(session.workspaceBasePath).is_absolute()) {
    throw std::runtime_error("Workspace base_path must be an absolute path");
  }
  if (session.workspaceType != WORKSPACE_ISOLATED &&
      session.workspaceType != WORKSPACE_PERSISTENT) {
    throw std::runtime_error("Workspace type must be '" + WORKSPACE_ISOLATED +
                             "' or '" + WORKSPACE_PERSISTENT + "'");
  }
  if (session.agentCommand.empty()) {
    throw std::runtime_error("agent_command must not be empty");
  }
  if (!security.encryptionKey.empty() &&
      security.encryptionKey.length() != crypto_secretbox_KEYBYTES * 2) {
    throw std::runtime_error("encryption_key must be " +
                             to_string(crypto_secretbox_KEYBYTES * 2) +
                             " hex characters");
  }
  if (security.tlsCertPath.empty() != security.tlsKeyPath.empty()) {
    throw std::runtime_error(
        "tls_cert_path and tls_key_path must be set together");
  }
  if (security.releaseMode && security.apiAuthToken.empty()) {
    throw std::runtime_error("An API auth token is required in release mode (" +
                             API_AUTH_TOKEN_ENV + ")");
  }
  if (security.rateLimitPerSecond <= 0 || security.rateLimitBurst <= 0) {
    throw std::runtime_error("Rate limits must be positive");
  }
}
}  // namespace at
