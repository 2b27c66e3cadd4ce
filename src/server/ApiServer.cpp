#include "ApiServer.hpp"

#include <climits>

namespace at {
namespace {
const char* JSON_CONTENT_TYPE = "application/json";
const string SESSION_ROUTE = "/api/session/([^/]+)";
const int DEFAULT_HISTORY_LIMIT = 100;
const int MAX_HISTORY_LIMIT = 1000;

void sendJson(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(dumpJson(body), JSON_CONTENT_TYPE);
}

void sendError(httplib::Response& res, int status, const string& message) {
  sendJson(res, status, json{{"error", message}});
}

json parseBody(const httplib::Request& req) {
  json body = json::parse(req.body);
  if (!body.is_object()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "request body must be a JSON object");
  }
  return body;
}

string requireUserId(const httplib::Request& req) {
  string userId = req.get_header_value("X-User-ID");
  if (userId.empty()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "X-User-ID header is required");
  }
  return userId;
}

int64_t residentMemoryMb() {
  std::ifstream statm("/proc/self/statm");
  int64_t totalPages = 0, residentPages = 0;
  if (!(statm >> totalPages >> residentPages)) {
    return 0;
  }
  return residentPages * int64_t(sysconf(_SC_PAGESIZE)) / 1024 / 1024;
}
}  // namespace

ApiServer::ApiServer(const ServerConfig& _config,
                     shared_ptr<SessionManager> _manager,
                     shared_ptr<AuthGate> _authGate,
                     shared_ptr<RateLimiter> _rateLimiter)
    : config(_config),
      manager(_manager),
      authGate(_authGate),
      rateLimiter(_rateLimiter) {
  if (!config.security.tlsCertPath.empty()) {
    server.reset(new httplib::SSLServer(config.security.tlsCertPath.c_str(),
                                        config.security.tlsKeyPath.c_str()));
    if (!server->is_valid()) {
      throw std::runtime_error("Cannot load TLS certificate " +
                               config.security.tlsCertPath + " or key " +
                               config.security.tlsKeyPath);
    }
  } else {
    server.reset(new httplib::Server());
  }
  server->set_payload_max_length(1024 * 1024);
  registerRoutes();
}

ApiServer::~ApiServer() { stop(); }

int ApiServer::start() {
  int port = config.network.port;
  if (port == 0) {
    port = server->bind_to_any_port(config.network.host.c_str());
    if (port < 0) {
      throw std::runtime_error("Cannot bind " + config.network.host);
    }
  } else if (!server->bind_to_port(config.network.host.c_str(), port)) {
    throw std::runtime_error("Cannot bind " + config.network.host + ":" +
                             to_string(port));
  }

  serverThread = std::thread([this]() {
    el::Helpers::setThreadName("api-server");
    if (!server->listen_after_bind()) {
      LOG(ERROR) << "API server stopped listening unexpectedly";
    }
  });
  server->wait_until_ready();
  LOG(INFO) << "Listening on " << (config.security.tlsCertPath.empty() ? "http" : "https")
            << "://" << config.network.host << ":" << port;
  return port;
}

void ApiServer::stop() {
  if (server) {
    server->stop();
  }
  if (serverThread.joinable()) {
    serverThread.join();
  }
}

bool ApiServer::isRunning() { return server && server->is_running(); }

int ApiServer::httpStatusForError(ErrorCode code) {
  switch (code) {
    case ErrorCode::VALIDATION_ERROR:
      return 400;
    case ErrorCode::AUTH_FAILURE:
      return 401;
    case ErrorCode::NOT_FOUND:
      return 404;
    case ErrorCode::INVALID_STATE:
      return 409;
    case ErrorCode::LIMIT_EXCEEDED:
      return 429;
    case ErrorCode::SPAWN_FAILURE:
    case ErrorCode::WORKSPACE_ERROR:
    case ErrorCode::IO_FAILURE:
    case ErrorCode::INTERNAL_ERROR:
      return 500;
  }
  return 500;
}

json ApiServer::statusToJson(const SessionStatus& status) {
  return json{{"session_id", status.sessionId},
              {"user_id", status.userId},
              {"status", sessionStateToString(status.state)},
              {"workspace_path", status.workspacePath},
              {"last_activity", formatRfc3339(status.lastActivity)},
              {"created", formatRfc3339(status.created)},
              {"output_buffer_size", status.outputBufferLength}};
}

httplib::Server::Handler ApiServer::guarded(
    void (ApiServer::*handler)(const httplib::Request&, httplib::Response&)) {
  return [this, handler](const httplib::Request& req, httplib::Response& res) {
    try {
      (this->*handler)(req, res);
    } catch (const SessionError& se) {
      int status = httpStatusForError(se.getCode());
      if (status >= 500) {
        LOG(ERROR) << req.method << " " << req.path << " failed ("
                   << errorCodeToString(se.getCode()) << "): " << se.what();
      }
      sendError(res, status, se.what());
    } catch (const json::exception& je) {
      sendError(res, 400, string("invalid request body: ") + je.what());
    } catch (const std::exception& ex) {
      STERROR << req.method << " " << req.path << " failed: " << ex.what();
      sendError(res, 500, "internal server error");
    }
  };
}

void ApiServer::registerRoutes() {
  server->set_pre_routing_handler(
      [this](const httplib::Request& req, httplib::Response& res) {
        return preRoute(req, res);
      });
  server->set_logger([](const httplib::Request& req,
                        const httplib::Response& res) {
    LOG(INFO) << req.method << " " << req.path << " " << res.status << " "
              << req.remote_addr;
  });
  server->set_error_handler(
      [](const httplib::Request& req, httplib::Response& res) {
        if (res.body.empty()) {
          res.set_content(
              dumpJson(json{{"error", httplib::status_message(res.status)}}),
              JSON_CONTENT_TYPE);
        }
      });

  server->Get("/health", guarded(&ApiServer::handleHealth));
  server->Post("/api/session/create", guarded(&ApiServer::handleCreateSession));
  server->Post(SESSION_ROUTE + "/command",
               guarded(&ApiServer::handleSendCommand));
  server->Get(SESSION_ROUTE + "/output", guarded(&ApiServer::handleGetOutput));
  server->Get(SESSION_ROUTE + "/history",
              guarded(&ApiServer::handleGetHistory));
  server->Get(SESSION_ROUTE + "/status", guarded(&ApiServer::handleGetStatus));
  server->Post(SESSION_ROUTE + "/resize", guarded(&ApiServer::handleResize));
  server->Delete(SESSION_ROUTE, guarded(&ApiServer::handleTerminateSession));
  server->Get("/api/sessions", guarded(&ApiServer::handleListSessions));
}

httplib::Server::HandlerResponse ApiServer::preRoute(
    const httplib::Request& req, httplib::Response& res) {
  string origin = req.get_header_value("Origin");
  if (!origin.empty()) {
    const auto& allowed = config.security.corsAllowedOrigins;
    if (std::find(allowed.begin(), allowed.end(), origin) != allowed.end()) {
      res.set_header("Access-Control-Allow-Origin", origin);
      res.set_header("Vary", "Origin");
      res.set_header("Access-Control-Allow-Methods",
                     "GET, POST, DELETE, OPTIONS");
      res.set_header("Access-Control-Allow-Headers",
                     "Authorization, Content-Type, X-User-ID");
      res.set_header("Access-Control-Max-Age", "600");
    }
  }
  if (req.method == "OPTIONS") {
    res.status = 204;
    return httplib::Server::HandlerResponse::Handled;
  }

  if (rateLimiter && !rateLimiter->allow(req.remote_addr)) {
    sendError(res, 429, "rate limit exceeded");
    return httplib::Server::HandlerResponse::Handled;
  }

  if (authGate && req.path.rfind("/api/", 0) == 0) {
    try {
      authGate->check(req.get_header_value("Authorization"));
    } catch (const SessionError& se) {
      LOG(WARNING) << "Rejected unauthenticated request from "
                   << req.remote_addr << ": " << se.what();
      sendError(res, httpStatusForError(se.getCode()), se.what());
      return httplib::Server::HandlerResponse::Handled;
    }
  }
  return httplib::Server::HandlerResponse::Unhandled;
}

void ApiServer::handleHealth(const httplib::Request& req,
                             httplib::Response& res) {
  sendJson(res, 200,
           json{{"status", "healthy"},
                {"timestamp", formatRfc3339(chrono::system_clock::now())},
                {"active_sessions", manager->activeSessionCount()},
                {"memory_rss_mb", residentMemoryMb()},
                {"version", AT_VERSION}});
}

void ApiServer::handleCreateSession(const httplib::Request& req,
                                    httplib::Response& res) {
  json body = parseBody(req);
  string userId = body.value("userId", string());
  if (userId.empty()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR, "userId is required");
  }
  auto credentialsIt = body.find("credentials");
  if (credentialsIt == body.end() || !credentialsIt->is_object()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR, "credentials are required");
  }
  SessionCredentials credentials;
  credentials.set_anthropicapikey(
      credentialsIt->value("anthropicApiKey", string()));
  credentials.set_githubtoken(credentialsIt->value("githubToken", string()));
  if (credentials.anthropicapikey().empty()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "anthropicApiKey is required");
  }
  string workspaceType = body.value("workspaceType", string());

  shared_ptr<Session> session;
  try {
    session =
        manager->createSession(userId, std::move(credentials), workspaceType);
  } catch (const SessionError& se) {
    LOG(ERROR) << "Failed to create session for user " << userId << ": "
               << se.what();
    throw;
  }

  sendJson(res, 200,
           json{{"sessionId", session->getId()},
                {"status", sessionStateToString(session->getState())},
                {"workspacePath", session->getWorkspacePath()}});
}

void ApiServer::handleSendCommand(const httplib::Request& req,
                                  httplib::Response& res) {
  string sessionId = req.matches[1];
  string userId = requireUserId(req);
  json body = parseBody(req);
  auto commandIt = body.find("command");
  if (commandIt == body.end() || !commandIt->is_string() ||
      commandIt->get<string>().empty()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR, "command is required");
  }

  auto session = manager->getSessionForUser(sessionId, userId);
  session->sendCommand(commandIt->get<string>());
  sendJson(res, 200, json{{"success", true}});
}

void ApiServer::handleGetOutput(const httplib::Request& req,
                                httplib::Response& res) {
  string sessionId = req.matches[1];
  string userId = requireUserId(req);
  bool clear = req.get_param_value("clear") == "true";

  auto session = manager->getSessionForUser(sessionId, userId);
  json output = json::array();
  for (const auto& chunk : session->getOutput(clear)) {
    output.push_back(json{{"timestamp", formatRfc3339(chunk.timestamp)},
                          {"data", chunk.data}});
  }
  sendJson(res, 200,
           json{{"sessionId", sessionId},
                {"output", output},
                {"status", sessionStateToString(session->getState())}});
}

void ApiServer::handleGetHistory(const httplib::Request& req,
                                 httplib::Response& res) {
  string sessionId = req.matches[1];
  string userId = requireUserId(req);
  int limit = DEFAULT_HISTORY_LIMIT;
  if (req.has_param("limit")) {
    try {
      limit = stoi(req.get_param_value("limit"));
    } catch (const std::logic_error&) {
      throw SessionError(ErrorCode::VALIDATION_ERROR,
                         "limit must be an integer");
    }
    if (limit < 1 || limit > MAX_HISTORY_LIMIT) {
      throw SessionError(ErrorCode::VALIDATION_ERROR,
                         "limit must be between 1 and " +
                             to_string(MAX_HISTORY_LIMIT));
    }
  }

  json output = json::array();
  for (const auto& chunk :
       manager->getOutputHistory(sessionId, userId, limit)) {
    output.push_back(
        json{{"id", chunk.id()},
             {"timestamp", formatRfc3339(fromEpochMillis(chunk.timestampms()))},
             {"data", chunk.data()}});
  }
  sendJson(res, 200, json{{"sessionId", sessionId}, {"output", output}});
}

void ApiServer::handleGetStatus(const httplib::Request& req,
                                httplib::Response& res) {
  string sessionId = req.matches[1];
  string userId = requireUserId(req);
  auto session = manager->getSessionForUser(sessionId, userId);
  sendJson(res, 200, statusToJson(session->getStatus()));
}

void ApiServer::handleResize(const httplib::Request& req,
                             httplib::Response& res) {
  string sessionId = req.matches[1];
  string userId = requireUserId(req);
  json body = parseBody(req);
  if (!body.contains("cols") || !body.contains("rows") ||
      !body["cols"].is_number_integer() || !body["rows"].is_number_integer()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "cols and rows are required integers");
  }
  // Out of range values are clamped so Session::resize rejects them after
  // the ownership and state checks.
  auto toGeometry = [](int64_t value) {
    return int(std::max<int64_t>(0, std::min<int64_t>(INT_MAX, value)));
  };
  int cols = toGeometry(body["cols"].get<int64_t>());
  int rows = toGeometry(body["rows"].get<int64_t>());

  auto session = manager->getSessionForUser(sessionId, userId);
  session->resize(cols, rows);
  sendJson(res, 200, json{{"success", true}});
}

void ApiServer::handleTerminateSession(const httplib::Request& req,
                                       httplib::Response& res) {
  string sessionId = req.matches[1];
  string userId = requireUserId(req);
  manager->terminateSessionForUser(sessionId, userId);
  sendJson(res, 200,
           json{{"success", true},
                {"message", "session terminated successfully"}});
}

void ApiServer::handleListSessions(const httplib::Request& req,
                                   httplib::Response& res) {
  string userId = requireUserId(req);
  json sessions = json::array();
  for (const auto& status : manager->listSessionsForUser(userId)) {
    sessions.push_back(statusToJson(status));
  }
  sendJson(res, 200, json{{"sessions", sessions}});
}
}  // namespace at
